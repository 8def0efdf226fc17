// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-HFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of HFSM (Hierarchical Finite State Machine Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#include "timing/Clock.h"

#include <chrono>
#include <mutex>

namespace HFSM {

std::unique_ptr<ITimeSource> Clock::source_;

static std::mutex source_mutex;

double SteadyTimeSource::now() const {
    auto sinceEpoch = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(sinceEpoch).count();
}

void Clock::setSource(std::unique_ptr<ITimeSource> source) {
    std::lock_guard<std::mutex> lock(source_mutex);
    source_ = std::move(source);
}

void Clock::resetSource() {
    std::lock_guard<std::mutex> lock(source_mutex);
    source_.reset();
}

double Clock::now() {
    std::lock_guard<std::mutex> lock(source_mutex);
    if (!source_) {
        source_ = std::make_unique<SteadyTimeSource>();
    }
    return source_->now();
}

}  // namespace HFSM
