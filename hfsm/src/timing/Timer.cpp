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

#include "timing/Timer.h"
#include "timing/Clock.h"

#include <algorithm>

namespace HFSM {

Timer::Timer() : startTime_(Clock::now()) {}

void Timer::reset() {
    startTime_ = Clock::now();
}

double Timer::getElapsed() const {
    // An injected source swapped after reset() may report an earlier time
    return std::max(0.0, Clock::now() - startTime_);
}

}  // namespace HFSM
