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

#pragma once

#include "timing/ITimeSource.h"
#include <memory>

namespace HFSM {

/**
 * @brief Process-wide access point to the injected time source
 *
 * Works like Logger: a SteadyTimeSource is created on first use unless the
 * host installed its own source with setSource(). Install the source before
 * creating timers; timers created earlier keep their old baseline.
 *
 * @code
 * HFSM::Clock::setSource(std::make_unique<EngineTickSource>(engine));
 * @endcode
 */
class Clock {
public:
    /**
     * @brief Replace the active time source (ownership transferred)
     */
    static void setSource(std::unique_ptr<ITimeSource> source);

    /**
     * @brief Drop an injected source; the next now() falls back to steady_clock
     */
    static void resetSource();

    /**
     * @brief Current time in seconds from the active source
     */
    static double now();

private:
    static std::unique_ptr<ITimeSource> source_;
};

}  // namespace HFSM
