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

namespace HFSM {

/**
 * @brief Measures time since construction or the last reset()
 *
 * Plain value type; the baseline comes from Clock::now(). States reset their
 * timer on every enter so elapsed time never spans two activations.
 */
class Timer {
public:
    Timer();

    /**
     * @brief Take the current time as the new baseline
     */
    void reset();

    /**
     * @brief Seconds since the baseline, never negative
     */
    double getElapsed() const;

    double getStartTime() const {
        return startTime_;
    }

    bool isElapsedGreaterThan(double duration) const {
        return getElapsed() > duration;
    }

    bool isElapsedLessThan(double duration) const {
        return getElapsed() < duration;
    }

    bool isElapsedAtLeast(double duration) const {
        return getElapsed() >= duration;
    }

    bool isElapsedAtMost(double duration) const {
        return getElapsed() <= duration;
    }

private:
    double startTime_;
};

}  // namespace HFSM
