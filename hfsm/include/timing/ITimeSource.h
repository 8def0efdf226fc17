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
 * @brief Monotonic time source sampled by Timer
 *
 * The host supplies the clock its frame loop runs on (engine ticks, a
 * simulation clock, a fake clock in tests). Values must never decrease.
 */
class ITimeSource {
public:
    virtual ~ITimeSource() = default;

    /**
     * @brief Current time in seconds since an arbitrary fixed epoch
     */
    virtual double now() const = 0;
};

/**
 * @brief Default time source backed by std::chrono::steady_clock
 */
class SteadyTimeSource : public ITimeSource {
public:
    double now() const override;
};

}  // namespace HFSM
