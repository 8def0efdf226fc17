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

#include <cstddef>

namespace HFSM {

/**
 * @brief RAII marker for "this machine is inside a lifecycle call"
 *
 * Set while onEnter/onLogic/onExit/onAction/trigger run so that structural
 * changes (addState, addTransition, ...) made from callbacks can be rejected.
 * The previous value is restored on scope exit, also when an exception
 * propagates, so nested calls on the same machine unwind correctly.
 *
 * @code
 * {
 *     ProcessingGuard guard(processing_);
 *     activeState_->onLogic(delta);
 * }  // processing_ restored
 * @endcode
 */
class ProcessingGuard {
public:
    explicit ProcessingGuard(bool &flag) : flag_(flag), previous_(flag) {
        flag_ = true;
    }

    ~ProcessingGuard() noexcept {
        flag_ = previous_;
    }

    // Non-copyable, non-movable (RAII idiom)
    ProcessingGuard(const ProcessingGuard &) = delete;
    ProcessingGuard &operator=(const ProcessingGuard &) = delete;
    ProcessingGuard(ProcessingGuard &&) = delete;
    ProcessingGuard &operator=(ProcessingGuard &&) = delete;

private:
    bool &flag_;
    bool previous_;
};

/**
 * @brief RAII depth counter for recursive ghost-state chaining
 */
class ChainDepthGuard {
public:
    explicit ChainDepthGuard(size_t &depth) : depth_(depth) {
        ++depth_;
    }

    ~ChainDepthGuard() noexcept {
        --depth_;
    }

    ChainDepthGuard(const ChainDepthGuard &) = delete;
    ChainDepthGuard &operator=(const ChainDepthGuard &) = delete;
    ChainDepthGuard(ChainDepthGuard &&) = delete;
    ChainDepthGuard &operator=(ChainDepthGuard &&) = delete;

private:
    size_t &depth_;
};

}  // namespace HFSM
