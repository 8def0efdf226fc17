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
 * @brief Parent-side protocol seen by a child state
 *
 * Independent of identifier types, so a child of any StateMachine
 * instantiation can negotiate its exit with its parent.
 */
class IStateMachine {
public:
    virtual ~IStateMachine() = default;

    /**
     * @brief Grant the pending exit request of the active child
     *
     * Completes the deferred transition (or the deferred exit of this machine
     * from its own parent).
     *
     * @throws StateMachineStateException if nothing is pending
     */
    virtual void stateCanExit() = 0;

    /**
     * @brief Whether a transition waits for the active child to grant exit
     */
    virtual bool hasPendingTransition() const = 0;

    /**
     * @brief Machine this machine is nested in, nullptr for a root machine
     */
    virtual IStateMachine *getParentFsm() const = 0;
};

}  // namespace HFSM
