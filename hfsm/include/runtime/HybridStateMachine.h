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

#include "actions/ActionStorage.h"
#include "runtime/StateMachine.h"
#include "timing/Timer.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace HFSM {

/**
 * @brief Nested state machine with its own lifecycle hooks, timer and actions
 *
 * A plain StateMachine only forwards to its active child. A hybrid machine
 * also behaves like a state: code shared by every child (an "is grounded"
 * check for all movement states, a guard's alert level) goes into its hooks
 * instead of being duplicated in each child.
 *
 * Hook order:
 * - enter: beforeOnEnter, child machine enters, timer reset, afterOnEnter
 * - logic: beforeOnLogic, child logic and transitions, afterOnLogic
 * - exit:  beforeOnExit, active child exits, afterOnExit
 *
 * Actions registered here run before the action of the active child.
 *
 * @code
 * HybridStateMachine<> movement({
 *     .beforeOnLogic = [&](auto &, double) { grounded = probeGround(); },
 * });
 * movement.addState("Walk").addState("Run");
 * movement.addAction("jump", [&] { jumpRequested = true; });
 * @endcode
 */
template <typename TOwnId = std::string, typename TStateId = TOwnId, typename TEvent = std::string>
class HybridStateMachine : public StateMachine<TOwnId, TStateId, TEvent> {
public:
    using Base = StateMachine<TOwnId, TStateId, TEvent>;
    using Hook = std::function<void(HybridStateMachine &)>;
    using LogicHook = std::function<void(HybridStateMachine &, double)>;

    /**
     * @brief Optional hooks; empty members are skipped
     */
    struct Hooks {
        Hook beforeOnEnter;
        Hook afterOnEnter;
        LogicHook beforeOnLogic;
        LogicHook afterOnLogic;
        Hook beforeOnExit;
        Hook afterOnExit;
    };

    HybridStateMachine() = default;

    explicit HybridStateMachine(Hooks hooks, bool needsExitTime = false, bool isGhostState = false,
                                bool rememberLastState = false)
        : Base(needsExitTime, isGhostState, rememberLastState), hooks_(std::move(hooks)) {}

    void onEnter() override {
        auto guard = this->guardProcessing();
        if (hooks_.beforeOnEnter) {
            hooks_.beforeOnEnter(*this);
        }
        Base::onEnter();
        timer_.reset();
        if (hooks_.afterOnEnter) {
            hooks_.afterOnEnter(*this);
        }
    }

    void onLogic(double delta) override {
        this->ensureRunning("onLogic");
        auto guard = this->guardProcessing();
        if (hooks_.beforeOnLogic) {
            hooks_.beforeOnLogic(*this, delta);
        }
        Base::onLogic(delta);
        if (hooks_.afterOnLogic) {
            hooks_.afterOnLogic(*this, delta);
        }
    }

    void onExit() override {
        auto guard = this->guardProcessing();
        if (hooks_.beforeOnExit) {
            hooks_.beforeOnExit(*this);
        }
        Base::onExit();
        if (hooks_.afterOnExit) {
            hooks_.afterOnExit(*this);
        }
    }

    /**
     * @brief Register an action of this machine itself
     * @return Itself
     */
    HybridStateMachine &addAction(const TEvent &trigger, std::function<void()> action) {
        ensureActionStorage().addAction(trigger, std::move(action));
        return *this;
    }

    template <typename TData>
    HybridStateMachine &addAction(const TEvent &trigger, std::function<void(const TData &)> action) {
        ensureActionStorage().template addAction<TData>(trigger, std::move(action));
        return *this;
    }

    /**
     * @brief Time since this machine was last entered
     */
    const Timer &getTimer() const {
        return timer_;
    }

protected:
    void handleAction(const TEvent &action, const ActionArgument *argument) override {
        this->ensureRunning("onAction");
        auto guard = this->guardProcessing();

        if (actionStorage_) {
            if (argument) {
                actionStorage_->runAction(action, *argument);
            } else {
                actionStorage_->runAction(action);
            }
        }
        Base::handleAction(action, argument);
    }

private:
    ActionStorage<TEvent> &ensureActionStorage() {
        if (!actionStorage_) {
            actionStorage_ = std::make_unique<ActionStorage<TEvent>>();
        }
        return *actionStorage_;
    }

    Hooks hooks_;
    Timer timer_;
    std::unique_ptr<ActionStorage<TEvent>> actionStorage_;
};

}  // namespace HFSM
