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
#include "states/StateBase.h"
#include "timing/Timer.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace HFSM {

/**
 * @brief Leaf state driven by user callbacks
 *
 * @code
 * fsm.addState("Attack", std::make_unique<State<>>(
 *     State<>::Callbacks{
 *         .onEnter = [](State<> &) { weapon.draw(); },
 *         .onLogic = [](State<> &s, double) { swing(s.getTimer().getElapsed()); },
 *         .canExit = [](State<> &s) { return s.getTimer().isElapsedAtLeast(0.4); },
 *     },
 *     true));  // needsExitTime: finish the swing before leaving
 * @endcode
 *
 * With needsExitTime and a canExit callback, the state grants a pending exit
 * on the request itself or on a later tick, whichever is the first where
 * canExit returns true. Without canExit the callbacks must call
 * getFsm()->stateCanExit() themselves.
 */
template <typename TOwnId = std::string, typename TEvent = std::string>
class State : public StateBase<TOwnId, TEvent> {
public:
    using Callback = std::function<void(State &)>;
    using LogicCallback = std::function<void(State &, double)>;
    using ExitCondition = std::function<bool(State &)>;

    struct Callbacks {
        Callback onEnter;
        LogicCallback onLogic;
        Callback onExit;
        ExitCondition canExit;
    };

    State() : StateBase<TOwnId, TEvent>(false, false) {}

    explicit State(Callbacks callbacks, bool needsExitTime = false, bool isGhostState = false)
        : StateBase<TOwnId, TEvent>(needsExitTime, isGhostState), callbacks_(std::move(callbacks)) {}

    void onEnter() override {
        timer_.reset();
        if (callbacks_.onEnter) {
            callbacks_.onEnter(*this);
        }
    }

    void onLogic(double delta) override {
        if (callbacks_.onLogic) {
            callbacks_.onLogic(*this, delta);
        }

        // The logic callback may already have granted the exit
        IStateMachine *fsm = this->getFsm();
        if (this->needsExitTime() && callbacks_.canExit && fsm && fsm->hasPendingTransition() &&
            callbacks_.canExit(*this)) {
            fsm->stateCanExit();
        }
    }

    void onExit() override {
        if (callbacks_.onExit) {
            callbacks_.onExit(*this);
        }
    }

    void onExitRequest() override {
        IStateMachine *fsm = this->getFsm();
        if (callbacks_.canExit && fsm && callbacks_.canExit(*this)) {
            fsm->stateCanExit();
        }
    }

    /**
     * @brief Register an action run by onAction(trigger)
     * @return Itself
     */
    State &addAction(const TEvent &trigger, std::function<void()> action) {
        ensureActionStorage().addAction(trigger, std::move(action));
        return *this;
    }

    /**
     * @brief Register an action run by onAction(trigger, data) with data of type TData
     * @return Itself
     */
    template <typename TData> State &addAction(const TEvent &trigger, std::function<void(const TData &)> action) {
        ensureActionStorage().template addAction<TData>(trigger, std::move(action));
        return *this;
    }

    Timer &getTimer() {
        return timer_;
    }

    const Timer &getTimer() const {
        return timer_;
    }

protected:
    void handleAction(const TEvent &trigger, const ActionArgument *argument) override {
        if (!actionStorage_) {
            return;
        }
        if (argument) {
            actionStorage_->runAction(trigger, *argument);
        } else {
            actionStorage_->runAction(trigger);
        }
    }

private:
    ActionStorage<TEvent> &ensureActionStorage() {
        if (!actionStorage_) {
            actionStorage_ = std::make_unique<ActionStorage<TEvent>>();
        }
        return *actionStorage_;
    }

    Callbacks callbacks_;
    Timer timer_;
    std::unique_ptr<ActionStorage<TEvent>> actionStorage_;  // Created by the first addAction
};

}  // namespace HFSM
