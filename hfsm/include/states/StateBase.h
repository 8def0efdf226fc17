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

#include "actions/ActionArgument.h"
#include "common/IdentifierFormat.h"
#include "common/StateMachineException.h"
#include "states/IStateMachine.h"
#include <optional>
#include <string>

namespace HFSM {

/**
 * @brief Lifecycle contract of every state, leaf or nested machine
 *
 * Lifecycle driven by the owning machine:
 * - attach() + init(): once, when added to a machine
 * - onEnter(): once per activation
 * - onLogic(delta): every tick while active
 * - onExitRequest(): a transition wants to leave but the state needs exit time
 * - onExit(): once per deactivation
 *
 * A state with needsExitTime stays active after a transition fired until it
 * calls getFsm()->stateCanExit(). A ghost state is passed through: its
 * outgoing transitions are evaluated right after it is entered.
 *
 * @tparam TOwnId Identifier type under which the parent knows this state
 * @tparam TEvent Action and trigger identifier type
 */
template <typename TOwnId = std::string, typename TEvent = std::string> class StateBase {
public:
    explicit StateBase(bool needsExitTime, bool isGhostState = false)
        : needsExitTime_(needsExitTime), isGhostState_(isGhostState) {}

    virtual ~StateBase() = default;

    StateBase(const StateBase &) = delete;
    StateBase &operator=(const StateBase &) = delete;

    bool needsExitTime() const {
        return needsExitTime_;
    }

    bool isGhostState() const {
        return isGhostState_;
    }

    bool hasName() const {
        return name_.has_value();
    }

    /**
     * @throws StateMachineStateException if the state was never added to a machine
     */
    const TOwnId &getName() const {
        if (!name_.has_value()) {
            throw StateMachineStateException("State has no name; it was not added to a state machine");
        }
        return *name_;
    }

    IStateMachine *getFsm() const {
        return fsm_;
    }

    /**
     * @brief Bind to the owning machine; called by StateMachine::addState
     */
    void attach(const TOwnId &name, IStateMachine *fsm) {
        name_ = name;
        fsm_ = fsm;
    }

    virtual void init() {}
    virtual void onEnter() {}
    virtual void onLogic([[maybe_unused]] double delta) {}
    virtual void onExit() {}

    /**
     * @brief A transition away from this state is waiting for exit permission
     */
    virtual void onExitRequest() {}

    /**
     * @brief Trigger event forwarded from the parent; nested machines evaluate their trigger transitions
     */
    virtual void trigger([[maybe_unused]] const TEvent &event) {}

    void onAction(const TEvent &trigger) {
        handleAction(trigger, nullptr);
    }

    void onAction(const TEvent &trigger, const ActionArgument &argument) {
        handleAction(trigger, &argument);
    }

    template <typename TData> void onAction(const TEvent &trigger, const TData &data) {
        ActionArgument argument = ActionArgument::of(data);
        handleAction(trigger, &argument);
    }

protected:
    /**
     * @brief Action dispatch hook
     * @param argument nullptr for actions run without data
     */
    virtual void handleAction([[maybe_unused]] const TEvent &trigger,
                              [[maybe_unused]] const ActionArgument *argument) {}

    std::string describe() const {
        return name_.has_value() ? formatIdentifier(*name_) : "<root>";
    }

private:
    bool needsExitTime_;
    bool isGhostState_;
    std::optional<TOwnId> name_;
    IStateMachine *fsm_ = nullptr;
};

}  // namespace HFSM
