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

#include "common/IdentifierFormat.h"
#include "common/StateMachineException.h"
#include "states/IStateMachine.h"
#include <optional>
#include <string>
#include <utility>

namespace HFSM {

/**
 * @brief Directed edge between two states of one machine
 *
 * A transition is owned by the machine it was added to and evaluated by it:
 * once per logic tick for regular transitions, once per matching trigger
 * event for trigger transitions, and while the parent waits for an exit for
 * exit transitions.
 *
 * - from: source state, or std::nullopt for "any state"
 * - to: target state, or std::nullopt for an exit transition (leaves the machine)
 * - forceInstantly: switch even if the active state needs exit time
 *
 * Subclasses override shouldTransition() and, when they keep per-activation
 * state (timers, edge detectors), onEnter().
 *
 * @tparam TStateId State identifier type of the owning machine
 */
template <typename TStateId = std::string> class TransitionBase {
public:
    TransitionBase(std::optional<TStateId> from, std::optional<TStateId> to, bool forceInstantly = false)
        : from_(std::move(from)), to_(std::move(to)), forceInstantly_(forceInstantly) {}

    virtual ~TransitionBase() = default;

    TransitionBase(const TransitionBase &) = delete;
    TransitionBase &operator=(const TransitionBase &) = delete;

    const std::optional<TStateId> &getFrom() const {
        return from_;
    }

    bool isFromAny() const {
        return !from_.has_value();
    }

    bool hasTarget() const {
        return to_.has_value();
    }

    /**
     * @brief Target state id
     * @throws ConfigurationException for exit transitions, which have no target
     */
    const TStateId &getTo() const {
        if (!to_.has_value()) {
            throw ConfigurationException("Transition from " + describeFrom() + " has no target state");
        }
        return *to_;
    }

    bool isForceInstantly() const {
        return forceInstantly_;
    }

    IStateMachine *getFsm() const {
        return fsm_;
    }

    /**
     * @brief Bind to the owning machine; called when the transition is added
     */
    void attach(IStateMachine *fsm) {
        fsm_ = fsm;
    }

    /**
     * @brief Mark as "any state" source; used by addTransitionFromAny
     */
    void makeFromAny() {
        from_.reset();
    }

    /**
     * @brief Called once, after the transition was added to its machine
     */
    virtual void init() {}

    /**
     * @brief Called each time the source state becomes active
     */
    virtual void onEnter() {}

    virtual bool shouldTransition() {
        return true;
    }

    /**
     * @brief Called right before the source state exits because of this transition
     */
    virtual void beforeTransition() {}

    /**
     * @brief Called right after the target state entered because of this transition
     */
    virtual void afterTransition() {}

    std::string describeFrom() const {
        return from_.has_value() ? formatIdentifier(*from_) : "<any>";
    }

    std::string describeTo() const {
        return to_.has_value() ? formatIdentifier(*to_) : "<exit>";
    }

private:
    std::optional<TStateId> from_;
    std::optional<TStateId> to_;
    bool forceInstantly_;
    IStateMachine *fsm_ = nullptr;
};

}  // namespace HFSM
