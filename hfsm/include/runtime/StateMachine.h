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

#include "common/Constants.h"
#include "common/IdentifierFormat.h"
#include "common/Logger.h"
#include "common/StateMachineException.h"
#include "runtime/ProcessingGuard.h"
#include "states/IStateMachine.h"
#include "states/State.h"
#include "states/StateBase.h"
#include "transitions/TransitionBase.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HFSM {

/**
 * @brief Hierarchical finite state machine
 *
 * Owns a set of child states keyed by TStateId and the transitions between
 * them, keeps exactly one child active while running, and is itself a state
 * so machines nest into machines.
 *
 * Typical setup of a root machine:
 * @code
 * StateMachine<> fsm;
 * fsm.addState("Idle")
 *     .addState("Walk", std::make_unique<WalkState>())
 *     .addTransition(std::make_unique<Transition<>>("Idle", "Walk", [&](auto &) { return input.moving(); }))
 *     .addTransition(std::make_unique<Transition<>>("Walk", "Idle", [&](auto &) { return !input.moving(); }));
 * fsm.init();            // validates and enters the start state
 * fsm.onLogic(delta);    // once per frame
 * @endcode
 *
 * Tick algorithm (onLogic):
 * 1. Run the active child's onLogic.
 * 2. Unless the child already completed a switch during step 1, evaluate the
 *    any-state transitions, then the active state's transitions, in
 *    registration order. The first passing one fires; nothing else is
 *    evaluated this tick.
 * 3. If the active state needs exit time and the transition is not forced,
 *    the switch is recorded as pending and the state gets onExitRequest();
 *    it completes when the state calls stateCanExit().
 * 4. Entering a ghost state evaluates its transitions immediately, bounded
 *    by setMaxGhostChainLength().
 *
 * Not thread-safe; one machine is driven by one thread.
 *
 * @tparam TOwnId Identifier this machine has inside its parent
 * @tparam TStateId Identifier of the child states
 * @tparam TEvent Identifier of actions and trigger events
 */
template <typename TOwnId = std::string, typename TStateId = TOwnId, typename TEvent = std::string>
class StateMachine : public StateBase<TOwnId, TEvent>, public IStateMachine {
public:
    using ChildState = StateBase<TStateId, TEvent>;
    using ChildTransition = TransitionBase<TStateId>;
    using LeafState = State<TStateId, TEvent>;

    /**
     * @param needsExitTime (nested machines) wait for an exit transition or requestExit() before leaving
     * @param isGhostState (nested machines) pass-through state of the parent
     * @param rememberLastState re-entering resumes the child that was active at the last exit
     */
    explicit StateMachine(bool needsExitTime = false, bool isGhostState = false, bool rememberLastState = false)
        : StateBase<TOwnId, TEvent>(needsExitTime, isGhostState), rememberLastState_(rememberLastState) {}

    // ------------------------------------------------------------------
    // Configuration (fluent)
    // ------------------------------------------------------------------

    /**
     * @brief Add a child state; the first state added becomes the start state
     * @throws ConfigurationException on duplicate name or null state
     */
    StateMachine &addState(const TStateId &name, std::unique_ptr<ChildState> state) {
        ensureNotProcessing("addState");
        if (!state) {
            LOG_ERROR("Machine {}: null state passed for {}", this->describe(), formatIdentifier(name));
            throw ConfigurationException("Null state passed to addState for " + formatIdentifier(name));
        }

        StateBundle &bundle = bundles_[name];
        if (bundle.state) {
            LOG_ERROR("Machine {}: duplicate state {}", this->describe(), formatIdentifier(name));
            throw ConfigurationException("State " + formatIdentifier(name) + " is already registered");
        }

        state->attach(name, this);
        bundle.state = std::move(state);
        bundle.state->init();

        if (!startState_.has_value()) {
            startState_ = name;
        }
        validated_ = false;

        LOG_DEBUG("Machine {}: added state {}", this->describe(), formatIdentifier(name));
        return *this;
    }

    /**
     * @brief Add an empty leaf state
     */
    StateMachine &addState(const TStateId &name) {
        return addState(name, std::make_unique<LeafState>());
    }

    /**
     * @brief Add a callback-driven leaf state
     */
    StateMachine &addState(const TStateId &name, typename LeafState::Callbacks callbacks, bool needsExitTime = false,
                           bool isGhostState = false) {
        return addState(name, std::make_unique<LeafState>(std::move(callbacks), needsExitTime, isGhostState));
    }

    StateMachine &setStartState(const TStateId &name) {
        ensureNotProcessing("setStartState");
        startState_ = name;
        validated_ = false;
        return *this;
    }

    /**
     * @brief Add a transition checked every tick
     *
     * A transition without source (std::nullopt) is an any-state transition.
     * Endpoints are checked when the machine is entered.
     */
    StateMachine &addTransition(std::unique_ptr<ChildTransition> transition) {
        ensureNotProcessing("addTransition");
        requireTargetedTransition(transition, "addTransition");
        ChildTransition &added = *transition;

        if (transition->isFromAny()) {
            anyTransitions_.push_back(std::move(transition));
        } else {
            bundles_[*transition->getFrom()].transitions.push_back(std::move(transition));
        }
        registerTransition(added);
        return *this;
    }

    /**
     * @brief Add a transition checked every tick whatever state is active; its source is discarded
     */
    StateMachine &addTransitionFromAny(std::unique_ptr<ChildTransition> transition) {
        if (transition) {
            transition->makeFromAny();
        }
        return addTransition(std::move(transition));
    }

    /**
     * @brief Add a transition checked only when trigger(event) is called
     */
    StateMachine &addTriggerTransition(const TEvent &event, std::unique_ptr<ChildTransition> transition) {
        ensureNotProcessing("addTriggerTransition");
        requireTargetedTransition(transition, "addTriggerTransition");
        ChildTransition &added = *transition;

        if (transition->isFromAny()) {
            anyTriggerTransitions_[event].push_back(std::move(transition));
        } else {
            bundles_[*transition->getFrom()].triggerTransitions[event].push_back(std::move(transition));
        }
        registerTransition(added);
        return *this;
    }

    StateMachine &addTriggerTransitionFromAny(const TEvent &event, std::unique_ptr<ChildTransition> transition) {
        if (transition) {
            transition->makeFromAny();
        }
        return addTriggerTransition(event, std::move(transition));
    }

    /**
     * @brief Add a transition that lets this nested machine leave its parent
     *
     * Checked each tick while the parent waits for this machine to grant exit.
     * The target of the transition, if any, is ignored.
     */
    StateMachine &addExitTransition(std::unique_ptr<ChildTransition> transition) {
        ensureNotProcessing("addExitTransition");
        if (!transition) {
            LOG_ERROR("Machine {}: null transition passed to addExitTransition", this->describe());
            throw ConfigurationException("Null transition passed to addExitTransition");
        }
        ChildTransition &added = *transition;

        if (transition->isFromAny()) {
            anyExitTransitions_.push_back(std::move(transition));
        } else {
            bundles_[*transition->getFrom()].exitTransitions.push_back(std::move(transition));
        }
        registerTransition(added);
        return *this;
    }

    StateMachine &addExitTransitionFromAny(std::unique_ptr<ChildTransition> transition) {
        if (transition) {
            transition->makeFromAny();
        }
        return addExitTransition(std::move(transition));
    }

    /**
     * @brief Limit of consecutive ghost states entered in one call chain
     * @throws ConfigurationException for 0
     */
    StateMachine &setMaxGhostChainLength(size_t length) {
        if (length == 0) {
            LOG_ERROR("Machine {}: ghost chain length limit of 0", this->describe());
            throw ConfigurationException("Ghost chain length limit must be at least 1");
        }
        maxGhostChainLength_ = length;
        return *this;
    }

    size_t getMaxGhostChainLength() const {
        return maxGhostChainLength_;
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /**
     * @brief Start a root machine (validate + onEnter); no-op for nested machines, their parent enters them
     */
    void init() override {
        if (!isRootFsm()) {
            return;
        }
        onEnter();
    }

    /**
     * @throws ConfigurationException if the states and transitions do not form a valid machine
     */
    void onEnter() override {
        validate();
        ProcessingGuard guard(processing_);

        pending_.reset();
        const TStateId &start = (rememberLastState_ && lastState_.has_value()) ? *lastState_ : *startState_;
        LOG_DEBUG("Machine {}: entering at {}", this->describe(), formatIdentifier(start));
        changeState(start, nullptr);
    }

    /**
     * @throws StateMachineStateException if the machine is not running
     */
    void onLogic(double delta) override {
        ensureRunning("onLogic");
        ProcessingGuard guard(processing_);

        size_t changesBefore = stateChangeCount_;
        activeBundle_->state->onLogic(delta);

        // The active state may have granted a pending exit, or a parent may have exited this machine
        if (!activeBundle_ || stateChangeCount_ != changesBefore) {
            return;
        }

        if (tryAllGlobalTransitions() || tryAllDirectTransitions()) {
            return;
        }

        IStateMachine *parent = this->getFsm();
        if (parent && parent->hasPendingTransition() && !pending_.has_value()) {
            tryAllExitTransitions();
        }
    }

    void onExit() override {
        if (!activeBundle_) {
            LOG_DEBUG("Machine {}: onExit while not running", this->describe());
            return;
        }
        ProcessingGuard guard(processing_);

        if (pending_.has_value()) {
            LOG_DEBUG("Machine {}: discarding pending transition on exit", this->describe());
            pending_.reset();
        }

        activeBundle_->state->onExit();
        lastState_ = activeName_;
        activeBundle_ = nullptr;
        activeName_.reset();
    }

    /**
     * @brief The parent wants to leave this (needsExitTime) machine
     *
     * An active child that needs exit time is asked in turn; its grant is
     * passed on to the parent. Otherwise the exit transitions decide, now or
     * on a later tick.
     */
    void onExitRequest() override {
        ensureRunning("onExitRequest");
        ProcessingGuard guard(processing_);

        if (activeBundle_->state->needsExitTime()) {
            pending_ = PendingTransition{std::nullopt, nullptr, true};
            activeBundle_->state->onExitRequest();
            return;
        }
        tryAllExitTransitions();
    }

    /**
     * @brief Fire the trigger transitions for event, or forward event to the active child if none passes
     */
    void trigger(const TEvent &event) override {
        ensureRunning("trigger");
        ProcessingGuard guard(processing_);

        if (tryTriggerTransitions(event)) {
            return;
        }
        activeBundle_->state->trigger(event);
    }

    /**
     * @throws StateMachineStateException if no transition or exit is pending
     */
    void stateCanExit() override {
        if (!pending_.has_value()) {
            LOG_ERROR("Machine {}: stateCanExit without pending transition", this->describe());
            throw StateMachineStateException("stateCanExit called on machine " + this->describe() +
                                             " without a pending transition");
        }

        ProcessingGuard guard(processing_);

        // Cleared first: entering a ghost target may record a new pending transition
        PendingTransition pending = std::move(*pending_);
        pending_.reset();

        if (pending.isExit) {
            performVerticalTransition(pending.listener);
        } else {
            LOG_DEBUG("Machine {}: exit granted, switching to {}", this->describe(), formatIdentifier(*pending.target));
            changeState(*pending.target, pending.listener);
            resumeParentExitRequest();
        }
    }

    bool hasPendingTransition() const override {
        return pending_.has_value();
    }

    IStateMachine *getParentFsm() const override {
        return this->getFsm();
    }

    /**
     * @brief Switch to name, honoring the active state's exit time unless forced
     */
    void requestStateChange(const TStateId &name, bool forceInstantly = false) {
        requestChange(name, forceInstantly, nullptr);
    }

    /**
     * @brief Leave the parent machine, honoring the active state's exit time unless forced
     *
     * The parent must be waiting for this machine to grant exit.
     * @throws StateMachineStateException on a root machine
     */
    void requestExit(bool forceInstantly = false) {
        requestExitWith(forceInstantly, nullptr);
    }

    // ------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------

    bool isRootFsm() const {
        return this->getFsm() == nullptr;
    }

    bool hasActiveState() const {
        return activeBundle_ != nullptr;
    }

    /**
     * @throws StateMachineStateException if the machine is not running
     */
    const TStateId &getActiveStateName() const {
        ensureRunning("getActiveStateName");
        return *activeName_;
    }

    ChildState &getActiveState() const {
        ensureRunning("getActiveState");
        return *activeBundle_->state;
    }

    bool hasState(const TStateId &name) const {
        auto it = bundles_.find(name);
        return it != bundles_.end() && it->second.state != nullptr;
    }

    /**
     * @throws ConfigurationException if name is unknown
     */
    ChildState &getState(const TStateId &name) const {
        return *requireState(name).state;
    }

    /**
     * @throws ConfigurationException if name is unknown or not a TState
     */
    template <typename TState> TState &getState(const TStateId &name) const {
        auto *state = dynamic_cast<TState *>(&getState(name));
        if (!state) {
            LOG_ERROR("Machine {}: state {} has a different type", this->describe(), formatIdentifier(name));
            throw ConfigurationException("State " + formatIdentifier(name) + " has a different type");
        }
        return *state;
    }

    const std::optional<TStateId> &getStartStateName() const {
        return startState_;
    }

    size_t getStateCount() const {
        size_t count = 0;
        for (const auto &[name, bundle] : bundles_) {
            if (bundle.state) {
                ++count;
            }
        }
        return count;
    }

protected:
    void handleAction(const TEvent &action, const ActionArgument *argument) override {
        ensureRunning("onAction");
        ProcessingGuard guard(processing_);

        if (argument) {
            activeBundle_->state->onAction(action, *argument);
        } else {
            activeBundle_->state->onAction(action);
        }
    }

    /**
     * @brief Mark this machine as processing for the lifetime of the returned guard
     *
     * Subclasses hold it around code they run next to the base lifecycle
     * calls, so structural changes from that code are rejected as well.
     */
    ProcessingGuard guardProcessing() {
        return ProcessingGuard(processing_);
    }

    void ensureRunning(const char *operation) const {
        if (!activeBundle_) {
            LOG_ERROR("Machine {}: {} called before the machine was entered", this->describe(), operation);
            throw StateMachineStateException(std::string(operation) + " called on machine " + this->describe() +
                                             " before it was entered; call init() or onEnter() first");
        }
    }

private:
    using TransitionList = std::vector<std::unique_ptr<ChildTransition>>;

    struct StateBundle {
        std::unique_ptr<ChildState> state;  // Null while only transitions reference the id
        TransitionList transitions;
        std::unordered_map<TEvent, TransitionList> triggerTransitions;
        TransitionList exitTransitions;
    };

    struct PendingTransition {
        std::optional<TStateId> target;  // Empty for an exit from this machine
        ChildTransition *listener = nullptr;
        bool isExit = false;
    };

    void ensureNotProcessing(const char *operation) const {
        if (processing_) {
            LOG_ERROR("Machine {}: {} called while the machine is processing", this->describe(), operation);
            throw StateMachineStateException(std::string(operation) + " called on machine " + this->describe() +
                                             " while it is processing a lifecycle call");
        }
    }

    void requireTargetedTransition(const std::unique_ptr<ChildTransition> &transition, const char *operation) const {
        if (!transition) {
            LOG_ERROR("Machine {}: null transition passed to {}", this->describe(), operation);
            throw ConfigurationException(std::string("Null transition passed to ") + operation);
        }
        if (!transition->hasTarget()) {
            LOG_ERROR("Machine {}: transition from {} has no target", this->describe(), transition->describeFrom());
            throw ConfigurationException("Transition from " + transition->describeFrom() +
                                         " has no target; use addExitTransition to leave the machine");
        }
    }

    void registerTransition(ChildTransition &transition) {
        transition.attach(this);
        transition.init();
        validated_ = false;
        LOG_DEBUG("Machine {}: added transition {} -> {}", this->describe(), transition.describeFrom(),
                  transition.describeTo());
    }

    const StateBundle &requireState(const TStateId &name) const {
        auto it = bundles_.find(name);
        if (it == bundles_.end() || !it->second.state) {
            LOG_ERROR("Machine {}: unknown state {}", this->describe(), formatIdentifier(name));
            throw ConfigurationException("State " + formatIdentifier(name) + " is not registered in machine " +
                                         this->describe());
        }
        return it->second;
    }

    StateBundle &requireState(const TStateId &name) {
        return const_cast<StateBundle &>(std::as_const(*this).requireState(name));
    }

    void requireKnownTarget(const ChildTransition &transition) const {
        if (!hasState(transition.getTo())) {
            LOG_ERROR("Machine {}: transition {} -> {} targets an unknown state", this->describe(),
                      transition.describeFrom(), transition.describeTo());
            throw ConfigurationException("Transition " + transition.describeFrom() + " -> " +
                                         transition.describeTo() + " targets an unknown state");
        }
    }

    /**
     * @brief Check every id used by transitions and the start state
     */
    void validate() {
        if (validated_) {
            return;
        }

        if (bundles_.empty()) {
            LOG_ERROR("Machine {}: has no states", this->describe());
            throw ConfigurationException("Machine " + this->describe() + " has no states");
        }

        for (const auto &[name, bundle] : bundles_) {
            if (!bundle.state) {
                LOG_ERROR("Machine {}: transitions leave unknown state {}", this->describe(), formatIdentifier(name));
                throw ConfigurationException("Transitions leave state " + formatIdentifier(name) +
                                             ", which is not registered in machine " + this->describe());
            }
            for (const auto &transition : bundle.transitions) {
                requireKnownTarget(*transition);
            }
            for (const auto &[event, transitions] : bundle.triggerTransitions) {
                for (const auto &transition : transitions) {
                    requireKnownTarget(*transition);
                }
            }
        }

        for (const auto &transition : anyTransitions_) {
            requireKnownTarget(*transition);
        }
        for (const auto &[event, transitions] : anyTriggerTransitions_) {
            for (const auto &transition : transitions) {
                requireKnownTarget(*transition);
            }
        }

        if (!startState_.has_value() || !hasState(*startState_)) {
            LOG_ERROR("Machine {}: start state is not registered", this->describe());
            throw ConfigurationException("Start state of machine " + this->describe() + " is not registered");
        }

        validated_ = true;
    }

    void changeState(const TStateId &name, ChildTransition *listener) {
        StateBundle &bundle = requireState(name);

        if (listener) {
            listener->beforeTransition();
        }

        if (activeBundle_) {
            activeBundle_->state->onExit();
        }

        LOG_DEBUG("Machine {}: {} -> {}", this->describe(),
                  activeName_.has_value() ? formatIdentifier(*activeName_) : std::string("<none>"),
                  formatIdentifier(name));

        activeBundle_ = &bundle;
        activeName_ = name;
        ++stateChangeCount_;

        bundle.state->onEnter();
        if (activeBundle_ != &bundle) {
            // onEnter already moved on
            return;
        }

        notifyTransitionsOnEnter(bundle);

        if (listener) {
            listener->afterTransition();
        }

        if (bundle.state->isGhostState() && activeBundle_ == &bundle) {
            if (ghostChainDepth_ >= maxGhostChainLength_) {
                LOG_ERROR("Machine {}: more than {} ghost states in one chain at {}", this->describe(),
                          maxGhostChainLength_, formatIdentifier(name));
                throw GhostChainException("Machine " + this->describe() + " passed through more than " +
                                          std::to_string(maxGhostChainLength_) + " ghost states in one chain (at " +
                                          formatIdentifier(name) + "); check for a cycle of ghost states");
            }
            ChainDepthGuard depth(ghostChainDepth_);
            LOG_DEBUG("Machine {}: ghost state {} evaluates its transitions", this->describe(),
                      formatIdentifier(name));
            if (!tryAllGlobalTransitions()) {
                tryAllDirectTransitions();
            }
        }
    }

    void notifyTransitionsOnEnter(StateBundle &bundle) {
        for (auto &transition : bundle.transitions) {
            transition->onEnter();
        }
        for (auto &[event, transitions] : bundle.triggerTransitions) {
            for (auto &transition : transitions) {
                transition->onEnter();
            }
        }
        for (auto &transition : bundle.exitTransitions) {
            transition->onEnter();
        }
        for (auto &transition : anyTransitions_) {
            transition->onEnter();
        }
        for (auto &[event, transitions] : anyTriggerTransitions_) {
            for (auto &transition : transitions) {
                transition->onEnter();
            }
        }
        for (auto &transition : anyExitTransitions_) {
            transition->onEnter();
        }
    }

    void requestChange(const TStateId &name, bool forceInstantly, ChildTransition *listener) {
        ensureRunning("requestStateChange");
        requireState(name);
        ProcessingGuard guard(processing_);

        ChildState &active = *activeBundle_->state;
        if (!active.needsExitTime() || forceInstantly) {
            pending_.reset();
            changeState(name, listener);
            resumeParentExitRequest();
            return;
        }

        LOG_DEBUG("Machine {}: transition to {} waits for {} to grant exit", this->describe(), formatIdentifier(name),
                  formatIdentifier(*activeName_));
        pending_ = PendingTransition{name, listener, false};
        active.onExitRequest();
    }

    void requestExitWith(bool forceInstantly, ChildTransition *listener) {
        ensureRunning("requestExit");
        if (isRootFsm()) {
            LOG_ERROR("Machine {}: requestExit on a root machine", this->describe());
            throw StateMachineStateException("requestExit called on root machine " + this->describe());
        }
        ProcessingGuard guard(processing_);

        ChildState &active = *activeBundle_->state;
        if (active.needsExitTime() && !forceInstantly) {
            LOG_DEBUG("Machine {}: exit waits for {} to grant exit", this->describe(), formatIdentifier(*activeName_));
            pending_ = PendingTransition{std::nullopt, listener, true};
            active.onExitRequest();
            return;
        }

        pending_.reset();
        performVerticalTransition(listener);
    }

    /**
     * @brief Ask the newly entered child again if the parent still waits to leave this machine
     *
     * A horizontal switch replaces the child that was asked to exit.
     */
    void resumeParentExitRequest() {
        IStateMachine *parent = this->getFsm();
        if (!activeBundle_ || pending_.has_value() || !parent || !parent->hasPendingTransition()) {
            return;
        }
        LOG_DEBUG("Machine {}: parent still waits to exit, asking {}", this->describe(),
                  formatIdentifier(*activeName_));
        onExitRequest();
    }

    /**
     * @brief Grant the parent's pending transition, which exits this machine
     */
    void performVerticalTransition(ChildTransition *listener) {
        IStateMachine *parent = this->getFsm();
        if (!parent) {
            LOG_ERROR("Machine {}: has no parent to exit to", this->describe());
            throw StateMachineStateException("Machine " + this->describe() + " has no parent to exit to");
        }

        LOG_DEBUG("Machine {}: leaving parent machine", this->describe());
        if (listener) {
            listener->beforeTransition();
        }
        parent->stateCanExit();
        if (listener) {
            listener->afterTransition();
        }
    }

    bool tryTransition(ChildTransition &transition) {
        if (!transition.shouldTransition()) {
            return false;
        }
        requestChange(transition.getTo(), transition.isForceInstantly(), &transition);
        return true;
    }

    bool tryAllGlobalTransitions() {
        for (auto &transition : anyTransitions_) {
            // A transition from any state to the active state would re-enter it every tick
            if (transition->getTo() == *activeName_) {
                continue;
            }
            if (tryTransition(*transition)) {
                return true;
            }
        }
        return false;
    }

    bool tryAllDirectTransitions() {
        for (auto &transition : activeBundle_->transitions) {
            if (tryTransition(*transition)) {
                return true;
            }
        }
        return false;
    }

    bool tryTriggerTransitions(const TEvent &event) {
        if (auto it = anyTriggerTransitions_.find(event); it != anyTriggerTransitions_.end()) {
            for (auto &transition : it->second) {
                if (transition->getTo() == *activeName_) {
                    continue;
                }
                if (tryTransition(*transition)) {
                    return true;
                }
            }
        }

        auto &triggerTransitions = activeBundle_->triggerTransitions;
        if (auto it = triggerTransitions.find(event); it != triggerTransitions.end()) {
            for (auto &transition : it->second) {
                if (tryTransition(*transition)) {
                    return true;
                }
            }
        }
        return false;
    }

    bool tryAllExitTransitions() {
        for (auto &transition : anyExitTransitions_) {
            if (transition->shouldTransition()) {
                requestExitWith(transition->isForceInstantly(), transition.get());
                return true;
            }
        }
        for (auto &transition : activeBundle_->exitTransitions) {
            if (transition->shouldTransition()) {
                requestExitWith(transition->isForceInstantly(), transition.get());
                return true;
            }
        }
        return false;
    }

    std::unordered_map<TStateId, StateBundle> bundles_;
    TransitionList anyTransitions_;
    std::unordered_map<TEvent, TransitionList> anyTriggerTransitions_;
    TransitionList anyExitTransitions_;

    std::optional<TStateId> startState_;
    std::optional<TStateId> lastState_;
    bool rememberLastState_;

    StateBundle *activeBundle_ = nullptr;
    std::optional<TStateId> activeName_;
    std::optional<PendingTransition> pending_;

    bool validated_ = false;
    bool processing_ = false;
    size_t stateChangeCount_ = 0;
    size_t ghostChainDepth_ = 0;
    size_t maxGhostChainLength_ = Constants::DEFAULT_MAX_GHOST_CHAIN_LENGTH;
};

}  // namespace HFSM
