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

#include "common/StateMachineException.h"
#include "transitions/TransitionBase.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace HFSM::TransitionOnSignal {

/**
 * @brief Boolean input sampled by signal transitions, e.g. "is the fire button held"
 *
 * Supplied by the host; the engine never polls devices itself.
 */
using Signal = std::function<bool()>;

namespace Detail {

template <typename TStateId> class SignalTransitionBase : public TransitionBase<TStateId> {
public:
    SignalTransitionBase(std::optional<TStateId> from, std::optional<TStateId> to, Signal signal,
                         bool forceInstantly)
        : TransitionBase<TStateId>(std::move(from), std::move(to), forceInstantly), signal_(std::move(signal)) {
        if (!signal_) {
            throw ConfigurationException("Signal transition from " + this->describeFrom() + " has no signal");
        }
    }

protected:
    bool sample() const {
        return signal_();
    }

private:
    Signal signal_;
};

/**
 * @brief Edge detector; the first sample after the source state is entered only primes it
 */
template <typename TStateId> class SignalEdgeBase : public SignalTransitionBase<TStateId> {
public:
    using SignalTransitionBase<TStateId>::SignalTransitionBase;

    void onEnter() override {
        wasHigh_.reset();
    }

protected:
    /**
     * @return Previous and current sample, previous empty on the priming sample
     */
    std::pair<std::optional<bool>, bool> step() {
        bool isHigh = this->sample();
        std::optional<bool> previous = wasHigh_;
        wasHigh_ = isHigh;
        return {previous, isHigh};
    }

private:
    std::optional<bool> wasHigh_;
};

}  // namespace Detail

/**
 * @brief Passes while the signal is high
 */
template <typename TStateId = std::string> class Down : public Detail::SignalTransitionBase<TStateId> {
public:
    Down(std::optional<TStateId> from, std::optional<TStateId> to, Signal signal, bool forceInstantly = false)
        : Detail::SignalTransitionBase<TStateId>(std::move(from), std::move(to), std::move(signal), forceInstantly) {}

    bool shouldTransition() override {
        return this->sample();
    }
};

/**
 * @brief Passes while the signal is low
 */
template <typename TStateId = std::string> class Up : public Detail::SignalTransitionBase<TStateId> {
public:
    Up(std::optional<TStateId> from, std::optional<TStateId> to, Signal signal, bool forceInstantly = false)
        : Detail::SignalTransitionBase<TStateId>(std::move(from), std::move(to), std::move(signal), forceInstantly) {}

    bool shouldTransition() override {
        return !this->sample();
    }
};

/**
 * @brief Passes on the sample where the signal went from low to high
 */
template <typename TStateId = std::string> class Press : public Detail::SignalEdgeBase<TStateId> {
public:
    Press(std::optional<TStateId> from, std::optional<TStateId> to, Signal signal, bool forceInstantly = false)
        : Detail::SignalEdgeBase<TStateId>(std::move(from), std::move(to), std::move(signal), forceInstantly) {}

    bool shouldTransition() override {
        auto [previous, isHigh] = this->step();
        return previous.has_value() && !previous.value() && isHigh;
    }
};

/**
 * @brief Passes on the sample where the signal went from high to low
 */
template <typename TStateId = std::string> class Release : public Detail::SignalEdgeBase<TStateId> {
public:
    Release(std::optional<TStateId> from, std::optional<TStateId> to, Signal signal, bool forceInstantly = false)
        : Detail::SignalEdgeBase<TStateId>(std::move(from), std::move(to), std::move(signal), forceInstantly) {}

    bool shouldTransition() override {
        auto [previous, isHigh] = this->step();
        return previous.has_value() && previous.value() && !isHigh;
    }
};

}  // namespace HFSM::TransitionOnSignal
