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

#include "timing/Timer.h"
#include "transitions/TransitionBase.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace HFSM {

/**
 * @brief Transition that passes once its source state has been active for a delay
 *
 * The delay is measured from the moment the source state was entered. An
 * optional condition must also hold once the delay has elapsed.
 */
template <typename TStateId = std::string> class TransitionAfter : public TransitionBase<TStateId> {
public:
    using Condition = std::function<bool(TransitionAfter &)>;
    using Callback = std::function<void(TransitionAfter &)>;

    /**
     * @param delay Seconds the source state must be active
     */
    TransitionAfter(std::optional<TStateId> from, std::optional<TStateId> to, double delay,
                    Condition condition = nullptr, Callback onTransition = nullptr,
                    Callback afterTransition = nullptr, bool forceInstantly = false)
        : TransitionBase<TStateId>(std::move(from), std::move(to), forceInstantly), delay_(delay),
          condition_(std::move(condition)), onTransition_(std::move(onTransition)),
          afterTransition_(std::move(afterTransition)) {}

    void onEnter() override {
        timer_.reset();
    }

    bool shouldTransition() override {
        if (timer_.isElapsedLessThan(delay_)) {
            return false;
        }
        return !condition_ || condition_(*this);
    }

    void beforeTransition() override {
        if (onTransition_) {
            onTransition_(*this);
        }
    }

    void afterTransition() override {
        if (afterTransition_) {
            afterTransition_(*this);
        }
    }

    double getDelay() const {
        return delay_;
    }

    const Timer &getTimer() const {
        return timer_;
    }

private:
    double delay_;
    Timer timer_;
    Condition condition_;
    Callback onTransition_;
    Callback afterTransition_;
};

}  // namespace HFSM
