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

#include "transitions/TransitionBase.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace HFSM {

/**
 * @brief Transition with a predicate and optional transition callbacks
 *
 * An empty condition always passes.
 *
 * @code
 * fsm.addTransition(std::make_unique<Transition<>>("Idle", "Chase",
 *     [&](Transition<> &) { return distanceToPlayer() < 10.0; }));
 * @endcode
 */
template <typename TStateId = std::string> class Transition : public TransitionBase<TStateId> {
public:
    using Condition = std::function<bool(Transition &)>;
    using Callback = std::function<void(Transition &)>;

    Transition(std::optional<TStateId> from, std::optional<TStateId> to, Condition condition = nullptr,
               Callback onTransition = nullptr, Callback afterTransition = nullptr, bool forceInstantly = false)
        : TransitionBase<TStateId>(std::move(from), std::move(to), forceInstantly), condition_(std::move(condition)),
          onTransition_(std::move(onTransition)), afterTransition_(std::move(afterTransition)) {}

    bool shouldTransition() override {
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

private:
    Condition condition_;
    Callback onTransition_;
    Callback afterTransition_;
};

}  // namespace HFSM
