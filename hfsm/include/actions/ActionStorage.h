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
#include "common/Logger.h"
#include "common/StateMachineException.h"
#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HFSM {

/**
 * @brief Registry of user-defined actions keyed by trigger
 *
 * Every trigger maps to an ordered list of handlers. A handler takes either
 * no argument or exactly one argument of a declared type; the declared type
 * is kept as a runtime tag and checked on every run. A run fails as a whole
 * (no handler is invoked) when any handler of the trigger disagrees with the
 * call site about the argument.
 *
 * @code
 * ActionStorage<std::string> actions;
 * actions.addAction("hit", [] { flash(); });
 * actions.addAction<int>("damage", [](const int &amount) { hp -= amount; });
 *
 * actions.runAction("hit");
 * actions.runAction("damage", 5);
 * actions.runAction("damage");  // throws ActionTypeMismatchException
 * @endcode
 *
 * @tparam TEvent Trigger identifier type (hashable, equality comparable)
 */
template <typename TEvent = std::string> class ActionStorage {
public:
    /**
     * @brief Append a zero-argument handler for trigger
     */
    void addAction(const TEvent &trigger, std::function<void()> action) {
        if (!action) {
            LOG_ERROR("Empty handler added for action {}", formatIdentifier(trigger));
            throw ConfigurationException("Empty handler added for action " + formatIdentifier(trigger));
        }
        actions_[trigger].push_back(Handler{std::nullopt, [action = std::move(action)](const ActionArgument *) {
                                                action();
                                            }});
    }

    /**
     * @brief Append a handler expecting one argument of type TData
     */
    template <typename TData> void addAction(const TEvent &trigger, std::function<void(const TData &)> action) {
        if (!action) {
            LOG_ERROR("Empty handler added for action {}", formatIdentifier(trigger));
            throw ConfigurationException("Empty handler added for action " + formatIdentifier(trigger));
        }
        actions_[trigger].push_back(Handler{std::type_index(typeid(TData)),
                                            [action = std::move(action)](const ActionArgument *argument) {
                                                action(argument->get<TData>());
                                            }});
    }

    bool hasAction(const TEvent &trigger) const {
        auto it = actions_.find(trigger);
        return it != actions_.end() && !it->second.empty();
    }

    /**
     * @brief Run every handler of trigger without data
     *
     * No handlers registered: no-op.
     * @throws ActionTypeMismatchException if a handler of trigger expects an argument
     */
    void runAction(const TEvent &trigger) {
        run(trigger, nullptr);
    }

    /**
     * @brief Run every handler of trigger with data of type TData
     *
     * No handlers registered: no-op.
     * @throws ActionTypeMismatchException if a handler of trigger takes no
     *         argument or expects a type other than TData
     */
    template <typename TData> void runAction(const TEvent &trigger, const TData &data) {
        ActionArgument argument = ActionArgument::of(data);
        run(trigger, &argument);
    }

    /**
     * @brief Type-erased variant used by the state dispatch chain
     */
    void runAction(const TEvent &trigger, const ActionArgument &argument) {
        run(trigger, &argument);
    }

private:
    struct Handler {
        std::optional<std::type_index> argumentType;  // nullopt: zero-argument handler
        std::function<void(const ActionArgument *)> invoke;
    };

    void run(const TEvent &trigger, const ActionArgument *argument) {
        auto it = actions_.find(trigger);
        if (it == actions_.end()) {
            return;
        }

        for (const auto &handler : it->second) {
            if (!handler.argumentType.has_value() && argument == nullptr) {
                continue;
            }
            if (handler.argumentType.has_value() && argument != nullptr &&
                handler.argumentType.value() == argument->getType()) {
                continue;
            }

            std::string expected = handler.argumentType ? handler.argumentType->name() : "no argument";
            std::string given = argument ? argument->getType().name() : "no argument";
            LOG_ERROR("Action {} run with {}, but a handler expects {}", formatIdentifier(trigger), given, expected);
            throw ActionTypeMismatchException("Action " + formatIdentifier(trigger) + " run with " + given +
                                              ", but a handler expects " + expected);
        }

        // Handlers may register further actions while running
        std::vector<Handler> snapshot = it->second;
        for (const auto &handler : snapshot) {
            handler.invoke(argument);
        }
    }

    std::unordered_map<TEvent, std::vector<Handler>> actions_;
};

}  // namespace HFSM
