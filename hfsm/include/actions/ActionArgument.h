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
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace HFSM {

/**
 * @brief Type-erased, non-owning reference to the data passed with an action
 *
 * Actions travel through virtual StateBase::onAction overrides, which cannot
 * be templates. The call site wraps its argument here together with its
 * runtime type; handlers unwrap it only if their declared type matches.
 *
 * The referenced object must outlive the dispatch call.
 */
class ActionArgument {
public:
    template <typename TData> static ActionArgument of(const TData &data) {
        static_assert(!std::is_array_v<TData>, "Pass std::string or a pointer instead of a raw array");
        return ActionArgument(typeid(TData), &data);
    }

    const std::type_index &getType() const {
        return type_;
    }

    template <typename TData> bool holds() const {
        return type_ == std::type_index(typeid(TData));
    }

    /**
     * @brief Access the data as TData
     * @throws ActionTypeMismatchException if the argument holds another type
     */
    template <typename TData> const TData &get() const {
        if (!holds<TData>()) {
            throw ActionTypeMismatchException(std::string("Action argument holds ") + type_.name() +
                                              ", requested " + typeid(TData).name());
        }
        return *static_cast<const TData *>(data_);
    }

private:
    ActionArgument(const std::type_info &type, const void *data) : type_(type), data_(data) {}

    std::type_index type_;
    const void *data_;
};

}  // namespace HFSM
