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

#include <format>
#include <string>
#include <string_view>
#include <type_traits>

namespace HFSM {

/**
 * @brief Render a state or event identifier for log and error messages
 *
 * Identifiers are generic, so not every type is printable. Strings are
 * quoted, enums print their underlying value, arithmetic types print as
 * numbers, and anything else prints as a placeholder.
 *
 * @code
 * formatIdentifier(std::string("Idle"));  // "'Idle'"
 * formatIdentifier(Phase::Attack);         // "#2"
 * @endcode
 */
template <typename T> std::string formatIdentifier(const T &id) {
    if constexpr (std::is_convertible_v<const T &, std::string_view>) {
        return std::format("'{}'", std::string_view(id));
    } else if constexpr (std::is_enum_v<T>) {
        return std::format("#{}", static_cast<long long>(id));
    } else if constexpr (std::is_same_v<T, bool>) {
        return id ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        return std::format("{}", id);
    } else {
        return "<unprintable id>";
    }
}

}  // namespace HFSM
