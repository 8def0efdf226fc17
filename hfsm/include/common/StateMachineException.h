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

#include <stdexcept>
#include <string>

namespace HFSM {

/**
 * @brief Base class of every error raised by the engine
 *
 * All engine errors are programming or configuration mistakes in the host's
 * state graph. None of them is recoverable by retrying the same call.
 */
class StateMachineException : public std::runtime_error {
public:
    explicit StateMachineException(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Broken machine setup: unknown or duplicate state id, empty machine, null state or transition
 */
class ConfigurationException : public StateMachineException {
public:
    explicit ConfigurationException(const std::string &message) : StateMachineException(message) {}
};

/**
 * @brief Call not allowed in the machine's current lifecycle state
 *
 * Raised for ticking or dispatching before enter, granting an exit nobody
 * requested, and mutating a machine while it is processing.
 */
class StateMachineStateException : public StateMachineException {
public:
    explicit StateMachineStateException(const std::string &message) : StateMachineException(message) {}
};

/**
 * @brief Action invoked with an argument type no handler of that trigger expects
 */
class ActionTypeMismatchException : public StateMachineException {
public:
    explicit ActionTypeMismatchException(const std::string &message) : StateMachineException(message) {}
};

/**
 * @brief Chain of ghost states longer than the machine's limit, usually a ghost cycle
 */
class GhostChainException : public StateMachineException {
public:
    explicit GhostChainException(const std::string &message) : StateMachineException(message) {}
};

}  // namespace HFSM
