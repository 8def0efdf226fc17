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

#include <source_location>
#include <string>

namespace HFSM {

/**
 * @brief Log level enumeration
 *
 * Ordered from most to least verbose, matching spdlog's levels.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Logger backend interface for dependency injection
 *
 * A host embedding the engine can route engine diagnostics into its own
 * logging system by implementing this interface.
 *
 * Example: forwarding to a game engine console
 * @code
 * class ConsoleBackend : public HFSM::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message,
 *              const std::source_location &loc) override {
 *         engineConsole->print(static_cast<int>(level), message);
 *     }
 *     void setLevel(LogLevel level) override { minLevel_ = level; }
 *     void flush() override {}
 * };
 *
 * HFSM::Logger::setBackend(std::make_unique<ConsoleBackend>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location of the log statement
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level; messages below it are dropped
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush pending output
     */
    virtual void flush() = 0;
};

}  // namespace HFSM
