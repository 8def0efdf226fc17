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

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace HFSM {

/**
 * @brief Process-wide logging facade used by the engine
 *
 * Two usage patterns:
 *
 * 1. Default: the first log call lazily creates a SpdlogBackend writing to stdout.
 * 2. Injected: the host installs its own ILoggerBackend before running machines.
 *
 * @code
 * HFSM::Logger::initialize("logs", true);  // stdout + logs/hfsm.log
 * HFSM::Logger::setLevel(HFSM::LogLevel::Info);
 * LOG_INFO("Loaded {} states", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Drop the active backend; the next log call recreates the default one
     */
    static void resetBackend();

    /**
     * @brief Create the default console backend if none is installed
     */
    static void initialize();

    /**
     * @brief Create the default backend with an optional file sink
     *
     * @param logDir Directory receiving hfsm.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(LogLevel::Trace, message, loc);
    }

    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(LogLevel::Debug, message, loc);
    }

    static void info(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(LogLevel::Info, message, loc);
    }

    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(LogLevel::Warn, message, loc);
    }

    static void error(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        log(LogLevel::Error, message, loc);
    }

    static void flush();

    /**
     * @brief Reduce a compiler-provided function signature to "Scope::name"
     *
     * Return type, parameter list and template arguments are removed.
     */
    static std::string shortFunctionName(const char *signature);

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static ILoggerBackend &ensureBackend();
};

}  // namespace HFSM

#define LOG_TRACE(...) HFSM::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) HFSM::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) HFSM::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) HFSM::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) HFSM::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
