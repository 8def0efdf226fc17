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
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace HFSM {

/**
 * @brief spdlog-based logger backend, the engine default
 *
 * Console output is always enabled. When a log directory is given and file
 * logging is requested, messages are also appended to <logDir>/hfsm.log.
 * The initial level is Debug unless SPDLOG_LEVEL overrides it.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /**
     * @brief Parse a level name as accepted by SPDLOG_LEVEL ("trace", "warn", "err", ...)
     * @return Parsed level, or fallback when the name is not recognized
     */
    static LogLevel parseLevel(const std::string &name, LogLevel fallback);

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace HFSM
