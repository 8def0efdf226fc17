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

#include "backends/SpdlogBackend.h"
#include "common/Constants.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace HFSM {

namespace {
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // A previous backend may have registered the same name (Logger::resetBackend)
    spdlog::drop(Constants::LOGGER_NAME);

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "hfsm.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);
    }

    logger_ = std::make_shared<spdlog::logger>(Constants::LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    LogLevel level = LogLevel::Debug;
    if (const char *envLevel = std::getenv("SPDLOG_LEVEL")) {
        level = parseLevel(envLevel, level);
    }
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

LogLevel SpdlogBackend::parseLevel(const std::string &name, LogLevel fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        return LogLevel::Trace;
    } else if (lower == "debug") {
        return LogLevel::Debug;
    } else if (lower == "info") {
        return LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    } else if (lower == "err" || lower == "error") {
        return LogLevel::Error;
    } else if (lower == "critical") {
        return LogLevel::Critical;
    } else if (lower == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::debug;
    }
}

}  // namespace HFSM
