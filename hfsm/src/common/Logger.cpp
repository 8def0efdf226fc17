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

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace HFSM {

std::unique_ptr<ILoggerBackend> Logger::backend_;

// Guards backend_ replacement; log calls on an installed backend are serialized by the backend itself
static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::resetBackend() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_.reset();
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend().setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend().log(level, shortFunctionName(loc.function_name()) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend().flush();
}

ILoggerBackend &Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
    return *backend_;
}

std::string Logger::shortFunctionName(const char *signature) {
    std::string full(signature ? signature : "");

    size_t paren = full.find('(');
    if (paren == std::string::npos) {
        return full.empty() ? "UnknownFunction" : full;
    }

    // The qualified name starts after the last top-level space (return type separator)
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = full[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (c == ' ' && depth == 0) {
            start = i + 1;
        }
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = full[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c != '*' && c != '&' && !std::isspace(static_cast<unsigned char>(c))) {
            name += c;
        }
    }

    return name.empty() ? "UnknownFunction" : name;
}

}  // namespace HFSM
