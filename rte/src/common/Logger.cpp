// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Replayable Transition Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Full terms: see LICENSE

#include "common/Logger.h"

#ifdef RTE_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <mutex>

namespace RTE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

// Guards backend_ creation, replacement and use
std::recursive_mutex &backendMutex() {
    static std::recursive_mutex mutex;
    return mutex;
}

std::unique_ptr<ILoggerBackend> makeBuiltinBackend([[maybe_unused]] const std::string &logDir,
                                                   [[maybe_unused]] bool logToFile) {
#ifdef RTE_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    // DefaultBackend has no file sink
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

LogLevel parseLogLevel(const std::string &name, LogLevel fallback) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    } else if (lowered == "debug") {
        return LogLevel::Debug;
    } else if (lowered == "info") {
        return LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    } else if (lowered == "err" || lowered == "error") {
        return LogLevel::Error;
    } else if (lowered == "critical") {
        return LogLevel::Critical;
    } else if (lowered == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::recursive_mutex> lock(backendMutex());
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::recursive_mutex> lock(backendMutex());
    if (!backend_) {
        backend_ = makeBuiltinBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(backendMutex());
    activeBackend().setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    std::lock_guard<std::recursive_mutex> lock(backendMutex());
    activeBackend().log(level, functionName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(backendMutex());
    activeBackend().flush();
}

ILoggerBackend &Logger::activeBackend() {
    if (!backend_) {
        backend_ = makeBuiltinBackend("", false);
    }
    return *backend_;
}

std::string Logger::functionName(const std::source_location &loc) {
    const std::string signature = loc.function_name();

    // Parameter list starts at the first '(' outside template arguments
    size_t end = std::string::npos;
    int depth = 0;
    for (size_t i = 0; i < signature.size(); ++i) {
        if (signature[i] == '<') {
            ++depth;
        } else if (signature[i] == '>') {
            --depth;
        } else if (signature[i] == '(' && depth == 0) {
            end = i;
            break;
        }
    }
    if (end == std::string::npos) {
        return "UnknownFunction";
    }

    // Drop the return type: the qualified name follows the last top-level space
    size_t begin = 0;
    depth = 0;
    for (size_t i = 0; i < end; ++i) {
        if (signature[i] == '<') {
            ++depth;
        } else if (signature[i] == '>') {
            --depth;
        } else if (signature[i] == ' ' && depth == 0) {
            begin = i + 1;
        }
    }

    std::string name;
    depth = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = signature[i];
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

}  // namespace RTE
