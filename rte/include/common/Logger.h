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

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace RTE {

/**
 * @brief Process-wide logging facade used by the engine
 *
 * Backend selection:
 * 1. Injected: setBackend() with any ILoggerBackend
 * 2. Built-in: SpdlogBackend when built with RTE_USE_SPDLOG, DefaultBackend otherwise
 *
 * The built-in backend is created lazily on first use. All entry points are
 * thread-safe; the StateManager itself is not.
 *
 * @code
 * RTE::Logger::initialize("/var/log/node", true);
 * LOG_INFO("Replaying {} records", journal.size());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend (ownership transferred)
     *
     * Passing nullptr reverts to the built-in backend on next use.
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the built-in console backend if none is installed
     */
    static void initialize();

    /**
     * @brief Create the built-in backend with an optional file sink
     *
     * @param logDir Directory receiving rte.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;

    static ILoggerBackend &activeBackend();
    static std::string functionName(const std::source_location &loc);
};

}  // namespace RTE

#define RTE_LOG_AT(level, ...) RTE::Logger::log(level, std::format(__VA_ARGS__), std::source_location::current())

#define LOG_TRACE(...) RTE_LOG_AT(RTE::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) RTE_LOG_AT(RTE::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) RTE_LOG_AT(RTE::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) RTE_LOG_AT(RTE::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) RTE_LOG_AT(RTE::LogLevel::Error, __VA_ARGS__)
