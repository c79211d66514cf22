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

#include <source_location>
#include <string>

namespace RTE {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name as accepted by SPDLOG_LEVEL
 *
 * Accepts trace, debug, info, warn/warning, err/error, critical, off
 * (case-insensitive).
 *
 * @param name Level name
 * @param fallback Level returned when the name is not recognized
 */
LogLevel parseLogLevel(const std::string &name, LogLevel fallback);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the engine in a protocol node usually route engine logs
 * into their own logging system:
 *
 * @code
 * class NodeLogger : public RTE::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         node_->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { node_->setMinLevel(level); }
 *     void flush() override { node_->flush(); }
 * };
 *
 * RTE::Logger::setBackend(std::make_unique<NodeLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param level Log level
     * @param message Pre-formatted message (function name already prefixed)
     * @param loc Call site
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace RTE
