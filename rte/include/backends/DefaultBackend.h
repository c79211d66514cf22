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
#include <mutex>
#include <ostream>

namespace RTE {

/**
 * @brief Dependency-free console backend
 *
 * Used when RTE is built with RTE_USE_SPDLOG=OFF. Writes
 * "[HH:MM:SS.mmm] [level] message" lines, colored with ANSI codes, to the
 * given stream (std::cout by default). Honors SPDLOG_LEVEL for parity with
 * SpdlogBackend. No file sink.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();
    explicit DefaultBackend(std::ostream &out);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::ostream &out_;
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char *levelToString(LogLevel level);
    static const char *levelToColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace RTE
