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

#include <algorithm>
#include <cstddef>
#include <string>

namespace RTE {
namespace Log {

/**
 * @brief Make externally supplied text safe to embed in a log line
 *
 * Decoded journal records come from outside the process. Newlines are escaped
 * so a crafted tag cannot forge log entries, other control and non-ASCII bytes
 * become '?', and the result is truncated to maxLength characters.
 */
inline std::string sanitize(const std::string &input, std::size_t maxLength = 128) {
    std::string sanitized;
    sanitized.reserve(std::min(input.length(), maxLength));

    for (char c : input) {
        if (sanitized.length() >= maxLength) {
            sanitized += "...";
            break;
        }
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c >= 32 && c < 127) {
            sanitized += c;
        } else {
            sanitized += '?';
        }
    }

    return sanitized;
}

}  // namespace Log
}  // namespace RTE
