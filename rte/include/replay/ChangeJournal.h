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

#include "common/JsonUtils.h"
#include <cstddef>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Ordered, append-only history of encoded StateChanges
 *
 * Holds records produced by ChangeCodec::encode. The text form is JSON Lines
 * (one compact document per line); writing it to storage is left to the host.
 */
class ChangeJournal {
public:
    void append(json record);

    std::size_t size() const;
    bool empty() const;
    const std::vector<json> &records() const;
    void clear();

    /**
     * @brief One compact JSON document per line, each line newline-terminated
     */
    std::string toJsonLines() const;

    /**
     * @brief Parse text produced by toJsonLines()
     *
     * Blank lines are skipped; a trailing '\r' on a line is ignored.
     *
     * @throws ContractViolation naming the 1-based line number of the first
     *         line that is not valid JSON
     */
    static ChangeJournal fromJsonLines(const std::string &text);

private:
    std::vector<json> records_;
};

}  // namespace RTE
