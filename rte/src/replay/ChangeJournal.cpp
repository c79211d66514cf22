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

#include "replay/ChangeJournal.h"
#include "common/Logger.h"
#include "core/Errors.h"
#include <algorithm>
#include <cctype>
#include <format>
#include <sstream>
#include <utility>

namespace RTE {

void ChangeJournal::append(json record) {
    records_.push_back(std::move(record));
}

std::size_t ChangeJournal::size() const {
    return records_.size();
}

bool ChangeJournal::empty() const {
    return records_.empty();
}

const std::vector<json> &ChangeJournal::records() const {
    return records_;
}

void ChangeJournal::clear() {
    records_.clear();
}

std::string ChangeJournal::toJsonLines() const {
    std::string text;
    for (const auto &record : records_) {
        text += JsonUtils::toCompactString(record);
        text += '\n';
    }
    return text;
}

ChangeJournal ChangeJournal::fromJsonLines(const std::string &text) {
    ChangeJournal journal;
    std::istringstream stream(text);
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(stream, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) {
            continue;
        }

        std::string error;
        auto record = JsonUtils::parseJson(line, &error);
        if (!record) {
            LOG_ERROR("ChangeJournal: line {} is not valid JSON: {}", lineNumber, error);
            throw ContractViolation(std::format("ChangeJournal: line {} is not valid JSON: {}", lineNumber, error));
        }
        journal.append(std::move(*record));
    }

    LOG_DEBUG("ChangeJournal: parsed {} record(s) from {} line(s)", journal.size(), lineNumber);
    return journal;
}

}  // namespace RTE
