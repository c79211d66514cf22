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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RTE {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by the change codec and the journal
 */
class JsonUtils {
public:
    /**
     * @brief Parse a JSON document without throwing
     * @param jsonString Input text
     * @param errorOut Receives the parser message on failure (optional)
     * @return Parsed value, or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Single-line serialization (no embedded newlines)
     */
    static std::string toCompactString(const json &value);

    /**
     * @brief String member of an object, or defaultValue when absent or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief True if key exists and is not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace RTE
