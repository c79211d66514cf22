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
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "core/Contracts.h"
#include "core/Errors.h"
#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace RTE {

/**
 * @brief Tag-based JSON encoding of a domain's StateChange alternatives
 *
 * Records have the shape {"type": "<tag>", "data": <payload>}. Payloads go
 * through nlohmann::json's ADL hooks (to_json/from_json or
 * NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE) of the alternative type.
 *
 * Decoding is the one place where untyped input enters the engine, so every
 * failure there is a ContractViolation: non-object record, missing or unknown
 * tag, or a payload that does not convert.
 *
 * @code
 * RTE::ChangeCodec<LedgerDomain> codec;
 * codec.registerType<Ledger::ActionInitChannel>("action_init_channel")
 *      .registerType<Ledger::Block>("block");
 * json record = codec.encode(Ledger::Block{42});
 * auto change = codec.decode(record);
 * @endcode
 */
template <DomainPolicy Domain> class ChangeCodec {
public:
    using StateChange = typename Domain::StateChange;

    /**
     * @brief Bind a tag to one StateChange alternative
     * @throws ConfigurationError for an empty tag, a tag already in use, or an
     *         alternative that already has a tag
     */
    template <StateChangeOf<Domain> Change> ChangeCodec &registerType(const std::string &tag) {
        constexpr std::size_t index = AlternativeIndex<Change, StateChange>::value;

        if (tag.empty()) {
            throw ConfigurationError("ChangeCodec: tag must not be empty");
        }
        if (decoders_.contains(tag)) {
            throw ConfigurationError(std::format("ChangeCodec: tag '{}' is already registered", tag));
        }
        if (auto it = encoders_.find(index); it != encoders_.end()) {
            throw ConfigurationError(
                std::format("ChangeCodec: alternative #{} is already registered as '{}'", index, it->second.tag));
        }

        encoders_.emplace(index, Encoder{tag, [](const StateChange &change) -> json {
                                             return json(std::get<Change>(change));
                                         }});
        decoders_.emplace(tag, [](const json &payload) -> StateChange {
            return StateChange(std::in_place_type<Change>, payload.get<Change>());
        });
        return *this;
    }

    bool isRegistered(const std::string &tag) const {
        return decoders_.contains(tag);
    }

    /**
     * @brief Registered tags in lexicographic order
     */
    std::vector<std::string> tags() const {
        std::vector<std::string> result;
        result.reserve(decoders_.size());
        for (const auto &entry : decoders_) {
            result.push_back(entry.first);
        }
        return result;
    }

    /**
     * @throws ContractViolation for a valueless change or an alternative without a tag
     */
    json encode(const StateChange &change) const {
        if (change.valueless_by_exception()) {
            throw ContractViolation("ChangeCodec: cannot encode a valueless StateChange");
        }

        auto it = encoders_.find(change.index());
        if (it == encoders_.end()) {
            throw ContractViolation(
                std::format("ChangeCodec: no tag registered for StateChange alternative #{}", change.index()));
        }

        return json{{"type", it->second.tag}, {"data", it->second.encode(change)}};
    }

    /**
     * @throws ContractViolation when the record is not a well-formed, registered change
     */
    StateChange decode(const json &record) const {
        if (!record.is_object()) {
            throw ContractViolation("ChangeCodec: record must be a JSON object");
        }

        const std::string tag = JsonUtils::getString(record, "type");
        if (tag.empty()) {
            throw ContractViolation("ChangeCodec: record has no string 'type' member");
        }

        auto it = decoders_.find(tag);
        if (it == decoders_.end()) {
            LOG_WARN("ChangeCodec: unknown StateChange tag '{}'", Log::sanitize(tag));
            throw ContractViolation(std::format("ChangeCodec: unknown StateChange tag '{}'", Log::sanitize(tag)));
        }

        const json payload = JsonUtils::hasKey(record, "data") ? record.at("data") : json::object();
        try {
            return it->second(payload);
        } catch (const json::exception &e) {
            throw ContractViolation(
                std::format("ChangeCodec: malformed payload for '{}': {}", Log::sanitize(tag), e.what()));
        }
    }

private:
    struct Encoder {
        std::string tag;
        std::function<json(const StateChange &)> encode;
    };

    std::map<std::size_t, Encoder> encoders_;
    std::map<std::string, std::function<StateChange(const json &)>> decoders_;
};

}  // namespace RTE
