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

#include "common/Logger.h"
#include "core/Errors.h"
#include "replay/ChangeCodec.h"
#include "replay/ChangeJournal.h"
#include "runtime/StateManager.h"
#include <cstddef>
#include <format>
#include <utility>
#include <vector>

namespace RTE {

template <DomainPolicy Domain> struct ReplayResult {
    std::vector<typename Domain::Event> events;
    std::size_t appliedRecords = 0;
};

/**
 * @brief Rebuilds state by feeding a journal through a StateManager
 *
 * Replay is all-or-nothing with respect to decoding: every record is decoded
 * before the first dispatch, so a corrupt journal is reported without
 * advancing the manager. Dispatch failures propagate like any other dispatch.
 *
 * @code
 * auto journal = RTE::ChangeJournal::fromJsonLines(text);
 * RTE::StateManager<LedgerDomain> restored(&Ledger::transition, std::nullopt);
 * auto result = RTE::Replayer<LedgerDomain>(codec).replay(restored, journal);
 * @endcode
 */
template <DomainPolicy Domain> class Replayer {
public:
    using StateChange = typename Domain::StateChange;
    using Event = typename Domain::Event;

    explicit Replayer(ChangeCodec<Domain> codec) : codec_(std::move(codec)) {}

    /**
     * @throws ContractViolation naming the 0-based index of the first undecodable record
     */
    ReplayResult<Domain> replay(StateManager<Domain> &manager, const ChangeJournal &journal) const {
        std::vector<StateChange> changes;
        changes.reserve(journal.size());

        const auto &records = journal.records();
        for (std::size_t i = 0; i < records.size(); ++i) {
            try {
                changes.push_back(codec_.decode(records[i]));
            } catch (const ContractViolation &e) {
                LOG_ERROR("Replayer: record {} of {} cannot be decoded: {}", i, records.size(), e.what());
                throw ContractViolation(std::format("Replayer: record {}: {}", i, e.what()));
            }
        }

        ReplayResult<Domain> result;
        for (const auto &change : changes) {
            auto events = manager.dispatch(change);
            result.events.insert(result.events.end(), std::make_move_iterator(events.begin()),
                                 std::make_move_iterator(events.end()));
            ++result.appliedRecords;
        }

        LOG_INFO("Replayer: applied {} record(s) to '{}', {} event(s) produced", result.appliedRecords,
                 manager.name(), result.events.size());
        return result;
    }

    /**
     * @brief Decode one external record and dispatch it
     */
    std::vector<Event> dispatchRecord(StateManager<Domain> &manager, const json &record) const {
        return manager.dispatch(codec_.decode(record));
    }

private:
    ChangeCodec<Domain> codec_;
};

}  // namespace RTE
