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

#include "replay/ChangeCodec.h"
#include "replay/ChangeJournal.h"
#include "runtime/StateManager.h"
#include <optional>
#include <utility>
#include <vector>

namespace RTE {

/**
 * @brief StateManager that journals every committed change
 *
 * The change is encoded before it is dispatched, so a change the codec
 * cannot represent is refused (ContractViolation) without touching the state.
 * It is appended to the journal only after the dispatch committed; a dispatch
 * that throws leaves the journal unchanged. The journal therefore always
 * replays to the current state.
 */
template <DomainPolicy Domain> class RecordingStateManager {
public:
    using State = typename Domain::State;
    using StateChange = typename Domain::StateChange;
    using Event = typename Domain::Event;

    RecordingStateManager(StateManager<Domain> manager, ChangeCodec<Domain> codec)
        : manager_(std::move(manager)), codec_(std::move(codec)) {}

    std::vector<Event> dispatch(const StateChange &change) {
        json record = codec_.encode(change);
        auto events = manager_.dispatch(change);
        journal_.append(std::move(record));
        return events;
    }

    template <StateChangeOf<Domain> Change> std::vector<Event> dispatch(Change &&change) {
        return dispatch(StateChange(std::forward<Change>(change)));
    }

    std::vector<Event> dispatchAll(const std::vector<StateChange> &changes) {
        std::vector<Event> allEvents;
        for (const auto &change : changes) {
            auto events = dispatch(change);
            allEvents.insert(allEvents.end(), std::make_move_iterator(events.begin()),
                             std::make_move_iterator(events.end()));
        }
        return allEvents;
    }

    std::optional<State> currentState() const {
        return manager_.currentState();
    }

    const StateManager<Domain> &manager() const {
        return manager_;
    }

    const ChangeJournal &journal() const {
        return journal_;
    }

    const ChangeCodec<Domain> &codec() const {
        return codec_;
    }

private:
    StateManager<Domain> manager_;
    ChangeCodec<Domain> codec_;
    ChangeJournal journal_;
};

}  // namespace RTE
