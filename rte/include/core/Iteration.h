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

#include "core/Contracts.h"
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace RTE {

/**
 * @brief Result of one transition: next state (or absence) plus ordered events
 *
 * An absent newState means the state was torn down. Events are delivered to
 * the caller in exactly this order.
 */
template <DomainPolicy Domain> struct Iteration {
    using State = typename Domain::State;
    using Event = typename Domain::Event;

    std::optional<State> newState;
    std::vector<Event> events;

    /**
     * @brief No-op result for changes the transition does not handle
     */
    static Iteration unchanged(std::optional<State> state) {
        return Iteration{std::move(state), {}};
    }

    static Iteration next(State state, std::vector<Event> events = {}) {
        return Iteration{std::optional<State>(std::move(state)), std::move(events)};
    }

    static Iteration cleared(std::vector<Event> events = {}) {
        return Iteration{std::nullopt, std::move(events)};
    }

    bool operator==(const Iteration &) const = default;
};

/**
 * @brief Pure mapping (State-or-absent, StateChange) -> Iteration
 *
 * The state argument is a private copy owned by the callee. An empty
 * std::function is rejected by StateManager with ConfigurationError.
 */
template <DomainPolicy Domain>
using TransitionFunction =
    std::function<Iteration<Domain>(std::optional<typename Domain::State>, const typename Domain::StateChange &)>;

}  // namespace RTE
