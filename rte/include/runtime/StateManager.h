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
#include "core/Contracts.h"
#include "core/Errors.h"
#include "core/Iteration.h"
#include "runtime/StateManagerConfig.h"
#include <cstddef>
#include <format>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RTE {

/**
 * @brief Single authoritative holder of a domain's state
 *
 * The state only changes through dispatch(): the transition function runs on
 * an isolated copy of the committed state, its Iteration is checked against
 * the State/Event contracts, and only then is the new state committed and the
 * events handed back. A dispatch that throws commits nothing.
 *
 * Single writer: the manager has no internal locking. Callers that receive
 * changes from several threads must serialize dispatch themselves (one
 * manager per session behind a queue or a mutex).
 *
 * @tparam Domain Policy naming State, StateChange and Event (see DomainPolicy).
 *         Optional static hooks: isValidState, isValidStateChange,
 *         isValidEvent, cloneState.
 *
 * @code
 * RTE::StateManager<LedgerDomain> manager(&Ledger::transition, std::nullopt);
 * auto events = manager.dispatch(Ledger::ActionInitChannel{...});
 * for (const auto &event : events) {
 *     std::visit(handlers, event);
 * }
 * @endcode
 */
template <DomainPolicy Domain> class StateManager {
public:
    using State = typename Domain::State;
    using StateChange = typename Domain::StateChange;
    using Event = typename Domain::Event;
    using IterationType = Iteration<Domain>;
    using Transition = TransitionFunction<Domain>;

    /**
     * @param transition Transition function, must be invocable
     * @param initialState Initial state, std::nullopt to start absent
     * @param config Name and absent-state policy
     * @throws ConfigurationError if transition is empty
     */
    StateManager(Transition transition, std::optional<State> initialState, StateManagerConfig config = {})
        : transition_(std::move(transition)), config_(std::move(config)) {
        if (!transition_) {
            LOG_ERROR("StateManager '{}': transition function is not invocable", config_.name);
            throw ConfigurationError(std::format("StateManager '{}': transition function must be invocable",
                                                 config_.name));
        }

        if (initialState) {
            currentState_ = std::make_unique<State>(std::move(*initialState));
        }

        LOG_INFO("StateManager '{}' created (initial state {}, absent-state policy {})", config_.name,
                 describePresence(hasState()), toString(config_.absentStatePolicy));
    }

    StateManager(const StateManager &) = delete;
    StateManager &operator=(const StateManager &) = delete;

    /**
     * @brief A moved-from manager has no transition; dispatching on it is a ContractViolation
     */
    StateManager(StateManager &&other)
        : transition_(std::exchange(other.transition_, nullptr)), currentState_(std::move(other.currentState_)),
          config_(std::move(other.config_)), dispatchCount_(std::exchange(other.dispatchCount_, 0)) {}

    StateManager &operator=(StateManager &&other) {
        if (this != &other) {
            transition_ = std::exchange(other.transition_, nullptr);
            currentState_ = std::move(other.currentState_);
            config_ = std::move(other.config_);
            dispatchCount_ = std::exchange(other.dispatchCount_, 0);
        }
        return *this;
    }

    /**
     * @brief Apply one change and return the events it produced, in order
     *
     * @throws ContractViolation for a valueless or domain-rejected change, for a
     *         dispatch against an absent state under AbsentStatePolicy::Reject,
     *         or for an Iteration that breaks the State/Event contracts.
     *         Exceptions from the transition function propagate unchanged.
     */
    std::vector<Event> dispatch(const StateChange &change) {
        if (!transition_) {
            raiseContractViolation("dispatch on a moved-from manager");
        }
        checkStateChange(change);

        if (!currentState_ && config_.absentStatePolicy == AbsentStatePolicy::Reject) {
            raiseContractViolation(
                std::format("dispatch of change #{} against an absent state is rejected", change.index()));
        }

        IterationType iteration = transition_(copyOf(currentState_.get()), change);
        checkIteration(iteration);

        // The commit below is a pointer swap; State assignment is never invoked
        std::unique_ptr<State> next;
        if (iteration.newState) {
            next = std::make_unique<State>(std::move(*iteration.newState));
        }

        // Commit
        const bool hadState = hasState();
        currentState_ = std::move(next);
        ++dispatchCount_;

        LOG_DEBUG("StateManager '{}': change #{} committed, state {} -> {}, {} event(s)", config_.name,
                  change.index(), describePresence(hadState), describePresence(hasState()),
                  iteration.events.size());

        return std::move(iteration.events);
    }

    /**
     * @brief Dispatch a single StateChange alternative
     *
     * Only alternatives of Domain::StateChange are accepted; anything else is
     * rejected at compile time.
     */
    template <StateChangeOf<Domain> Change> std::vector<Event> dispatch(Change &&change) {
        return dispatch(StateChange(std::forward<Change>(change)));
    }

    /**
     * @brief Dispatch changes in order and return the concatenated events
     *
     * Same result as calling dispatch() for each change. If one change throws,
     * the ones before it stay committed and the exception propagates.
     */
    std::vector<Event> dispatchAll(const std::vector<StateChange> &changes) {
        std::vector<Event> allEvents;
        for (const auto &change : changes) {
            auto events = dispatch(change);
            allEvents.insert(allEvents.end(), std::make_move_iterator(events.begin()),
                             std::make_move_iterator(events.end()));
        }
        return allEvents;
    }

    std::vector<Event> dispatchAll(std::initializer_list<StateChange> changes) {
        return dispatchAll(std::vector<StateChange>(changes));
    }

    /**
     * @brief Snapshot of the committed state (a copy, never a live reference)
     */
    std::optional<State> currentState() const {
        return copyOf(currentState_.get());
    }

    bool hasState() const {
        return currentState_ != nullptr;
    }

    /**
     * @brief Number of dispatches that committed since construction
     */
    std::size_t dispatchCount() const {
        return dispatchCount_;
    }

    const std::string &name() const {
        return config_.name;
    }

    const StateManagerConfig &config() const {
        return config_;
    }

private:
    Transition transition_;
    std::unique_ptr<State> currentState_;
    StateManagerConfig config_;
    std::size_t dispatchCount_ = 0;

    static const char *describePresence(bool present) {
        return present ? "present" : "absent";
    }

    static std::optional<State> copyOf(const State *state) {
        if (!state) {
            return std::nullopt;
        }
        if constexpr (HasStateCloner<Domain>) {
            return Domain::cloneState(*state);
        } else {
            return State(*state);
        }
    }

    void checkStateChange(const StateChange &change) const {
        if (change.valueless_by_exception()) {
            raiseContractViolation("dispatch received a valueless StateChange");
        }
        if constexpr (HasStateChangeValidator<Domain>) {
            if (!Domain::isValidStateChange(change)) {
                raiseContractViolation(
                    std::format("StateChange #{} rejected by the domain contract", change.index()));
            }
        }
    }

    void checkIteration(const IterationType &iteration) const {
        if constexpr (HasStateValidator<Domain>) {
            if (iteration.newState && !Domain::isValidState(*iteration.newState)) {
                raiseContractViolation("transition returned a state that violates the State contract");
            }
        }

        for (std::size_t i = 0; i < iteration.events.size(); ++i) {
            const Event &event = iteration.events[i];
            if (event.valueless_by_exception()) {
                raiseContractViolation(std::format("transition returned a valueless event at position {}", i));
            }
            if constexpr (HasEventValidator<Domain>) {
                if (!Domain::isValidEvent(event)) {
                    raiseContractViolation(std::format(
                        "event #{} at position {} violates the Event contract", event.index(), i));
                }
            }
        }
    }

    [[noreturn]] void raiseContractViolation(const std::string &message) const {
        LOG_ERROR("StateManager '{}': contract violation: {}", config_.name, message);
        throw ContractViolation(std::format("StateManager '{}': {}", config_.name, message));
    }
};

}  // namespace RTE
