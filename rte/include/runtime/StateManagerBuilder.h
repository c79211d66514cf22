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

#include "core/Errors.h"
#include "runtime/StateManager.h"
#include "runtime/StateManagerConfig.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace RTE {

/**
 * @brief Fluent construction of a configured StateManager
 *
 * @code
 * auto manager = RTE::StateManagerBuilder<LedgerDomain>()
 *                    .withTransition(&Ledger::transition)
 *                    .withName("channel-0x42")
 *                    .withAbsentStatePolicy(RTE::AbsentStatePolicy::Forward)
 *                    .build();
 * @endcode
 */
template <DomainPolicy Domain> class StateManagerBuilder {
private:
    TransitionFunction<Domain> transition_;
    std::optional<typename Domain::State> initialState_;
    StateManagerConfig config_;

public:
    StateManagerBuilder() = default;

    StateManagerBuilder &withTransition(TransitionFunction<Domain> transition) {
        transition_ = std::move(transition);
        return *this;
    }

    /**
     * @brief Seed the manager; without this call it starts absent
     */
    StateManagerBuilder &withInitialState(typename Domain::State state) {
        initialState_ = std::move(state);
        return *this;
    }

    StateManagerBuilder &withName(const std::string &name) {
        config_.name = name;
        return *this;
    }

    StateManagerBuilder &withAbsentStatePolicy(AbsentStatePolicy policy) {
        config_.absentStatePolicy = policy;
        return *this;
    }

    StateManagerBuilder &withConfig(const StateManagerConfig &config) {
        config_ = config;
        return *this;
    }

    /**
     * @throws ConfigurationError if no invocable transition was supplied or the name is empty
     */
    StateManager<Domain> build() const {
        validate();
        return StateManager<Domain>(transition_, initialState_, config_);
    }

    /**
     * @brief Heap-allocated variant for owners that hand the manager around
     */
    std::unique_ptr<StateManager<Domain>> buildUnique() const {
        validate();
        return std::make_unique<StateManager<Domain>>(transition_, initialState_, config_);
    }

private:
    void validate() const {
        if (config_.name.empty()) {
            throw ConfigurationError("StateManagerBuilder: manager name must not be empty");
        }
        if (!transition_) {
            throw ConfigurationError(
                std::format("StateManagerBuilder '{}': withTransition() was not given an invocable", config_.name));
        }
    }
};

}  // namespace RTE
