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

#include "RTE.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace Ledger {

/**
 * @brief Off-chain view of one bidirectional payment channel
 *
 * Each side signs its own transfers, so nonces are tracked per direction.
 */
struct ChannelState {
    std::string channelId;
    std::string ourAddress;
    std::string partnerAddress;
    std::int64_t ourBalance = 0;
    std::int64_t partnerBalance = 0;
    std::uint64_t ourNonce = 0;
    std::uint64_t partnerNonce = 0;
    bool closed = false;

    bool operator==(const ChannelState &) const = default;
};

// State changes

struct ActionInitChannel {
    std::string channelId;
    std::string ourAddress;
    std::string partnerAddress;
    std::int64_t ourDeposit = 0;
    std::int64_t partnerDeposit = 0;
};

struct ActionTransferDirect {
    std::uint64_t paymentId = 0;
    std::int64_t amount = 0;
};

struct ReceiveTransferDirect {
    std::uint64_t paymentId = 0;
    std::int64_t amount = 0;
    std::uint64_t nonce = 0;
};

struct ContractReceiveChannelClosed {
    std::uint64_t blockNumber = 0;
    std::string closer;
};

struct ContractReceiveChannelSettled {
    std::uint64_t blockNumber = 0;
};

struct Block {
    std::uint64_t blockNumber = 0;
};

using LedgerChange = std::variant<ActionInitChannel, ActionTransferDirect, ReceiveTransferDirect,
                                  ContractReceiveChannelClosed, ContractReceiveChannelSettled, Block>;

// Events

struct SendDirectTransfer {
    std::string recipient;
    std::uint64_t paymentId = 0;
    std::int64_t amount = 0;
    std::uint64_t nonce = 0;

    bool operator==(const SendDirectTransfer &) const = default;
};

struct EventTransferSentSuccess {
    std::uint64_t paymentId = 0;
    std::int64_t amount = 0;

    bool operator==(const EventTransferSentSuccess &) const = default;
};

struct EventTransferSentFailed {
    std::uint64_t paymentId = 0;
    std::string reason;

    bool operator==(const EventTransferSentFailed &) const = default;
};

struct EventTransferReceivedSuccess {
    std::uint64_t paymentId = 0;
    std::int64_t amount = 0;

    bool operator==(const EventTransferReceivedSuccess &) const = default;
};

struct EventTransferReceivedInvalid {
    std::uint64_t paymentId = 0;
    std::string reason;

    bool operator==(const EventTransferReceivedInvalid &) const = default;
};

struct EventChannelClosed {
    std::string channelId;
    std::uint64_t blockNumber = 0;

    bool operator==(const EventChannelClosed &) const = default;
};

struct EventChannelSettled {
    std::string channelId;
    std::int64_t ourBalance = 0;
    std::int64_t partnerBalance = 0;

    bool operator==(const EventChannelSettled &) const = default;
};

using LedgerEvent = std::variant<SendDirectTransfer, EventTransferSentSuccess, EventTransferSentFailed,
                                 EventTransferReceivedSuccess, EventTransferReceivedInvalid, EventChannelClosed,
                                 EventChannelSettled>;

struct LedgerDomain {
    using State = ChannelState;
    using StateChange = LedgerChange;
    using Event = LedgerEvent;

    // Balances can never go negative through a valid transition
    static bool isValidState(const ChannelState &state) {
        return !state.channelId.empty() && state.ourBalance >= 0 && state.partnerBalance >= 0;
    }
};

static_assert(RTE::DomainPolicy<LedgerDomain>);

using LedgerIteration = RTE::Iteration<LedgerDomain>;

/**
 * @brief Transition function of the channel ledger
 *
 * ActionInitChannel seeds an absent state. ContractReceiveChannelSettled on a
 * closed channel clears it. Block and every change that does not apply to
 * the current state are no-ops.
 */
LedgerIteration transition(std::optional<ChannelState> state, const LedgerChange &change);

/**
 * @brief Codec with a tag for every LedgerChange alternative
 */
RTE::ChangeCodec<LedgerDomain> makeCodec();

/**
 * @brief One-line human-readable rendering of an event
 */
std::string describe(const LedgerEvent &event);

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ActionInitChannel, channelId, ourAddress, partnerAddress, ourDeposit,
                                   partnerDeposit)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ActionTransferDirect, paymentId, amount)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ReceiveTransferDirect, paymentId, amount, nonce)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ContractReceiveChannelClosed, blockNumber, closer)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ContractReceiveChannelSettled, blockNumber)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Block, blockNumber)

}  // namespace Ledger
