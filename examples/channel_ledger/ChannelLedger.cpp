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

#include "ChannelLedger.h"
#include <format>
#include <limits>
#include <utility>

namespace Ledger {

namespace {

constexpr std::int64_t MAX_BALANCE = std::numeric_limits<std::int64_t>::max();

LedgerIteration handleInit(std::optional<ChannelState> state, const ActionInitChannel &action) {
    // An open or closed channel is never re-initialized
    if (state || action.channelId.empty() || action.ourDeposit < 0 || action.partnerDeposit < 0) {
        return LedgerIteration::unchanged(std::move(state));
    }

    ChannelState channel;
    channel.channelId = action.channelId;
    channel.ourAddress = action.ourAddress;
    channel.partnerAddress = action.partnerAddress;
    channel.ourBalance = action.ourDeposit;
    channel.partnerBalance = action.partnerDeposit;
    return LedgerIteration::next(std::move(channel));
}

LedgerIteration handleSend(std::optional<ChannelState> state, const ActionTransferDirect &action) {
    if (!state) {
        return LedgerIteration::unchanged(std::nullopt);
    }

    std::string failure;
    if (state->closed) {
        failure = "channel is closed";
    } else if (action.amount <= 0) {
        failure = "amount must be positive";
    } else if (action.amount > state->ourBalance) {
        failure = "insufficient balance";
    } else if (action.amount > MAX_BALANCE - state->partnerBalance) {
        failure = "partner balance would overflow";
    }
    if (!failure.empty()) {
        return LedgerIteration::next(std::move(*state), {EventTransferSentFailed{action.paymentId, failure}});
    }

    state->ourBalance -= action.amount;
    state->partnerBalance += action.amount;
    state->ourNonce += 1;

    SendDirectTransfer message{state->partnerAddress, action.paymentId, action.amount, state->ourNonce};
    return LedgerIteration::next(std::move(*state),
                                 {std::move(message), EventTransferSentSuccess{action.paymentId, action.amount}});
}

LedgerIteration handleReceive(std::optional<ChannelState> state, const ReceiveTransferDirect &message) {
    if (!state) {
        return LedgerIteration::unchanged(std::nullopt);
    }

    std::string invalid;
    if (state->closed) {
        invalid = "channel is closed";
    } else if (message.nonce != state->partnerNonce + 1) {
        invalid = std::format("nonce {} does not follow {}", message.nonce, state->partnerNonce);
    } else if (message.amount <= 0) {
        invalid = "amount must be positive";
    } else if (message.amount > state->partnerBalance) {
        invalid = "partner balance exceeded";
    } else if (message.amount > MAX_BALANCE - state->ourBalance) {
        invalid = "our balance would overflow";
    }
    if (!invalid.empty()) {
        return LedgerIteration::next(std::move(*state), {EventTransferReceivedInvalid{message.paymentId, invalid}});
    }

    state->partnerBalance -= message.amount;
    state->ourBalance += message.amount;
    state->partnerNonce = message.nonce;
    return LedgerIteration::next(std::move(*state), {EventTransferReceivedSuccess{message.paymentId, message.amount}});
}

LedgerIteration handleClosed(std::optional<ChannelState> state, const ContractReceiveChannelClosed &event) {
    if (!state || state->closed) {
        return LedgerIteration::unchanged(std::move(state));
    }

    state->closed = true;
    EventChannelClosed closed{state->channelId, event.blockNumber};
    return LedgerIteration::next(std::move(*state), {std::move(closed)});
}

LedgerIteration handleSettled(std::optional<ChannelState> state, const ContractReceiveChannelSettled &) {
    if (!state || !state->closed) {
        return LedgerIteration::unchanged(std::move(state));
    }

    return LedgerIteration::cleared({EventChannelSettled{state->channelId, state->ourBalance, state->partnerBalance}});
}

}  // namespace

LedgerIteration transition(std::optional<ChannelState> state, const LedgerChange &change) {
    return std::visit(
        RTE::Overloaded{
            [&](const ActionInitChannel &action) { return handleInit(std::move(state), action); },
            [&](const ActionTransferDirect &action) { return handleSend(std::move(state), action); },
            [&](const ReceiveTransferDirect &message) { return handleReceive(std::move(state), message); },
            [&](const ContractReceiveChannelClosed &event) { return handleClosed(std::move(state), event); },
            [&](const ContractReceiveChannelSettled &event) { return handleSettled(std::move(state), event); },
            [&](const Block &) { return LedgerIteration::unchanged(std::move(state)); },
        },
        change);
}

RTE::ChangeCodec<LedgerDomain> makeCodec() {
    RTE::ChangeCodec<LedgerDomain> codec;
    codec.registerType<ActionInitChannel>("action_init_channel")
        .registerType<ActionTransferDirect>("action_transfer_direct")
        .registerType<ReceiveTransferDirect>("receive_transfer_direct")
        .registerType<ContractReceiveChannelClosed>("contract_receive_channel_closed")
        .registerType<ContractReceiveChannelSettled>("contract_receive_channel_settled")
        .registerType<Block>("block");
    return codec;
}

std::string describe(const LedgerEvent &event) {
    return std::visit(
        RTE::Overloaded{
            [](const SendDirectTransfer &e) {
                return std::format("send direct transfer #{} of {} to {} (nonce {})", e.paymentId, e.amount,
                                   e.recipient, e.nonce);
            },
            [](const EventTransferSentSuccess &e) {
                return std::format("transfer #{} of {} sent", e.paymentId, e.amount);
            },
            [](const EventTransferSentFailed &e) {
                return std::format("transfer #{} failed: {}", e.paymentId, e.reason);
            },
            [](const EventTransferReceivedSuccess &e) {
                return std::format("transfer #{} of {} received", e.paymentId, e.amount);
            },
            [](const EventTransferReceivedInvalid &e) {
                return std::format("transfer #{} rejected: {}", e.paymentId, e.reason);
            },
            [](const EventChannelClosed &e) {
                return std::format("channel {} closed at block {}", e.channelId, e.blockNumber);
            },
            [](const EventChannelSettled &e) {
                return std::format("channel {} settled ({} / {})", e.channelId, e.ourBalance, e.partnerBalance);
            },
        },
        event);
}

}  // namespace Ledger
