#include "ChannelLedger.h"
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

namespace Ledger {

class ChannelLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        RTE::Logger::setLevel(RTE::LogLevel::Off);
    }

    void TearDown() override {
        RTE::Logger::setLevel(RTE::LogLevel::Info);
    }

    static ActionInitChannel init() {
        return ActionInitChannel{"0xa1", "0xalice", "0xbob", 100, 50};
    }

    RTE::StateManager<LedgerDomain> openChannel() {
        RTE::StateManager<LedgerDomain> manager(&transition, std::nullopt);
        manager.dispatch(init());
        return manager;
    }
};

TEST_F(ChannelLedgerTest, InitSeedsAbsentChannel) {
    auto manager = openChannel();

    auto state = manager.currentState();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ("0xa1", state->channelId);
    EXPECT_EQ(100, state->ourBalance);
    EXPECT_EQ(50, state->partnerBalance);
    EXPECT_FALSE(state->closed);
}

TEST_F(ChannelLedgerTest, InitIsIgnoredOnExistingChannel) {
    auto manager = openChannel();

    auto events = manager.dispatch(ActionInitChannel{"0xb2", "0xalice", "0xcarol", 1, 1});

    EXPECT_TRUE(events.empty());
    EXPECT_EQ("0xa1", manager.currentState()->channelId);
}

TEST_F(ChannelLedgerTest, ChangesBeforeInitAreNoOps) {
    RTE::StateManager<LedgerDomain> manager(&transition, std::nullopt);

    EXPECT_TRUE(manager.dispatch(ActionTransferDirect{1, 10}).empty());
    EXPECT_TRUE(manager.dispatch(Block{7}).empty());
    EXPECT_FALSE(manager.hasState());
}

TEST_F(ChannelLedgerTest, SendMovesBalanceAndEmitsMessageThenSuccess) {
    auto manager = openChannel();

    auto events = manager.dispatch(ActionTransferDirect{1, 30});

    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(LedgerEvent(SendDirectTransfer{"0xbob", 1, 30, 1}), events[0]);
    EXPECT_EQ(LedgerEvent(EventTransferSentSuccess{1, 30}), events[1]);
    EXPECT_EQ(70, manager.currentState()->ourBalance);
    EXPECT_EQ(80, manager.currentState()->partnerBalance);
}

TEST_F(ChannelLedgerTest, SendFailuresAreEventsNotErrors) {
    auto manager = openChannel();

    auto tooMuch = manager.dispatch(ActionTransferDirect{2, 500});
    auto zero = manager.dispatch(ActionTransferDirect{3, 0});

    ASSERT_EQ(1u, tooMuch.size());
    EXPECT_EQ(LedgerEvent(EventTransferSentFailed{2, "insufficient balance"}), tooMuch[0]);
    ASSERT_EQ(1u, zero.size());
    EXPECT_EQ(LedgerEvent(EventTransferSentFailed{3, "amount must be positive"}), zero[0]);
    EXPECT_EQ(100, manager.currentState()->ourBalance);
    EXPECT_EQ(0u, manager.currentState()->ourNonce);
}

TEST_F(ChannelLedgerTest, TransfersThatWouldOverflowBalanceAreRejected) {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    RTE::StateManager<LedgerDomain> sending(&transition, std::nullopt);
    sending.dispatch(ActionInitChannel{"0xc3", "0xalice", "0xbob", 10, max});

    auto sent = sending.dispatch(ActionTransferDirect{1, 1});

    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ(LedgerEvent(EventTransferSentFailed{1, "partner balance would overflow"}), sent[0]);
    EXPECT_EQ(10, sending.currentState()->ourBalance);
    EXPECT_EQ(max, sending.currentState()->partnerBalance);
    EXPECT_EQ(0u, sending.currentState()->ourNonce);

    RTE::StateManager<LedgerDomain> receiving(&transition, std::nullopt);
    receiving.dispatch(ActionInitChannel{"0xc4", "0xalice", "0xbob", max, 10});

    auto received = receiving.dispatch(ReceiveTransferDirect{2, 1, 1});

    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(LedgerEvent(EventTransferReceivedInvalid{2, "our balance would overflow"}), received[0]);
    EXPECT_EQ(max, receiving.currentState()->ourBalance);
    EXPECT_EQ(0u, receiving.currentState()->partnerNonce);
}

TEST_F(ChannelLedgerTest, ReceiveRequiresConsecutiveNonce) {
    auto manager = openChannel();

    auto skipped = manager.dispatch(ReceiveTransferDirect{9, 5, 2});
    auto accepted = manager.dispatch(ReceiveTransferDirect{9, 5, 1});
    auto replayed = manager.dispatch(ReceiveTransferDirect{9, 5, 1});

    EXPECT_EQ(LedgerEvent(EventTransferReceivedInvalid{9, "nonce 2 does not follow 0"}), skipped.at(0));
    EXPECT_EQ(LedgerEvent(EventTransferReceivedSuccess{9, 5}), accepted.at(0));
    EXPECT_EQ(LedgerEvent(EventTransferReceivedInvalid{9, "nonce 1 does not follow 1"}), replayed.at(0));
    EXPECT_EQ(105, manager.currentState()->ourBalance);
    EXPECT_EQ(45, manager.currentState()->partnerBalance);
}

TEST_F(ChannelLedgerTest, CloseThenSettleClearsChannel) {
    auto manager = openChannel();
    manager.dispatch(ActionTransferDirect{1, 40});

    auto closed = manager.dispatch(ContractReceiveChannelClosed{120, "0xbob"});
    auto lateSend = manager.dispatch(ActionTransferDirect{2, 1});
    auto settled = manager.dispatch(ContractReceiveChannelSettled{160});

    EXPECT_EQ(LedgerEvent(EventChannelClosed{"0xa1", 120}), closed.at(0));
    EXPECT_EQ(LedgerEvent(EventTransferSentFailed{2, "channel is closed"}), lateSend.at(0));
    EXPECT_EQ(LedgerEvent(EventChannelSettled{"0xa1", 60, 90}), settled.at(0));
    EXPECT_FALSE(manager.hasState());

    // A settled channel id can be opened again
    manager.dispatch(init());
    EXPECT_EQ(100, manager.currentState()->ourBalance);
}

TEST_F(ChannelLedgerTest, SettleOnOpenChannelIsNoOp) {
    auto manager = openChannel();

    EXPECT_TRUE(manager.dispatch(ContractReceiveChannelSettled{5}).empty());
    EXPECT_TRUE(manager.hasState());
}

TEST_F(ChannelLedgerTest, JournalReplayRestoresChannel) {
    auto builder = RTE::StateManagerBuilder<LedgerDomain>().withTransition(&transition).withName("channel-0xa1");
    RTE::RecordingStateManager<LedgerDomain> recorder(builder.build(), makeCodec());

    std::vector<LedgerEvent> live = recorder.dispatchAll({init(), ActionTransferDirect{1, 25}, Block{10},
                                                          ReceiveTransferDirect{2, 10, 1}, ActionTransferDirect{3, 999},
                                                          ContractReceiveChannelClosed{11, "0xalice"}});

    auto journal = RTE::ChangeJournal::fromJsonLines(recorder.journal().toJsonLines());
    auto restored = builder.withName("channel-0xa1-replay").build();
    auto result = RTE::Replayer<LedgerDomain>(makeCodec()).replay(restored, journal);

    EXPECT_EQ(6u, result.appliedRecords);
    EXPECT_EQ(live, result.events);
    EXPECT_EQ(recorder.currentState(), restored.currentState());
    EXPECT_TRUE(restored.currentState()->closed);
}

TEST_F(ChannelLedgerTest, DescribeRendersEvents) {
    EXPECT_EQ("transfer #4 of 12 sent", describe(EventTransferSentSuccess{4, 12}));
    EXPECT_EQ("channel 0xa1 closed at block 9", describe(EventChannelClosed{"0xa1", 9}));
    EXPECT_EQ("transfer #5 rejected: channel is closed", describe(EventTransferReceivedInvalid{5, "channel is closed"}));
}

}  // namespace Ledger
