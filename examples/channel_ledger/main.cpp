#include "ChannelLedger.h"
#include <iostream>
#include <vector>

int main() {
    using namespace Ledger;

    RTE::Logger::initialize();
    RTE::Logger::setLevel(RTE::LogLevel::Warn);

    std::cout << "=== Channel Ledger Example ===" << "\n\n";

    auto manager = RTE::StateManagerBuilder<LedgerDomain>()
                       .withTransition(&Ledger::transition)
                       .withName("channel-0xa1")
                       .build();
    RTE::RecordingStateManager<LedgerDomain> session(std::move(manager), makeCodec());

    std::vector<LedgerChange> changes = {
        ActionInitChannel{"0xa1", "0xalice", "0xbob", 100, 50},
        ActionTransferDirect{1, 30},
        ReceiveTransferDirect{2, 10, 1},
        ActionTransferDirect{3, 500},
        Block{1000},
        ContractReceiveChannelClosed{1001, "0xbob"},
        ContractReceiveChannelSettled{1101},
    };

    for (const auto &change : changes) {
        for (const auto &event : session.dispatch(change)) {
            std::cout << "  event: " << describe(event) << "\n";
        }
    }
    std::cout << "  state after settlement: " << (session.currentState() ? "present" : "absent") << "\n\n";

    // The journal text is what a node would persist; replaying it must reproduce the session
    const std::string journalText = session.journal().toJsonLines();
    std::cout << "Journal (" << session.journal().size() << " records):" << "\n" << journalText << "\n";

    RTE::StateManager<LedgerDomain> restored(&Ledger::transition, std::nullopt, {"channel-0xa1-replay"});
    auto result =
        RTE::Replayer<LedgerDomain>(makeCodec()).replay(restored, RTE::ChangeJournal::fromJsonLines(journalText));

    const bool sameState = restored.currentState() == session.currentState();
    std::cout << "Replayed " << result.appliedRecords << " records, " << result.events.size() << " events, "
              << (sameState ? "state matches" : "STATE MISMATCH") << "\n";

    return sameState ? 0 : 1;
}
