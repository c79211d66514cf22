#include "common/CounterDomain.h"
#include "common/Logger.h"
#include "runtime/StateManager.h"
#include <cstddef>
#include <gtest/gtest.h>
#include <optional>
#include <utility>
#include <vector>

namespace RTE {

using namespace Test;

class ReplayDeterminismTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::Off);
    }

    void TearDown() override {
        Logger::setLevel(LogLevel::Info);
    }

    static std::vector<CounterChange> script() {
        return {Seed{1},     Increment{2}, Increment{-3}, Reset{},
                Increment{7}, Terminate{},  Increment{1},  Seed{4},
                Seed{5},      Unrecognized{"noise"},       Increment{10}};
    }
};

TEST_F(ReplayDeterminismTest, IndependentManagersAgreeAfterEveryStep) {
    StateManager<CounterDomain> first(&counterTransition, std::nullopt);
    StateManager<CounterDomain> second(&counterTransition, std::nullopt);

    for (const auto &change : script()) {
        auto a = first.dispatch(change);
        auto b = second.dispatch(change);
        EXPECT_EQ(a, b);
        EXPECT_EQ(first.currentState(), second.currentState());
    }

    ASSERT_TRUE(first.hasState());
    EXPECT_EQ(14, first.currentState()->value);
}

TEST_F(ReplayDeterminismTest, SameScriptTwiceGivesSameFinalState) {
    auto run = [] {
        StateManager<CounterDomain> manager(&counterTransition, CounterState{100, {"restored"}});
        auto events = manager.dispatchAll(script());
        return std::make_pair(manager.currentState(), events);
    };

    EXPECT_EQ(run(), run());
}

TEST_F(ReplayDeterminismTest, PrefixReplayMatchesIntermediateState) {
    const auto changes = script();
    StateManager<CounterDomain> full(&counterTransition, std::nullopt);
    std::vector<std::optional<CounterState>> checkpoints;
    for (const auto &change : changes) {
        full.dispatch(change);
        checkpoints.push_back(full.currentState());
    }

    for (std::size_t n = 1; n <= changes.size(); ++n) {
        StateManager<CounterDomain> partial(&counterTransition, std::nullopt);
        partial.dispatchAll(std::vector<CounterChange>(changes.begin(), changes.begin() + n));
        EXPECT_EQ(checkpoints[n - 1], partial.currentState()) << "after " << n << " change(s)";
    }
}

}  // namespace RTE
