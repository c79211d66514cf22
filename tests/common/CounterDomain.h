#pragma once

#include "core/Contracts.h"
#include "core/Iteration.h"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace RTE {
namespace Test {

struct CounterState {
    std::int64_t value = 0;
    std::vector<std::string> history;

    bool operator==(const CounterState &) const = default;
};

// State changes
struct Increment {
    std::int64_t amount = 1;
};

struct Reset {};

struct Terminate {};

struct Seed {
    std::int64_t value = 0;
};

// Never handled by counterTransition
struct Unrecognized {
    std::string note;
};

using CounterChange = std::variant<Increment, Reset, Terminate, Seed, Unrecognized>;

// Events
struct ValueChanged {
    std::int64_t from = 0;
    std::int64_t to = 0;

    bool operator==(const ValueChanged &) const = default;
};

struct Rejected {
    std::string reason;

    bool operator==(const Rejected &) const = default;
};

struct Terminated {
    bool operator==(const Terminated &) const = default;
};

using CounterEvent = std::variant<ValueChanged, Rejected, Terminated>;

struct CounterDomain {
    using State = CounterState;
    using StateChange = CounterChange;
    using Event = CounterEvent;
};

using CounterIteration = Iteration<CounterDomain>;

/**
 * @brief Reference transition used across the runtime and replay tests
 *
 * - Increment: adds a positive amount, rejects others (and overflowing sums) with a Rejected event
 * - Reset: value back to zero
 * - Terminate: clears the state
 * - Seed: creates a state when absent, rejected otherwise
 * - Unrecognized: no-op
 */
inline CounterIteration counterTransition(std::optional<CounterState> state, const CounterChange &change) {
    return std::visit(
        Overloaded{
            [&](const Increment &inc) -> CounterIteration {
                if (!state) {
                    return CounterIteration::unchanged(std::nullopt);
                }
                if (inc.amount <= 0) {
                    return CounterIteration::next(std::move(*state), {Rejected{"non-positive increment"}});
                }
                if (inc.amount > std::numeric_limits<std::int64_t>::max() - state->value) {
                    return CounterIteration::next(std::move(*state), {Rejected{"increment overflows"}});
                }
                const std::int64_t from = state->value;
                const std::int64_t to = from + inc.amount;
                state->value = to;
                state->history.push_back("increment");
                return CounterIteration::next(std::move(*state), {ValueChanged{from, to}});
            },
            [&](const Reset &) -> CounterIteration {
                if (!state) {
                    return CounterIteration::unchanged(std::nullopt);
                }
                const std::int64_t from = state->value;
                state->value = 0;
                state->history.push_back("reset");
                return CounterIteration::next(std::move(*state), {ValueChanged{from, 0}});
            },
            [&](const Terminate &) -> CounterIteration { return CounterIteration::cleared({Terminated{}}); },
            [&](const Seed &seed) -> CounterIteration {
                if (state) {
                    return CounterIteration::next(std::move(*state), {Rejected{"already seeded"}});
                }
                return CounterIteration::next(CounterState{seed.value, {"seed"}});
            },
            [&](const Unrecognized &) -> CounterIteration { return CounterIteration::unchanged(std::move(state)); },
        },
        change);
}

// JSON hooks for the codec tests
inline void to_json(nlohmann::json &j, const Increment &v) {
    j = nlohmann::json{{"amount", v.amount}};
}

inline void from_json(const nlohmann::json &j, Increment &v) {
    j.at("amount").get_to(v.amount);
}

inline void to_json(nlohmann::json &j, const Reset &) {
    j = nlohmann::json::object();
}

inline void from_json(const nlohmann::json &, Reset &) {}

inline void to_json(nlohmann::json &j, const Terminate &) {
    j = nlohmann::json::object();
}

inline void from_json(const nlohmann::json &, Terminate &) {}

inline void to_json(nlohmann::json &j, const Seed &v) {
    j = nlohmann::json{{"value", v.value}};
}

inline void from_json(const nlohmann::json &j, Seed &v) {
    j.at("value").get_to(v.value);
}

inline void to_json(nlohmann::json &j, const Unrecognized &v) {
    j = nlohmann::json{{"note", v.note}};
}

inline void from_json(const nlohmann::json &j, Unrecognized &v) {
    j.at("note").get_to(v.note);
}

}  // namespace Test
}  // namespace RTE
