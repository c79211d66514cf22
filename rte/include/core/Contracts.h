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

#include <concepts>
#include <cstddef>
#include <type_traits>
#include <variant>

namespace RTE {

/**
 * @brief Compile-time contracts for the three marker categories
 *
 * A domain plugs into the engine through a policy type that names:
 * - State:       value-semantic snapshot (copyable, equality comparable)
 * - StateChange: closed std::variant of change records
 * - Event:       closed std::variant of event records
 *
 * Closed variant sets replace runtime category checks: a type that is not an
 * alternative of Domain::StateChange cannot be dispatched at all.
 *
 * @code
 * struct CounterDomain {
 *     using State = CounterState;
 *     using StateChange = std::variant<Increment, Reset>;
 *     using Event = std::variant<ValueChanged, Rejected>;
 * };
 * static_assert(RTE::DomainPolicy<CounterDomain>);
 * @endcode
 */

template <typename T> struct IsVariant : std::false_type {};

template <typename... Ts> struct IsVariant<std::variant<Ts...>> : std::true_type {};

template <typename T, typename Variant> struct IsAlternativeOf : std::false_type {};

template <typename T, typename... Ts>
struct IsAlternativeOf<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename T, typename... Ts>
inline constexpr std::size_t OccurrencesOf = (std::size_t{0} + ... + (std::is_same_v<T, Ts> ? 1 : 0));

template <typename Variant> struct HasUniqueAlternatives : std::false_type {};

template <typename... Ts>
struct HasUniqueAlternatives<std::variant<Ts...>> : std::bool_constant<((OccurrencesOf<Ts, Ts...> == 1) && ...)> {};

/**
 * @brief Position of T inside std::variant<Ts...>
 *
 * Only meaningful when IsAlternativeOf<T, Variant> holds.
 */
template <typename T, typename Variant> struct AlternativeIndex;

template <typename T, typename... Ts> struct AlternativeIndex<T, std::variant<Ts...>> {
    static constexpr std::size_t value = [] {
        std::size_t index = 0;
        // Stops at the first match
        static_cast<void>(((std::is_same_v<T, Ts> ? false : (++index, true)) && ...));
        return index;
    }();
};

template <typename V>
concept SealedVariant = IsVariant<V>::value && HasUniqueAlternatives<V>::value;

template <typename S>
concept StateContract = std::copyable<S> && std::equality_comparable<S> && !std::is_pointer_v<S>;

template <typename C>
concept StateChangeContract = SealedVariant<C> && std::copyable<C>;

template <typename E>
concept EventContract = SealedVariant<E> && std::copyable<E> && std::equality_comparable<E>;

template <typename D>
concept DomainPolicy = requires {
    typename D::State;
    typename D::StateChange;
    typename D::Event;
} && StateContract<typename D::State> && StateChangeContract<typename D::StateChange> &&
                       EventContract<typename D::Event>;

template <typename Change, typename Domain>
concept StateChangeOf = DomainPolicy<Domain> && IsAlternativeOf<std::remove_cvref_t<Change>,
                                                                typename Domain::StateChange>::value;

// Optional domain hooks, detected with requires-expressions

template <typename D>
concept HasStateValidator = requires(const typename D::State &state) {
    { D::isValidState(state) } -> std::convertible_to<bool>;
};

template <typename D>
concept HasStateChangeValidator = requires(const typename D::StateChange &change) {
    { D::isValidStateChange(change) } -> std::convertible_to<bool>;
};

template <typename D>
concept HasEventValidator = requires(const typename D::Event &event) {
    { D::isValidEvent(event) } -> std::convertible_to<bool>;
};

template <typename D>
concept HasStateCloner = requires(const typename D::State &state) {
    { D::cloneState(state) } -> std::same_as<typename D::State>;
};

/**
 * @brief Visitor combinator for exhaustive std::visit over a sealed variant
 *
 * A missing alternative is a compile error, which is what makes transition
 * functions total over their StateChange set.
 */
template <typename... Fs> struct Overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

}  // namespace RTE
