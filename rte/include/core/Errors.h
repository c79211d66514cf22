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

#include <stdexcept>
#include <string>

namespace RTE {

/**
 * @brief Invalid engine configuration detected at construction time
 *
 * Raised when the transition function is not invocable, or when a builder or
 * codec is configured inconsistently. The object being built is never usable.
 */
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Programmer error at the dispatch boundary
 *
 * Raised for an invalid input change, an Iteration that breaks the
 * State/Event contracts, or a record that cannot be decoded into a
 * StateChange. The engine never catches it; the owning session is expected
 * to terminate.
 */
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace RTE
