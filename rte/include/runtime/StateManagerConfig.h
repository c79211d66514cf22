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

#include <string>

namespace RTE {

/**
 * @brief What dispatch does while the committed state is absent
 */
enum class AbsentStatePolicy {
    Forward,  // Invoke the transition with std::nullopt; it may re-seed a state
    Reject    // Treat the dispatch as a ContractViolation
};

std::string toString(AbsentStatePolicy policy);

struct StateManagerConfig {
    // Identifies the manager in log lines and error messages
    std::string name = "state-manager";
    AbsentStatePolicy absentStatePolicy = AbsentStatePolicy::Forward;
};

}  // namespace RTE
