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

#include "runtime/StateManagerConfig.h"

namespace RTE {

std::string toString(AbsentStatePolicy policy) {
    switch (policy) {
    case AbsentStatePolicy::Forward:
        return "forward";
    case AbsentStatePolicy::Reject:
        return "reject";
    }
    return "unknown";
}

}  // namespace RTE
