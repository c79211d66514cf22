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

// Public API in one include

#include "common/Logger.h"
#include "core/Contracts.h"
#include "core/Errors.h"
#include "core/Iteration.h"
#include "replay/ChangeCodec.h"
#include "replay/ChangeJournal.h"
#include "replay/RecordingStateManager.h"
#include "replay/Replayer.h"
#include "runtime/StateManager.h"
#include "runtime/StateManagerBuilder.h"
#include "runtime/StateManagerConfig.h"
