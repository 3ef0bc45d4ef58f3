/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

namespace Cadence {
namespace Core {
namespace Loaders {

    enum class LoadOutcome {
        Loaded,
        SkippedDuplicate,   ///< Another load was in flight; nothing was done
        Cancelled,
        Failed,
        TimedOut
    };

    inline const char* loadOutcomeToString(LoadOutcome outcome) {
        switch (outcome) {
            case LoadOutcome::Loaded: return "Loaded";
            case LoadOutcome::SkippedDuplicate: return "SkippedDuplicate";
            case LoadOutcome::Cancelled: return "Cancelled";
            case LoadOutcome::Failed: return "Failed";
            case LoadOutcome::TimedOut: return "TimedOut";
        }
        return "Unknown";
    }

} // namespace Loaders
} // namespace Core
} // namespace Cadence
