/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <string>
#include <utility>

namespace Cadence {
namespace Core {
namespace Progress {

    /// One named phase of a multi-step operation
    struct ProgressStep {
        std::string title;
        std::string description;
        bool isCompleted = false;
        bool isInProgress = false;

        ProgressStep() = default;
        ProgressStep(std::string stepTitle, std::string stepDescription = {})
            : title(std::move(stepTitle)), description(std::move(stepDescription)) {}

        bool operator==(const ProgressStep&) const = default;
    };

} // namespace Progress
} // namespace Core
} // namespace Cadence
