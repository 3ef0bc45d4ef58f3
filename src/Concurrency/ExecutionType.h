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
namespace Concurrency {

    /**
     * @brief Where a unit of work runs
     *
     * AnyThread work goes to the WorkService pool. MainThread work is queued on
     * the UI-confined dispatcher and only runs when its owner pumps it.
     */
    enum class ExecutionType {
        AnyThread,
        MainThread
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
