/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include "AsyncHandle.h"
#include "CancellationToken.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    enum class RaceOutcome {
        Completed,      ///< The operation finished first (successfully or not)
        TimedOut,       ///< The delay elapsed first
        Cancelled       ///< The token was cancelled before either
    };

    template<typename T>
    struct RaceResult {
        RaceOutcome outcome = RaceOutcome::TimedOut;
        AsyncHandle<T> handle;

        bool completed() const noexcept { return outcome == RaceOutcome::Completed; }

        /// Result of the operation; only meaningful when completed()
        T get() const { return handle.get(); }
    };

    /**
     * @brief Race a running operation against a fixed delay
     *
     * Operations are never implicitly time-bounded; callers that want a timeout
     * race them. The operation keeps running when the delay wins; cancel its
     * token if it should stop.
     *
     * @code
     * auto race = raceWithTimeout(work.submitTask(load), std::chrono::seconds(30));
     * if (race.outcome == RaceOutcome::TimedOut) {
     *     tracker.failOperation("Operation timed out after 30 seconds");
     * }
     * @endcode
     */
    template<typename T>
    RaceResult<T> raceWithTimeout(const AsyncHandle<T>& handle,
                                  std::chrono::steady_clock::duration timeout,
                                  const CancellationToken& token = {}) {
        constexpr auto slice = std::chrono::milliseconds(10);
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;) {
            if (handle.isComplete()) return {RaceOutcome::Completed, handle};
            if (token.isCancellationRequested()) return {RaceOutcome::Cancelled, handle};

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return {RaceOutcome::TimedOut, handle};

            auto step = std::min<std::chrono::steady_clock::duration>(deadline - now, slice);
            if (handle.waitFor(step)) return {RaceOutcome::Completed, handle};
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
