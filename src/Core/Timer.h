/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file Timer.h
 * @brief RAII handle for a scheduled one-shot or repeating callback
 *
 * Timers are created by TimerService::scheduleTimer(). The handle owns the
 * schedule: destroying or invalidating it stops future executions and waits for
 * an execution already in progress on another thread, so the callback may
 * safely capture the object that owns the Timer.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "Concurrency/ExecutionType.h"

namespace Cadence {
namespace Core {

class TimerService;

namespace detail {
    struct TimerData {
        using TimePoint = std::chrono::steady_clock::time_point;
        using Duration = std::chrono::steady_clock::duration;

        TimePoint fireTime;
        Duration interval{};
        std::function<void()> work;
        bool repeating = false;
        Concurrency::ExecutionType executionType = Concurrency::ExecutionType::AnyThread;

        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};      ///< One-shot timer has fired
        std::atomic<bool> inFlight{false};      ///< Queued or running; no overlapping runs
        std::atomic<uint64_t> fireCount{0};

        std::mutex runMutex;
        std::atomic<std::thread::id> runningThread{};
    };
}

/**
 * @brief A scheduled task that executes after a delay, optionally repeating
 *
 * @code
 * auto refresh = timerService.scheduleTimer(
 *     std::chrono::minutes(5),
 *     [this] { _loader.load(); },
 *     true  // Repeating
 * );
 *
 * // Cancel timer early
 * refresh.invalidate();
 * @endcode
 */
class Timer {
public:
    using TimePoint = detail::TimerData::TimePoint;
    using Duration = detail::TimerData::Duration;
    using WorkFunction = std::function<void()>;

    /// Default-constructed timers do nothing and are already invalid
    Timer() = default;

    Timer(Timer&& other) noexcept;

    /// Invalidates the current timer before taking ownership of the other
    Timer& operator=(Timer&& other) noexcept;

    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /**
     * @brief Cancels the timer and prevents future executions
     *
     * Thread-safe and idempotent. Blocks until an execution running on another
     * thread returns; from inside the callback it returns immediately.
     */
    void invalidate();

    /// @return true if the timer will still fire
    bool isValid() const;

    Duration getInterval() const { return _data ? _data->interval : Duration::zero(); }
    bool isRepeating() const { return _data && _data->repeating; }

    /// Number of completed executions
    uint64_t fireCount() const { return _data ? _data->fireCount.load(std::memory_order_acquire) : 0; }

private:
    friend class TimerService;

    explicit Timer(std::shared_ptr<detail::TimerData> data);

    std::shared_ptr<detail::TimerData> _data;
    std::atomic<bool> _valid{false};
};

} // namespace Core
} // namespace Cadence
