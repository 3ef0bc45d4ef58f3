/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file TimerService.h
 * @brief Service for scheduling delayed and repeating timers
 *
 * A single scheduler thread sleeps until the earliest fire time and hands
 * ready timers to the WorkService (AnyThread) or to the UI dispatcher
 * (MainThread). Hosts that prefer to drive timers from their own loop can turn
 * the scheduler thread off and call processReadyTimers() instead.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "CadenceService.h"
#include "Timer.h"
#include "Concurrency/ExecutionType.h"
#include "TypeSystem/TypeID.h"

namespace Cadence {
namespace Core {

namespace Concurrency {
    class WorkService;
    class IDispatcher;
}

/**
 * @brief Service for managing one-shot and repeating timers
 *
 * Repeating timers keep absolute fire times to avoid drift and skip missed
 * intervals instead of firing a burst to catch up. A repeating timer whose
 * previous execution has not finished is not queued again.
 *
 * @code
 * auto timers = std::make_shared<TimerService>();
 * timers->setWorkService(work.get());
 * timers->setDispatcher(&app.dispatcher());
 * timers->start();
 *
 * auto poll = timers->scheduleTimer(
 *     std::chrono::minutes(5),
 *     [&] { loader.load(); },
 *     true  // Repeating
 * );
 * @endcode
 */
class TimerService : public CadenceService {
public:
    struct Config {
        bool schedulerThread = true;    ///< false: the host calls processReadyTimers()
    };

    TimerService();
    explicit TimerService(const Config& config);

    /// Stops the scheduler and cancels all active timers
    ~TimerService() override;

    const char* id() const override { return "com.cadence.core.timers"; }
    const char* name() const override { return "TimerService"; }
    TypeSystem::TypeID typeId() const override {
        return TypeSystem::createTypeId<TimerService>();
    }
    std::vector<TypeSystem::TypeID> dependsOnTypes() const override;

    void start() override;
    void stop() override;
    void unload() override;

    /// Executor for AnyThread timers; must be set before scheduling them
    void setWorkService(Concurrency::WorkService* workService);

    /// Executor for MainThread timers; must be set before scheduling them
    void setDispatcher(Concurrency::IDispatcher* dispatcher);

    /**
     * @brief Schedules work to execute after a delay
     *
     * Thread-safe. Can be called from any thread.
     *
     * @param interval Time to wait before first execution (and between repeats)
     * @param work Function to execute when timer fires
     * @param repeating If true, timer repeats; if false, fires once
     * @param executionType Where to execute: MainThread or AnyThread
     * @return Timer handle for cancellation and status checking
     * @throws std::runtime_error if the required executor was not set
     * @throws std::invalid_argument for a repeating timer with a zero interval
     */
    Timer scheduleTimer(std::chrono::steady_clock::duration interval,
                        Timer::WorkFunction work,
                        bool repeating = false,
                        Concurrency::ExecutionType executionType = Concurrency::ExecutionType::AnyThread);

    /// Count of timers that haven't been cancelled or completed
    size_t getActiveTimerCount() const;

    /**
     * @brief Hands every due timer to its executor
     * @return Number of timers dispatched
     */
    size_t processReadyTimers();

private:
    void schedulerLoop();
    void dispatch(const std::shared_ptr<detail::TimerData>& timer);
    static void runTimer(const std::shared_ptr<detail::TimerData>& timer);

    Config _config;
    Concurrency::WorkService* _workService = nullptr;
    Concurrency::IDispatcher* _dispatcher = nullptr;

    mutable std::mutex _timersMutex;
    std::condition_variable _timersCV;
    std::vector<std::shared_ptr<detail::TimerData>> _timers;
    bool _stopRequested = false;
    std::thread _scheduler;
};

} // namespace Core
} // namespace Cadence
