/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "TimerService.h"
#include <algorithm>
#include <format>
#include <stdexcept>
#include "Concurrency/IDispatcher.h"
#include "Concurrency/OperationErrors.h"
#include "Concurrency/WorkService.h"
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {

TimerService::TimerService()
    : TimerService(Config{}) {
}

TimerService::TimerService(const Config& config)
    : _config(config) {
}

TimerService::~TimerService() {
    stop();
}

std::vector<TypeSystem::TypeID> TimerService::dependsOnTypes() const {
    return {TypeSystem::createTypeId<Concurrency::WorkService>()};
}

void TimerService::start() {
    if (!_config.schedulerThread || _scheduler.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        _stopRequested = false;
    }
    _scheduler = std::thread([this] { schedulerLoop(); });
}

void TimerService::stop() {
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        _stopRequested = true;
        for (auto& timer : _timers) {
            timer->cancelled.store(true, std::memory_order_release);
        }
    }
    _timersCV.notify_all();
    if (_scheduler.joinable()) {
        _scheduler.join();
    }
}

void TimerService::unload() {
    std::lock_guard<std::mutex> lock(_timersMutex);
    _timers.clear();
    _workService = nullptr;
    _dispatcher = nullptr;
}

void TimerService::setWorkService(Concurrency::WorkService* workService) {
    std::lock_guard<std::mutex> lock(_timersMutex);
    _workService = workService;
}

void TimerService::setDispatcher(Concurrency::IDispatcher* dispatcher) {
    std::lock_guard<std::mutex> lock(_timersMutex);
    _dispatcher = dispatcher;
}

Timer TimerService::scheduleTimer(std::chrono::steady_clock::duration interval,
                                  Timer::WorkFunction work,
                                  bool repeating,
                                  Concurrency::ExecutionType executionType) {
    if (repeating && interval <= std::chrono::steady_clock::duration::zero()) {
        throw std::invalid_argument("Repeating timers need a positive interval");
    }

    auto timerData = std::make_shared<detail::TimerData>();
    timerData->fireTime = std::chrono::steady_clock::now() + interval;
    timerData->interval = interval;
    timerData->work = std::move(work);
    timerData->repeating = repeating;
    timerData->executionType = executionType;

    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        if (executionType == Concurrency::ExecutionType::AnyThread && !_workService) {
            throw std::runtime_error("TimerService not started - WorkService not set");
        }
        if (executionType == Concurrency::ExecutionType::MainThread && !_dispatcher) {
            throw std::runtime_error("TimerService has no dispatcher for main thread timers");
        }
        _timers.push_back(timerData);
    }
    _timersCV.notify_all();

    return Timer(timerData);
}

size_t TimerService::getActiveTimerCount() const {
    std::lock_guard<std::mutex> lock(_timersMutex);
    return static_cast<size_t>(std::count_if(_timers.begin(), _timers.end(), [](const auto& timer) {
        return !timer->cancelled.load(std::memory_order_acquire) &&
               !timer->finished.load(std::memory_order_acquire);
    }));
}

size_t TimerService::processReadyTimers() {
    std::vector<std::shared_ptr<detail::TimerData>> ready;
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        auto now = std::chrono::steady_clock::now();

        std::erase_if(_timers, [](const auto& timer) {
            return timer->cancelled.load(std::memory_order_acquire) ||
                   timer->finished.load(std::memory_order_acquire);
        });

        for (auto& timer : _timers) {
            if (timer->fireTime > now) continue;

            if (timer->repeating) {
                // Skip any missed intervals to avoid rapid catch-up firing
                do {
                    timer->fireTime += timer->interval;
                } while (timer->fireTime <= now);
            } else {
                // Dispatched exactly once; finished is set once it has run
                timer->fireTime = std::chrono::steady_clock::time_point::max();
            }

            if (timer->inFlight.exchange(true, std::memory_order_acq_rel)) {
                continue;   // previous execution still queued or running
            }
            ready.push_back(timer);
        }
    }

    for (auto& timer : ready) {
        dispatch(timer);
    }
    return ready.size();
}

namespace {
    void releaseUnrun(const std::shared_ptr<detail::TimerData>& timer) {
        if (!timer->repeating) {
            timer->finished.store(true, std::memory_order_release);
        }
        timer->inFlight.store(false, std::memory_order_release);
    }
}

void TimerService::dispatch(const std::shared_ptr<detail::TimerData>& timer) {
    Concurrency::WorkService* workService = nullptr;
    Concurrency::IDispatcher* dispatcher = nullptr;
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        workService = _workService;
        dispatcher = _dispatcher;
    }

    if (timer->executionType == Concurrency::ExecutionType::MainThread) {
        if (!dispatcher) {
            releaseUnrun(timer);
            CADENCE_LOG_WARNING_CAT("TimerService", "Main thread timer fired with no dispatcher set");
            return;
        }
        auto handle = dispatcher->invokeAsync([timer] { runTimer(timer); });
        handle.onComplete([timer, handle] {
            if (auto error = handle.error()) {
                releaseUnrun(timer);
                CADENCE_LOG_WARNING_CAT("TimerService", std::format("Main thread timer dropped: {}",
                                                                    Concurrency::describeException(error)));
            }
        });
        return;
    }

    auto result = workService ? workService->submit([timer] { runTimer(timer); })
                              : Concurrency::WorkService::SubmitResult::NotRunning;
    if (result != Concurrency::WorkService::SubmitResult::Scheduled) {
        releaseUnrun(timer);
        CADENCE_LOG_WARNING_CAT("TimerService", "Timer fired but the WorkService rejected it");
    }
}

void TimerService::runTimer(const std::shared_ptr<detail::TimerData>& timer) {
    std::lock_guard<std::mutex> lock(timer->runMutex);
    timer->runningThread.store(std::this_thread::get_id(), std::memory_order_release);

    if (!timer->cancelled.load(std::memory_order_acquire) && timer->work) {
        try {
            timer->work();
        } catch (const std::exception& e) {
            CADENCE_LOG_ERROR_CAT("TimerService", std::format("Timer callback threw: {}", e.what()));
        } catch (...) {
            CADENCE_LOG_ERROR_CAT("TimerService", "Timer callback threw a non-standard exception");
        }
        timer->fireCount.fetch_add(1, std::memory_order_acq_rel);
    }

    if (!timer->repeating) {
        timer->finished.store(true, std::memory_order_release);
    }
    timer->runningThread.store(std::thread::id{}, std::memory_order_release);
    timer->inFlight.store(false, std::memory_order_release);
}

void TimerService::schedulerLoop() {
    std::unique_lock<std::mutex> lock(_timersMutex);
    while (!_stopRequested) {
        auto next = std::chrono::steady_clock::time_point::max();
        for (auto& timer : _timers) {
            if (!timer->cancelled.load(std::memory_order_acquire)) {
                next = std::min(next, timer->fireTime);
            }
        }

        if (next == std::chrono::steady_clock::time_point::max()) {
            _timersCV.wait(lock);
        } else if (next > std::chrono::steady_clock::now()) {
            _timersCV.wait_until(lock, next);
        }
        if (_stopRequested) break;

        lock.unlock();
        processReadyTimers();
        lock.lock();
    }
}

} // namespace Core
} // namespace Cadence
