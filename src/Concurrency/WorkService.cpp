/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "WorkService.h"
#include <algorithm>
#include <format>
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    WorkService::WorkService()
        : WorkService(Config{}) {
    }

    WorkService::WorkService(const Config& config)
        : _config(config) {
        _threadCount = config.threadCount != 0
            ? config.threadCount
            : std::max(1u, std::thread::hardware_concurrency());
    }

    WorkService::~WorkService() {
        requestStop();
        waitForStop();
    }

    void WorkService::start() {
        std::lock_guard<std::mutex> joinLock(_joinMutex);
        if (_running.load(std::memory_order_acquire)) return;
        {
            std::lock_guard<std::mutex> lock(_queueMutex);
            _stopRequested = false;
        }
        _running.store(true, std::memory_order_release);
        _workers.reserve(_threadCount);
        for (size_t i = 0; i < _threadCount; ++i) {
            _workers.emplace_back([this] { workerLoop(); });
        }
        CADENCE_LOG_DEBUG_CAT("WorkService", std::format("Started {} worker threads", _threadCount));
    }

    void WorkService::stop() {
        requestStop();
        waitForStop();
    }

    void WorkService::requestStop() {
        {
            std::lock_guard<std::mutex> lock(_queueMutex);
            _stopRequested = true;
        }
        _queueCV.notify_all();
    }

    void WorkService::waitForStop() {
        std::lock_guard<std::mutex> joinLock(_joinMutex);
        for (auto& worker : _workers) {
            if (!worker.joinable()) continue;
            if (worker.get_id() == std::this_thread::get_id()) {
                // Stopped from one of our own work items; it exits after draining
                worker.detach();
            } else {
                worker.join();
            }
        }
        _workers.clear();
        _running.store(false, std::memory_order_release);
    }

    WorkService::SubmitResult WorkService::submit(std::function<void()> work) {
        {
            std::lock_guard<std::mutex> lock(_queueMutex);
            if (!_running.load(std::memory_order_acquire) || _stopRequested) {
                return SubmitResult::NotRunning;
            }
            if (_config.maxQueuedWork != 0 && _queue.size() >= _config.maxQueuedWork) {
                return SubmitResult::QueueFull;
            }
            _queue.push_back(std::move(work));
        }
        _queueCV.notify_one();
        return SubmitResult::Scheduled;
    }

    size_t WorkService::pendingCount() const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return _queue.size();
    }

    bool WorkService::isWorkerThread() const {
        auto self = std::this_thread::get_id();
        return std::any_of(_workers.begin(), _workers.end(),
                           [self](const std::thread& t) { return t.get_id() == self; });
    }

    void WorkService::workerLoop() {
        for (;;) {
            std::function<void()> work;
            {
                std::unique_lock<std::mutex> lock(_queueMutex);
                _queueCV.wait(lock, [this] { return _stopRequested || !_queue.empty(); });
                if (_queue.empty()) return;  // stop requested and drained
                work = std::move(_queue.front());
                _queue.pop_front();
            }

            try {
                work();
            } catch (const std::exception& e) {
                CADENCE_LOG_ERROR_CAT("WorkService", std::format("Unhandled exception in work item: {}", e.what()));
            } catch (...) {
                CADENCE_LOG_ERROR_CAT("WorkService", "Unhandled non-standard exception in work item");
            }
            _executed.fetch_add(1, std::memory_order_relaxed);
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
