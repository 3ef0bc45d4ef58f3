/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file WorkService.h
 * @brief General-purpose worker pool service
 *
 * WorkService owns the background threads that run operations, retries and
 * timer callbacks. It is a CadenceService: threads are created in start() and
 * joined in stop(). Work already queued when stop() is requested still runs, so
 * every handle returned by submitTask() reaches a terminal state.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "Core/CadenceService.h"
#include "AsyncHandle.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    /**
     * @brief Thread pool with a single FIFO queue
     *
     * @code
     * WorkService::Config config;
     * config.threadCount = 4;
     * WorkService work(config);
     * work.start();
     *
     * auto handle = work.submitTask([] { return fetchAll(); });
     * auto rows = handle.get();
     *
     * work.requestStop();
     * work.waitForStop();
     * @endcode
     */
    class WorkService : public CadenceService {
    public:
        struct Config {
            uint32_t threadCount = 0;        ///< 0 means std::thread::hardware_concurrency()
            size_t maxQueuedWork = 0;        ///< 0 means unbounded
        };

        enum class SubmitResult {
            Scheduled,
            NotRunning,
            QueueFull
        };

        WorkService();
        explicit WorkService(const Config& config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        const char* id() const override { return "com.cadence.core.work"; }
        const char* name() const override { return "WorkService"; }
        TypeSystem::TypeID typeId() const override { return TypeSystem::createTypeId<WorkService>(); }

        void start() override;
        void stop() override;

        /// Ask workers to exit once the queue is drained
        void requestStop();

        /// Join all workers; no-op if never started
        void waitForStop();

        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        SubmitResult submit(std::function<void()> work);

        /**
         * @brief Submit fn and get a handle for its result
         *
         * If the pool rejects the work the handle is already Failed.
         */
        template<typename Fn>
        auto submitTask(Fn&& fn) -> AsyncHandle<std::invoke_result_t<Fn>> {
            using R = std::invoke_result_t<Fn>;
            auto promise = std::make_shared<AsyncPromise<R>>();
            auto handle = promise->handle();
            auto result = submit([promise, f = std::forward<Fn>(fn)]() mutable {
                fulfill(*promise, f);
            });
            if (result != SubmitResult::Scheduled) {
                promise->setException(std::make_exception_ptr(std::runtime_error(
                    result == SubmitResult::QueueFull ? "WorkService queue is full"
                                                      : "WorkService is not running")));
            }
            return handle;
        }

        size_t threadCount() const noexcept { return _threadCount; }
        size_t pendingCount() const;
        uint64_t executedCount() const noexcept { return _executed.load(std::memory_order_relaxed); }

        /// True if the calling thread is one of this pool's workers
        bool isWorkerThread() const;

    private:
        void workerLoop();

        Config _config;
        size_t _threadCount = 0;
        std::vector<std::thread> _workers;
        std::atomic<bool> _running{false};
        std::atomic<uint64_t> _executed{0};

        mutable std::mutex _queueMutex;
        std::condition_variable _queueCV;
        std::deque<std::function<void()>> _queue;
        bool _stopRequested = false;
        std::mutex _joinMutex;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
