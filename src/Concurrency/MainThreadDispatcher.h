/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file MainThreadDispatcher.h
 * @brief Queue-based dispatcher pumped by its owning thread
 *
 * The owning thread (the one that constructed the dispatcher, or the last one
 * to call bindToCurrentThread()) drains the queue with executeMainThreadWork()
 * from its event loop. Any other thread only ever enqueues.
 *
 * @code
 * MainThreadDispatcher ui;   // bound to this thread
 * std::thread worker([&] {
 *     ui.invokeAsync([] { label.setText("done"); });
 * });
 * while (running) {
 *     ui.waitForWork(std::chrono::milliseconds(16));
 *     ui.executeMainThreadWork();
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <memory>
#include <thread>
#include "IDispatcher.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    class MainThreadDispatcher : public IDispatcher {
    public:
        struct Config {
            size_t maxQueuedWork = 0;       ///< 0 means unbounded
        };

        MainThreadDispatcher();
        explicit MainThreadDispatcher(const Config& config);
        ~MainThreadDispatcher() override;

        MainThreadDispatcher(const MainThreadDispatcher&) = delete;
        MainThreadDispatcher& operator=(const MainThreadDispatcher&) = delete;

        /// Make the calling thread the UI-confined owner
        void bindToCurrentThread();
        std::thread::id ownerThread() const;

        bool checkAccess() const override;
        DispatchHandle invokeAsync(std::function<void()> action) override;

        /**
         * @brief Run queued work on the owning thread
         * @param maxItems Upper bound on items executed in this call
         * @return Number of items executed
         * @throws std::logic_error when called from a thread other than the owner
         */
        size_t executeMainThreadWork(size_t maxItems = std::numeric_limits<size_t>::max());

        /// @return true if work is queued (or shutdown was requested) before the timeout
        bool waitForWork(std::chrono::steady_clock::duration timeout) const;

        /// Wake any waitForWork() caller without queueing anything
        void wake();

        size_t pendingCount() const;

        /**
         * @brief Stop accepting work and fail everything still queued
         *
         * Pending handles complete with DispatcherShutdownException; later
         * invokeAsync() calls return handles that already failed that way.
         */
        void shutdown();
        bool isShutdown() const;

        struct Queue;

    protected:
        std::function<void()> progressHook() const override;

    private:
        Config _config;
        std::shared_ptr<Queue> _queue;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
