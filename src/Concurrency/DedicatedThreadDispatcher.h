/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file DedicatedThreadDispatcher.h
 * @brief Dispatcher backed by its own event-loop thread
 *
 * Used where no host event loop exists (services, tests). The loop thread acts
 * as the UI-confined context for everything dispatched through it.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <thread>
#include "MainThreadDispatcher.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    class DedicatedThreadDispatcher : public IDispatcher {
    public:
        struct Config {
            std::chrono::milliseconds idleWait{50};
            size_t maxQueuedWork = 0;
        };

        DedicatedThreadDispatcher();
        explicit DedicatedThreadDispatcher(const Config& config);

        /// Stops the loop; work still queued fails with DispatcherShutdownException
        ~DedicatedThreadDispatcher() override;

        bool checkAccess() const override { return _dispatcher.checkAccess(); }
        DispatchHandle invokeAsync(std::function<void()> action) override {
            return _dispatcher.invokeAsync(std::move(action));
        }

        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }
        std::thread::id threadId() const { return _dispatcher.ownerThread(); }

    private:
        void loop();

        Config _config;
        MainThreadDispatcher _dispatcher;
        std::atomic<bool> _running{false};
        std::atomic<bool> _stopRequested{false};
        std::mutex _stopMutex;
        std::thread _thread;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
