/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "DedicatedThreadDispatcher.h"
#include <latch>

namespace Cadence {
namespace Core {
namespace Concurrency {

    DedicatedThreadDispatcher::DedicatedThreadDispatcher()
        : DedicatedThreadDispatcher(Config{}) {
    }

    DedicatedThreadDispatcher::DedicatedThreadDispatcher(const Config& config)
        : _config(config)
        , _dispatcher(MainThreadDispatcher::Config{config.maxQueuedWork}) {
        std::latch bound(1);
        _thread = std::thread([this, &bound] {
            _dispatcher.bindToCurrentThread();
            _running.store(true, std::memory_order_release);
            bound.count_down();
            loop();
        });
        // checkAccess() must be meaningful as soon as the constructor returns
        bound.wait();
    }

    DedicatedThreadDispatcher::~DedicatedThreadDispatcher() {
        stop();
    }

    void DedicatedThreadDispatcher::stop() {
        _stopRequested.store(true, std::memory_order_release);
        _dispatcher.wake();

        // Called from a dispatched action: the loop exits after it returns
        if (std::this_thread::get_id() == _dispatcher.ownerThread()) return;

        std::lock_guard<std::mutex> lock(_stopMutex);
        if (_thread.joinable()) {
            _thread.join();
        }
        _dispatcher.shutdown();
    }

    void DedicatedThreadDispatcher::loop() {
        while (!_stopRequested.load(std::memory_order_acquire)) {
            _dispatcher.waitForWork(_config.idleWait);
            _dispatcher.executeMainThreadWork();
        }
        _running.store(false, std::memory_order_release);
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
