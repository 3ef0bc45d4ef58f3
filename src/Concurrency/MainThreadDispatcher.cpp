/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "MainThreadDispatcher.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include "OperationErrors.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    struct MainThreadDispatcher::Queue {
        struct Item {
            std::function<void()> action;
            std::shared_ptr<AsyncPromise<void>> promise;
        };

        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::deque<Item> items;
        std::atomic<std::thread::id> owner{std::this_thread::get_id()};
        bool shutdown = false;
        bool woken = false;

        // Pops and runs a single item; caller must be the owner
        bool runOne() {
            Item item;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (items.empty()) return false;
                item = std::move(items.front());
                items.pop_front();
            }
            fulfill(*item.promise, item.action);
            return true;
        }
    };

    MainThreadDispatcher::MainThreadDispatcher()
        : MainThreadDispatcher(Config{}) {
    }

    MainThreadDispatcher::MainThreadDispatcher(const Config& config)
        : _config(config)
        , _queue(std::make_shared<Queue>()) {
    }

    MainThreadDispatcher::~MainThreadDispatcher() {
        shutdown();
    }

    void MainThreadDispatcher::bindToCurrentThread() {
        _queue->owner.store(std::this_thread::get_id(), std::memory_order_release);
    }

    std::thread::id MainThreadDispatcher::ownerThread() const {
        return _queue->owner.load(std::memory_order_acquire);
    }

    bool MainThreadDispatcher::checkAccess() const {
        return std::this_thread::get_id() == _queue->owner.load(std::memory_order_acquire);
    }

    DispatchHandle MainThreadDispatcher::invokeAsync(std::function<void()> action) {
        if (!action) {
            throw std::invalid_argument("invokeAsync requires a callable");
        }

        auto promise = std::make_shared<AsyncPromise<void>>();
        promise->setProgressHook(progressHook());
        auto handle = promise->handle();
        {
            std::lock_guard<std::mutex> lock(_queue->mutex);
            if (_queue->shutdown) {
                promise->setException(std::make_exception_ptr(DispatcherShutdownException()));
                return handle;
            }
            if (_config.maxQueuedWork != 0 && _queue->items.size() >= _config.maxQueuedWork) {
                promise->setException(std::make_exception_ptr(
                    std::runtime_error("Main thread work queue is full")));
                return handle;
            }
            _queue->items.push_back({std::move(action), promise});
        }
        _queue->cv.notify_all();
        return handle;
    }

    size_t MainThreadDispatcher::executeMainThreadWork(size_t maxItems) {
        if (!checkAccess()) {
            throw std::logic_error("executeMainThreadWork called off the owning thread");
        }
        size_t executed = 0;
        while (executed < maxItems && _queue->runOne()) {
            ++executed;
        }
        return executed;
    }

    bool MainThreadDispatcher::waitForWork(std::chrono::steady_clock::duration timeout) const {
        std::unique_lock<std::mutex> lock(_queue->mutex);
        bool ready = _queue->cv.wait_for(lock, timeout, [this] {
            return !_queue->items.empty() || _queue->shutdown || _queue->woken;
        });
        _queue->woken = false;
        return ready;
    }

    void MainThreadDispatcher::wake() {
        {
            std::lock_guard<std::mutex> lock(_queue->mutex);
            _queue->woken = true;
        }
        _queue->cv.notify_all();
    }

    size_t MainThreadDispatcher::pendingCount() const {
        std::lock_guard<std::mutex> lock(_queue->mutex);
        return _queue->items.size();
    }

    void MainThreadDispatcher::shutdown() {
        std::deque<Queue::Item> abandoned;
        {
            std::lock_guard<std::mutex> lock(_queue->mutex);
            if (_queue->shutdown) return;
            _queue->shutdown = true;
            abandoned.swap(_queue->items);
        }
        _queue->cv.notify_all();
        for (auto& item : abandoned) {
            item.promise->setException(std::make_exception_ptr(DispatcherShutdownException()));
        }
    }

    bool MainThreadDispatcher::isShutdown() const {
        std::lock_guard<std::mutex> lock(_queue->mutex);
        return _queue->shutdown;
    }

    std::function<void()> MainThreadDispatcher::progressHook() const {
        std::weak_ptr<Queue> weak = _queue;
        return [weak] {
            auto queue = weak.lock();
            if (!queue) return;
            if (std::this_thread::get_id() != queue->owner.load(std::memory_order_acquire)) return;
            queue->runOne();
        };
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
