/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file AsyncHandle.h
 * @brief Shared-state completion handles for asynchronous work
 *
 * An AsyncHandle is the consumer view of a single asynchronous result; the
 * matching AsyncPromise is the producer view. Both point at the same shared
 * state, so handles are cheap to copy and outlive the producer safely.
 *
 * A producer may install a progress hook. wait() calls it between sleeps so a
 * thread blocking on work that it must itself execute (the UI thread waiting on
 * its own dispatcher queue) keeps making forward progress instead of
 * deadlocking.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "OperationErrors.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    enum class AsyncStatus {
        Pending,
        Running,
        Complete,
        Failed,
        Cancelled
    };

    inline bool isTerminal(AsyncStatus status) noexcept {
        return status == AsyncStatus::Complete ||
               status == AsyncStatus::Failed ||
               status == AsyncStatus::Cancelled;
    }

    template<typename T> class AsyncPromise;

    namespace detail {
        template<typename T>
        struct AsyncStorage { using type = T; };

        template<>
        struct AsyncStorage<void> { using type = std::monostate; };

        template<typename T>
        struct AsyncState {
            std::atomic<AsyncStatus> st{AsyncStatus::Pending};
            std::atomic<bool> isComplete{false};
            mutable std::mutex completionMutex;
            mutable std::condition_variable completionCV;

            // Optional progress hook called by wait() to ensure forward progress
            std::function<void()> progress;

            std::optional<typename AsyncStorage<T>::type> value;
            std::exception_ptr error;
            std::vector<std::function<void()>> continuations;

            // First completion wins; returns false if already completed
            template<typename Fill>
            bool complete(AsyncStatus final, Fill&& fill) {
                std::vector<std::function<void()>> ready;
                {
                    std::lock_guard<std::mutex> lock(completionMutex);
                    if (isComplete.load(std::memory_order_relaxed)) return false;
                    fill();
                    st.store(final, std::memory_order_release);
                    isComplete.store(true, std::memory_order_release);
                    ready.swap(continuations);
                }
                completionCV.notify_all();
                for (auto& c : ready) c();
                return true;
            }
        };
    } // namespace detail

    /**
     * @brief Consumer view of an asynchronous result
     *
     * A default-constructed handle is invalid: status() reports Pending and
     * wait() returns immediately. get() waits, then returns the value or
     * rethrows the stored exception.
     *
     * @code
     * auto handle = workService.submitTask([] { return 42; });
     * handle.wait();
     * if (handle.status() == AsyncStatus::Complete) {
     *     int v = handle.get();
     * }
     * @endcode
     */
    template<typename T>
    class AsyncHandle {
    public:
        using value_type = T;

        AsyncHandle() = default;

        bool valid() const noexcept { return static_cast<bool>(_s); }

        AsyncStatus status() const noexcept {
            return _s ? _s->st.load(std::memory_order_acquire) : AsyncStatus::Pending;
        }

        bool isComplete() const noexcept {
            return _s && _s->isComplete.load(std::memory_order_acquire);
        }

        void wait() const {
            if (!_s) return;
            if (_s->isComplete.load(std::memory_order_acquire)) return;

            std::unique_lock<std::mutex> lock(_s->completionMutex);
            while (!_s->isComplete.load(std::memory_order_acquire)) {
                if (_s->progress) {
                    lock.unlock();
                    _s->progress();
                    lock.lock();
                }
                _s->completionCV.wait_for(lock, std::chrono::milliseconds(1), [this] {
                    return _s->isComplete.load(std::memory_order_acquire);
                });
            }
        }

        /// @return true if the handle completed within the timeout
        template<typename Rep, typename Period>
        bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
            if (!_s) return false;
            auto deadline = std::chrono::steady_clock::now() + timeout;
            std::unique_lock<std::mutex> lock(_s->completionMutex);
            while (!_s->isComplete.load(std::memory_order_acquire)) {
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) return false;
                if (_s->progress) {
                    lock.unlock();
                    _s->progress();
                    lock.lock();
                }
                auto slice = std::min<std::chrono::steady_clock::duration>(
                    deadline - now, std::chrono::milliseconds(1));
                _s->completionCV.wait_for(lock, slice, [this] {
                    return _s->isComplete.load(std::memory_order_acquire);
                });
            }
            return true;
        }

        /// Stored exception, only meaningful once Failed or Cancelled
        std::exception_ptr error() const {
            if (!_s) return nullptr;
            std::lock_guard<std::mutex> lock(_s->completionMutex);
            return _s->error;
        }

        T get() const {
            if (!_s) throw std::logic_error("AsyncHandle::get() on an invalid handle");
            wait();
            if (_s->error) std::rethrow_exception(_s->error);
            if constexpr (std::is_void_v<T>) {
                return;
            } else {
                return *_s->value;
            }
        }

        /**
         * @brief Run a callback once the handle reaches a terminal state
         *
         * Runs inline if already complete, otherwise on the completing thread.
         */
        void onComplete(std::function<void()> callback) const {
            if (!_s || !callback) return;
            {
                std::lock_guard<std::mutex> lock(_s->completionMutex);
                if (!_s->isComplete.load(std::memory_order_relaxed)) {
                    _s->continuations.push_back(std::move(callback));
                    return;
                }
            }
            callback();
        }

        template<typename... Args>
        static AsyncHandle completed(Args&&... args) {
            AsyncPromise<T> promise;
            promise.setValue(std::forward<Args>(args)...);
            return promise.handle();
        }

        static AsyncHandle failed(std::exception_ptr error) {
            AsyncPromise<T> promise;
            promise.setException(std::move(error));
            return promise.handle();
        }

    private:
        std::shared_ptr<detail::AsyncState<T>> _s;
        explicit AsyncHandle(std::shared_ptr<detail::AsyncState<T>> s) : _s(std::move(s)) {}

        friend class AsyncPromise<T>;
    };

    /**
     * @brief Producer view of an asynchronous result
     *
     * Completion is first-wins: later setValue()/setException() calls are
     * ignored and return false. An exception holding OperationCancelledException
     * moves the handle to Cancelled, any other exception to Failed.
     */
    template<typename T>
    class AsyncPromise {
    public:
        AsyncPromise() : _s(std::make_shared<detail::AsyncState<T>>()) {}

        AsyncHandle<T> handle() const { return AsyncHandle<T>(_s); }

        /// Must be installed before the handle is shared with another thread
        void setProgressHook(std::function<void()> hook) { _s->progress = std::move(hook); }

        void markRunning() noexcept {
            auto expected = AsyncStatus::Pending;
            _s->st.compare_exchange_strong(expected, AsyncStatus::Running, std::memory_order_acq_rel);
        }

        template<typename... Args>
        bool setValue(Args&&... args) {
            return _s->complete(AsyncStatus::Complete, [&] {
                _s->value.emplace(std::forward<Args>(args)...);
            });
        }

        bool setException(std::exception_ptr error) {
            auto final = isCancellation(error) ? AsyncStatus::Cancelled : AsyncStatus::Failed;
            return _s->complete(final, [&] { _s->error = std::move(error); });
        }

        bool isComplete() const noexcept { return _s->isComplete.load(std::memory_order_acquire); }

    private:
        std::shared_ptr<detail::AsyncState<T>> _s;
    };

    /**
     * @brief Run fn and settle the promise with its result or its exception
     */
    template<typename T, typename Fn>
    void fulfill(AsyncPromise<T>& promise, Fn&& fn) {
        promise.markRunning();
        try {
            if constexpr (std::is_void_v<T>) {
                std::forward<Fn>(fn)();
                promise.setValue();
            } else {
                promise.setValue(std::forward<Fn>(fn)());
            }
        } catch (...) {
            promise.setException(std::current_exception());
        }
    }

    using DispatchHandle = AsyncHandle<void>;

    template<typename T>
    using OperationHandle = AsyncHandle<T>;

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
