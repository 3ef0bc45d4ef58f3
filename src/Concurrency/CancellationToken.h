/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file CancellationToken.h
 * @brief Epoch-scoped cooperative cancellation
 *
 * A CancellationSource issues tokens for its current epoch. cancel() signals
 * every token of that epoch. reset() cancels the current epoch and starts a new
 * one, so work started under the old epoch observes cancellation instead of
 * silently continuing under the new one.
 *
 * @code
 * CancellationSource source;
 * auto token = source.token();
 * workService.submit([token] {
 *     while (!token.isCancellationRequested()) {
 *         doChunk();
 *     }
 * });
 * source.cancel();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace Cadence {
namespace Core {
namespace Concurrency {

    namespace detail {
        struct CancellationState {
            explicit CancellationState(uint64_t e) : epoch(e) {}

            const uint64_t epoch;
            std::atomic<bool> cancelled{false};
            std::mutex mutex;
            std::condition_variable cv;
            std::map<uint64_t, std::function<void()>> callbacks;
            uint64_t nextCallbackId = 1;

            void cancel();
        };
    }

    /**
     * @brief RAII registration of a cancellation callback
     *
     * Destroying (or reset()ing) the registration removes the callback. A
     * callback that already ran is unaffected.
     */
    class CancellationRegistration {
    public:
        CancellationRegistration() = default;
        ~CancellationRegistration() { reset(); }

        CancellationRegistration(const CancellationRegistration&) = delete;
        CancellationRegistration& operator=(const CancellationRegistration&) = delete;
        CancellationRegistration(CancellationRegistration&& other) noexcept;
        CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

        void reset();
        explicit operator bool() const noexcept { return !_state.expired(); }

    private:
        CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
            : _state(std::move(state)), _id(id) {}

        std::weak_ptr<detail::CancellationState> _state;
        uint64_t _id = 0;

        friend class CancellationToken;
    };

    /**
     * @brief Read-only view of one cancellation epoch
     *
     * A default-constructed token can never be cancelled.
     */
    class CancellationToken {
    public:
        CancellationToken() = default;

        static CancellationToken none() { return {}; }

        bool canBeCancelled() const noexcept { return static_cast<bool>(_state); }
        bool isCancellationRequested() const noexcept;

        /// @throws OperationCancelledException when cancellation was requested
        void throwIfCancellationRequested() const;

        /// Epoch this token belongs to, 0 for none()
        uint64_t epoch() const noexcept { return _state ? _state->epoch : 0; }

        /**
         * @brief Sleep for the timeout, waking early on cancellation
         * @return true if cancellation was requested before the timeout elapsed
         */
        bool waitFor(std::chrono::steady_clock::duration timeout) const;

        /**
         * @brief Invoke callback when this epoch is cancelled
         *
         * Runs the callback inline if cancellation was already requested.
         */
        [[nodiscard]] CancellationRegistration registerCallback(std::function<void()> callback) const;

        bool operator==(const CancellationToken& other) const noexcept { return _state == other._state; }

    private:
        explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : _state(std::move(state)) {}

        std::shared_ptr<detail::CancellationState> _state;

        friend class CancellationSource;
    };

    /**
     * @brief Owner of the current cancellation epoch
     *
     * Thread-safe: token(), cancel() and reset() may race from any thread.
     */
    class CancellationSource {
    public:
        CancellationSource();
        ~CancellationSource();

        CancellationSource(const CancellationSource&) = delete;
        CancellationSource& operator=(const CancellationSource&) = delete;

        CancellationToken token() const;

        /// Signal the current epoch
        void cancel();

        bool isCancellationRequested() const;

        /**
         * @brief Cancel the current epoch and begin a new one
         * @return A token of the new epoch
         */
        CancellationToken reset();

        uint64_t epoch() const;

        /**
         * @brief Source whose first epoch is cancelled when either input is
         *
         * Links only apply to the first epoch; tokens issued after reset() on
         * the linked source are independent.
         */
        static std::unique_ptr<CancellationSource> createLinked(const CancellationToken& first,
                                                                const CancellationToken& second);

    private:
        mutable std::mutex _mutex;
        std::shared_ptr<detail::CancellationState> _state;
        std::vector<CancellationRegistration> _links;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
