/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file SingleFlightGuard.h
 * @brief Non-blocking "one load in flight" gate
 *
 * A guard never queues: a caller that fails tryEnter() must skip its work
 * entirely. Pair every successful tryEnter() with release(), ideally through
 * the RAII Scope returned by tryAcquire().
 *
 * @code
 * auto scope = _guard.tryAcquire();
 * if (!scope) {
 *     logger.info("Loader", "Load already in progress, skipping duplicate request");
 *     return;
 * }
 * // ... released when scope goes out of scope, including on throw
 * @endcode
 */

#pragma once

#include <atomic>
#include <utility>

namespace Cadence {
namespace Core {
namespace Concurrency {

    class SingleFlightGuard {
    public:
        /**
         * @brief Move-only ownership of an entered guard
         */
        class Scope {
        public:
            Scope() = default;
            ~Scope() { release(); }

            Scope(const Scope&) = delete;
            Scope& operator=(const Scope&) = delete;
            Scope(Scope&& other) noexcept : _guard(std::exchange(other._guard, nullptr)) {}
            Scope& operator=(Scope&& other) noexcept {
                if (this != &other) {
                    release();
                    _guard = std::exchange(other._guard, nullptr);
                }
                return *this;
            }

            explicit operator bool() const noexcept { return _guard != nullptr; }

            void release() noexcept {
                if (_guard) {
                    _guard->release();
                    _guard = nullptr;
                }
            }

        private:
            explicit Scope(SingleFlightGuard* guard) : _guard(guard) {}
            SingleFlightGuard* _guard = nullptr;

            friend class SingleFlightGuard;
        };

        SingleFlightGuard() = default;
        SingleFlightGuard(const SingleFlightGuard&) = delete;
        SingleFlightGuard& operator=(const SingleFlightGuard&) = delete;

        /// @return true if the caller now holds the guard
        bool tryEnter() noexcept {
            bool expected = false;
            return _held.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
        }

        void release() noexcept { _held.store(false, std::memory_order_release); }

        bool isHeld() const noexcept { return _held.load(std::memory_order_acquire); }

        [[nodiscard]] Scope tryAcquire() noexcept {
            return tryEnter() ? Scope(this) : Scope();
        }

    private:
        std::atomic<bool> _held{false};
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
