/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file IDispatcher.h
 * @brief Bridge to the UI-confined execution context
 *
 * Exactly one thread owns UI-bound state. Everything that touches that state
 * from elsewhere goes through an IDispatcher: invokeAsync() queues a delegate on
 * the owning context and hands back a DispatchHandle that completes once the
 * delegate has run, carrying any exception it raised.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include "AsyncHandle.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    class IDispatcher {
    public:
        virtual ~IDispatcher() = default;

        /// True if the calling thread is the UI-confined one
        virtual bool checkAccess() const = 0;

        /**
         * @brief Run action on the UI-confined context
         *
         * Exceptions thrown by action are delivered through the handle. If the
         * dispatcher has shut down the handle fails with
         * DispatcherShutdownException.
         */
        virtual DispatchHandle invokeAsync(std::function<void()> action) = 0;

        /**
         * @brief Run an asynchronous action on the UI-confined context
         *
         * The returned handle completes when the handle produced by asyncAction
         * completes, not when asyncAction returns.
         */
        DispatchHandle invokeAsyncChained(std::function<DispatchHandle()> asyncAction);

        /**
         * @brief Run fn on the UI-confined context and block for its result
         *
         * Runs inline when already on the UI context.
         */
        template<typename Fn>
        auto invoke(Fn&& fn) -> std::invoke_result_t<Fn> {
            using R = std::invoke_result_t<Fn>;
            if (checkAccess()) {
                return std::forward<Fn>(fn)();
            }
            if constexpr (std::is_void_v<R>) {
                invokeAsync(std::function<void()>(std::forward<Fn>(fn))).get();
            } else {
                auto result = std::make_shared<std::optional<R>>();
                invokeAsync([result, f = std::forward<Fn>(fn)]() mutable {
                    result->emplace(f());
                }).get();
                return std::move(**result);
            }
        }

    protected:
        /**
         * @brief Hook installed on handles created by this dispatcher
         *
         * Dispatchers that rely on their owner pumping a queue return a hook that
         * pumps it, so an owner waiting on its own handle does not deadlock.
         */
        virtual std::function<void()> progressHook() const { return {}; }
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
