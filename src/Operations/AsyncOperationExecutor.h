/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file AsyncOperationExecutor.h
 * @brief Entry point every presentation model runs its background work through
 *
 * execute() wraps one operation in the loading/status/progress protocol:
 *
 * 1. IsLoading goes true (once per executor, however many operations overlap)
 * 2. StatusMessage is set when one is supplied and the progress reporter resets
 * 3. The operation runs with the executor's current cancellation token
 * 4. Success drives progress to 100% and returns the result, unless
 *    OperationCompletion<R> says the result did not run to completion
 * 5. Cancellation is logged at Info and rethrown; anything else is logged at
 *    Error, sent to the IErrorReporter and rethrown
 * 6. Cleanup runs exactly once on every path; the last operation to finish
 *    returns the state to {false, "", unset}
 *
 * Property-change handlers always run with no executor lock held, so a handler
 * may query the executor or start the next operation.
 */

#pragma once

#include <atomic>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "OperationState.h"
#include "IErrorReporter.h"
#include "Concurrency/AsyncHandle.h"
#include "Concurrency/CancellationToken.h"
#include "Concurrency/OperationErrors.h"
#include "Concurrency/WorkService.h"
#include "Logging/Logger.h"
#include "Progress/ProgressReporter.h"

namespace Cadence {
namespace Core {
namespace Operations {

    /**
     * @brief Decides whether a returned result counts as a completed run
     *
     * Specialize for result types that can report an outcome short of
     * completion (a timed-out load, for instance); progress is only driven to
     * 100% for completed results.
     */
    template<typename R>
    struct OperationCompletion {
        static bool isComplete(const R&) { return true; }
    };

    /**
     * @brief Runs operations under a shared loading state and cancellation epoch
     *
     * @code
     * AsyncOperationExecutor executor(logger, reporter);
     * auto rows = executor.execute([&](const CancellationToken& token) {
     *     return retry.execute([&] { return repository.fetchAll(token); }, token);
     * }, &progress, "Loading enterprises...");
     * @endcode
     */
    class AsyncOperationExecutor {
    public:
        struct Config {
            std::string name = "AsyncOperationExecutor";
            bool showErrorsToUser = true;
        };

        explicit AsyncOperationExecutor(Logging::Logger& logger = Logging::Logger::global(),
                                        std::shared_ptr<IErrorReporter> errorReporter = nullptr);
        AsyncOperationExecutor(Logging::Logger& logger,
                               std::shared_ptr<IErrorReporter> errorReporter,
                               Config config);

        /// Disposes; operations still running observe cancellation
        ~AsyncOperationExecutor();

        AsyncOperationExecutor(const AsyncOperationExecutor&) = delete;
        AsyncOperationExecutor& operator=(const AsyncOperationExecutor&) = delete;

        /**
         * @brief Run operation under the loading protocol on the calling thread
         *
         * @param operation Callable taking const CancellationToken&
         * @param progress Optional reporter; reset at start, driven to 100 on success.
         *        The shared ProgressPercentage only restarts at 0 when this call
         *        opens the loading interval, and never decreases within it.
         * @param statusMessage Optional StatusMessage for the duration of the call
         * @throws ExecutorDisposedException after dispose()
         * @throws std::invalid_argument for an empty callable
         */
        template<typename Fn>
        auto execute(Fn&& operation,
                     Progress::ProgressReporter* progress = nullptr,
                     std::optional<std::string> statusMessage = std::nullopt)
            -> std::invoke_result_t<Fn&, const Concurrency::CancellationToken&> {
            using R = std::invoke_result_t<Fn&, const Concurrency::CancellationToken&>;

            throwIfDisposed();
            if constexpr (std::is_constructible_v<bool, Fn&>) {
                if (!static_cast<bool>(operation)) {
                    throw std::invalid_argument("AsyncOperationExecutor::execute requires a callable");
                }
            }

            auto token = currentToken();
            OperationScope scope(*this, progress, std::move(statusMessage));

            try {
                token.throwIfCancellationRequested();
                if constexpr (std::is_void_v<R>) {
                    operation(token);
                    scope.succeeded();
                } else {
                    R result = operation(token);
                    if (OperationCompletion<R>::isComplete(result)) {
                        scope.succeeded();
                    }
                    return result;
                }
            } catch (const Concurrency::OperationCancelledException& e) {
                _logger.info(_config.name, std::format("Operation cancelled: {}", e.what()));
                throw;
            } catch (...) {
                handleFailure(std::current_exception());
                throw;
            }
        }

        /**
         * @brief Run execute() on a WorkService worker
         *
         * The executor must outlive the returned handle's completion.
         */
        template<typename Fn>
        auto executeAsync(Concurrency::WorkService& workService,
                          Fn operation,
                          Progress::ProgressReporter* progress = nullptr,
                          std::optional<std::string> statusMessage = std::nullopt)
            -> Concurrency::OperationHandle<std::invoke_result_t<Fn&, const Concurrency::CancellationToken&>> {
            throwIfDisposed();
            return workService.submitTask(
                [this, operation = std::move(operation), progress, statusMessage = std::move(statusMessage)]() mutable {
                    return execute(operation, progress, statusMessage);
                });
        }

        /// Signal the current cancellation epoch
        void cancelOperations();

        /// Cancel the current epoch and begin a new one
        void resetCancellation();

        /// Cancel and refuse further work; idempotent
        void dispose();
        bool isDisposed() const noexcept { return _disposed.load(std::memory_order_acquire); }

        Concurrency::CancellationToken currentToken() const { return _cancellation.token(); }

        OperationState& state() noexcept { return _state; }
        const OperationState& state() const noexcept { return _state; }

        size_t activeOperations() const;
        const std::string& name() const noexcept { return _config.name; }

    private:
        /**
         * @brief Guaranteed-cleanup block for one execute() call
         *
         * Opens the shared loading interval on construction and closes it in the
         * destructor when this is the last active operation.
         */
        class OperationScope {
        public:
            OperationScope(AsyncOperationExecutor& owner,
                           Progress::ProgressReporter* progress,
                           std::optional<std::string> statusMessage);
            ~OperationScope();

            OperationScope(const OperationScope&) = delete;
            OperationScope& operator=(const OperationScope&) = delete;

            void succeeded();

        private:
            AsyncOperationExecutor& _owner;
            Progress::ProgressReporter* _progress;
            std::optional<Progress::ProgressReporter::SubscriptionId> _subscription;
        };

        void throwIfDisposed() const;
        void handleFailure(std::exception_ptr error);

        // Open or close the shared loading interval; notifications run unlocked
        void openScope(bool withProgress);
        void closeScope();

        Logging::Logger& _logger;
        std::shared_ptr<IErrorReporter> _errorReporter;
        Config _config;

        Concurrency::CancellationSource _cancellation;
        std::atomic<bool> _disposed{false};

        OperationState _state;
        mutable std::mutex _scopeMutex;
        size_t _active = 0;
    };

} // namespace Operations
} // namespace Core
} // namespace Cadence
