/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file OperationErrors.h
 * @brief Exception taxonomy shared by the orchestration layer
 *
 * - OperationCancelledException: cooperative cancellation; never retried.
 * - RetryExhaustedException: terminal failure after the last retry attempt.
 * - ExecutorDisposedException: the executor was disposed; calls fail fast.
 * - DispatcherShutdownException: the UI context stopped before running the work.
 *
 * Anything else thrown by an operation is treated as a transient failure.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace Cadence {
namespace Core {
namespace Concurrency {

    class OperationCancelledException : public std::runtime_error {
    public:
        explicit OperationCancelledException(const std::string& message = "Operation was cancelled",
                                             uint64_t epoch = 0)
            : std::runtime_error(message), _epoch(epoch) {}

        /// Cancellation epoch that was signalled (0 when unknown)
        uint64_t epoch() const noexcept { return _epoch; }

    private:
        uint64_t _epoch;
    };

    class RetryExhaustedException : public std::runtime_error {
    public:
        RetryExhaustedException(int attempts, std::exception_ptr lastError);

        int attempts() const noexcept { return _attempts; }
        std::exception_ptr lastError() const noexcept { return _lastError; }

    private:
        int _attempts;
        std::exception_ptr _lastError;
    };

    class ExecutorDisposedException : public std::logic_error {
    public:
        explicit ExecutorDisposedException(const std::string& executorName)
            : std::logic_error("Executor '" + executorName + "' has been disposed") {}
    };

    class DispatcherShutdownException : public std::runtime_error {
    public:
        DispatcherShutdownException()
            : std::runtime_error("Dispatcher has shut down") {}
    };

    /**
     * @brief Best-effort message extraction from an exception_ptr
     *
     * Returns what() for std::exception, a fixed string otherwise, and an empty
     * string for a null pointer.
     */
    std::string describeException(std::exception_ptr error);

    /// True if error holds an OperationCancelledException
    bool isCancellation(std::exception_ptr error) noexcept;

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
