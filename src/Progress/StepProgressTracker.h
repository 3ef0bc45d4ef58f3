/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file StepProgressTracker.h
 * @brief Named multi-step progress with its own cancellation epoch
 *
 * Lifecycle: startOperation() → updateProgress(i, msg)... → one of
 * completeOperation(), failOperation(reason) or cancelOperation(). Completion
 * freezes every step as completed; failure leaves the steps exactly as they
 * were when it happened.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "ProgressStep.h"
#include "Concurrency/CancellationToken.h"
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {
namespace Progress {

    enum class StepProgressEventKind {
        Started,
        StepChanged,
        Completed,
        Failed,
        Cancelled,
        Reset
    };

    struct StepProgressEvent {
        StepProgressEventKind kind;
        size_t stepIndex = 0;
        std::string statusMessage;
    };

    /**
     * @brief Thread-safe step tracker
     *
     * @code
     * tracker.startOperation("Loading Enterprises", {
     *     {"Connecting", "Establishing database connection"},
     *     {"Querying", "Retrieving enterprise data"},
     * });
     * tracker.updateProgress(1, "Retrieving enterprise data...");
     * tracker.completeOperation();
     * @endcode
     */
    class StepProgressTracker {
    public:
        using Handler = std::function<void(const StepProgressEvent&)>;
        using SubscriptionId = uint64_t;

        explicit StepProgressTracker(Logging::Logger& logger = Logging::Logger::global());

        /// Replaces the steps and begins a new cancellation epoch
        void startOperation(std::string operationName, std::vector<ProgressStep> steps);

        /// Out-of-range indices are ignored
        void updateProgress(size_t stepIndex, std::string statusMessage);

        void completeOperation();
        void failOperation(const std::string& reason);

        /// Signals the token; no-op unless an operation is in progress
        void cancelOperation();

        void reset();

        std::vector<ProgressStep> steps() const;
        std::string operationName() const;
        std::string statusMessage() const;
        size_t currentStepIndex() const;
        bool isOperationInProgress() const;
        bool canCancel() const;

        /// Token of the current operation's epoch
        Concurrency::CancellationToken token() const { return _cancellation.token(); }

        SubscriptionId subscribe(Handler handler);
        bool unsubscribe(SubscriptionId id);

    private:
        void notify(StepProgressEventKind kind);

        Logging::Logger& _logger;
        Concurrency::CancellationSource _cancellation;

        mutable std::mutex _mutex;
        std::vector<ProgressStep> _steps;
        std::string _operationName;
        std::string _statusMessage;
        size_t _currentStepIndex = 0;
        bool _inProgress = false;
        bool _canCancel = false;

        std::mutex _handlersMutex;
        std::map<SubscriptionId, Handler> _handlers;
        SubscriptionId _nextId = 1;
    };

} // namespace Progress
} // namespace Core
} // namespace Cadence
