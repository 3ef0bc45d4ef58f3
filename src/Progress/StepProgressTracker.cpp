/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "StepProgressTracker.h"
#include <format>

namespace Cadence {
namespace Core {
namespace Progress {

    StepProgressTracker::StepProgressTracker(Logging::Logger& logger)
        : _logger(logger) {
    }

    void StepProgressTracker::startOperation(std::string operationName, std::vector<ProgressStep> steps) {
        _logger.info("Progress", std::format("Starting progress tracking for operation: {}", operationName));
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _operationName = std::move(operationName);
            _steps = std::move(steps);
            _currentStepIndex = 0;
            _statusMessage = "Initializing...";
            _inProgress = true;
            _canCancel = true;
        }
        _cancellation.reset();
        notify(StepProgressEventKind::Started);
    }

    void StepProgressTracker::updateProgress(size_t stepIndex, std::string statusMessage) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (stepIndex >= _steps.size()) return;

            _currentStepIndex = stepIndex;
            _statusMessage = std::move(statusMessage);
            for (size_t i = 0; i < stepIndex; ++i) {
                _steps[i].isCompleted = true;
                _steps[i].isInProgress = false;
            }
            _steps[stepIndex].isInProgress = true;
            _logger.debug("Progress", std::format("Progress updated - Step: {}, Message: {}",
                                                  stepIndex, _statusMessage));
        }
        notify(StepProgressEventKind::StepChanged);
    }

    void StepProgressTracker::completeOperation() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _logger.info("Progress", std::format("Operation completed successfully: {}", _operationName));
            for (auto& step : _steps) {
                step.isCompleted = true;
                step.isInProgress = false;
            }
            _statusMessage = "Operation completed successfully";
            _inProgress = false;
            _canCancel = false;
        }
        notify(StepProgressEventKind::Completed);
    }

    void StepProgressTracker::failOperation(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _logger.error("Progress", std::format("Operation failed: {} - {}", _operationName, reason));
            _statusMessage = "Operation failed: " + reason;
            _inProgress = false;
            _canCancel = false;
        }
        notify(StepProgressEventKind::Failed);
    }

    void StepProgressTracker::cancelOperation() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_canCancel || !_inProgress) return;
            _logger.info("Progress", std::format("Operation cancelled by user: {}", _operationName));
            _statusMessage = "Operation cancelled";
            _inProgress = false;
            _canCancel = false;
        }
        _cancellation.cancel();
        notify(StepProgressEventKind::Cancelled);
    }

    void StepProgressTracker::reset() {
        _logger.debug("Progress", "Resetting step progress tracker");
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _steps.clear();
            _operationName.clear();
            _statusMessage.clear();
            _currentStepIndex = 0;
            _inProgress = false;
            _canCancel = false;
        }
        _cancellation.reset();
        notify(StepProgressEventKind::Reset);
    }

    std::vector<ProgressStep> StepProgressTracker::steps() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _steps;
    }

    std::string StepProgressTracker::operationName() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _operationName;
    }

    std::string StepProgressTracker::statusMessage() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _statusMessage;
    }

    size_t StepProgressTracker::currentStepIndex() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _currentStepIndex;
    }

    bool StepProgressTracker::isOperationInProgress() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _inProgress;
    }

    bool StepProgressTracker::canCancel() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _canCancel;
    }

    StepProgressTracker::SubscriptionId StepProgressTracker::subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        auto id = _nextId++;
        _handlers.emplace(id, std::move(handler));
        return id;
    }

    bool StepProgressTracker::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        return _handlers.erase(id) > 0;
    }

    void StepProgressTracker::notify(StepProgressEventKind kind) {
        StepProgressEvent event{kind};
        {
            std::lock_guard<std::mutex> lock(_mutex);
            event.stepIndex = _currentStepIndex;
            event.statusMessage = _statusMessage;
        }
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(_handlersMutex);
            for (auto& [id, handler] : _handlers) handlers.push_back(handler);
        }
        for (auto& handler : handlers) handler(event);
    }

} // namespace Progress
} // namespace Core
} // namespace Cadence
