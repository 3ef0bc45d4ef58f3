/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "AsyncOperationExecutor.h"
#include <vector>

namespace Cadence {
namespace Core {
namespace Operations {

    AsyncOperationExecutor::AsyncOperationExecutor(Logging::Logger& logger,
                                                   std::shared_ptr<IErrorReporter> errorReporter)
        : AsyncOperationExecutor(logger, std::move(errorReporter), Config{}) {
    }

    AsyncOperationExecutor::AsyncOperationExecutor(Logging::Logger& logger,
                                                   std::shared_ptr<IErrorReporter> errorReporter,
                                                   Config config)
        : _logger(logger)
        , _errorReporter(std::move(errorReporter))
        , _config(std::move(config)) {
    }

    AsyncOperationExecutor::~AsyncOperationExecutor() {
        dispose();
    }

    void AsyncOperationExecutor::cancelOperations() {
        _logger.info(_config.name, "Cancelling operations");
        _cancellation.cancel();
    }

    void AsyncOperationExecutor::resetCancellation() {
        auto token = _cancellation.reset();
        _logger.debug(_config.name, std::format("Cancellation reset, new epoch {}", token.epoch()));
    }

    void AsyncOperationExecutor::dispose() {
        if (_disposed.exchange(true, std::memory_order_acq_rel)) return;
        _cancellation.cancel();
        _logger.debug(_config.name, "Disposed");
    }

    size_t AsyncOperationExecutor::activeOperations() const {
        std::lock_guard<std::mutex> lock(_scopeMutex);
        return _active;
    }

    void AsyncOperationExecutor::throwIfDisposed() const {
        if (isDisposed()) {
            throw Concurrency::ExecutorDisposedException(_config.name);
        }
    }

    void AsyncOperationExecutor::handleFailure(std::exception_ptr error) {
        auto message = Concurrency::describeException(error);
        _logger.error(_config.name, std::format("Operation failed: {}", message));
        if (_errorReporter) {
            _errorReporter->reportError(error, _config.name, _config.showErrorsToUser);
        }
    }

    void AsyncOperationExecutor::openScope(bool withProgress) {
        // Transitions are stored under _scopeMutex so the state always matches
        // _active; handlers run after it is released and may call back in.
        std::vector<OperationProperty> changed;
        {
            std::lock_guard<std::mutex> lock(_scopeMutex);
            if (_active++ == 0) {
                if (_state.applyLoading(true)) changed.push_back(OperationProperty::IsLoading);
                if (withProgress && _state.applyProgress(0.0)) changed.push_back(OperationProperty::ProgressPercentage);
            }
        }
        for (auto property : changed) {
            _state.notify(property);
        }
    }

    void AsyncOperationExecutor::closeScope() {
        std::vector<OperationProperty> changed;
        {
            std::lock_guard<std::mutex> lock(_scopeMutex);
            if (--_active == 0) {
                changed = _state.applyClear();
            }
        }
        for (auto property : changed) {
            _state.notify(property);
        }
    }

    AsyncOperationExecutor::OperationScope::OperationScope(AsyncOperationExecutor& owner,
                                                           Progress::ProgressReporter* progress,
                                                           std::optional<std::string> statusMessage)
        : _owner(owner)
        , _progress(progress) {
        _owner.openScope(_progress != nullptr);

        auto& state = _owner._state;
        if (statusMessage) {
            state.setStatusMessage(std::move(*statusMessage));
        }
        if (_progress) {
            _progress->reset();
            _subscription = _progress->subscribe([&state](const Progress::ProgressChangedEvent& event) {
                state.raiseProgressTo(event.percentage);
            });
        }
    }

    void AsyncOperationExecutor::OperationScope::succeeded() {
        if (_progress) {
            _progress->reportProgress(100.0);
        }
    }

    AsyncOperationExecutor::OperationScope::~OperationScope() {
        if (_progress && _subscription) {
            _progress->unsubscribe(*_subscription);
        }
        _owner.closeScope();
    }

} // namespace Operations
} // namespace Core
} // namespace Cadence
