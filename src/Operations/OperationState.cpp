/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "OperationState.h"
#include <algorithm>
#include <vector>

namespace Cadence {
namespace Core {
namespace Operations {

    const char* operationPropertyName(OperationProperty property) {
        switch (property) {
            case OperationProperty::IsLoading: return "IsLoading";
            case OperationProperty::StatusMessage: return "StatusMessage";
            case OperationProperty::ProgressPercentage: return "ProgressPercentage";
        }
        return "Unknown";
    }

    bool OperationState::isLoading() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _isLoading;
    }

    std::string OperationState::statusMessage() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _statusMessage;
    }

    std::optional<double> OperationState::progressPercentage() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _progress;
    }

    OperationStateSnapshot OperationState::snapshot() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return {_isLoading, _statusMessage, _progress};
    }

    void OperationState::setLoading(bool loading) {
        if (applyLoading(loading)) notify(OperationProperty::IsLoading);
    }

    void OperationState::setStatusMessage(std::string message) {
        if (applyStatusMessage(std::move(message))) notify(OperationProperty::StatusMessage);
    }

    void OperationState::setProgressPercentage(std::optional<double> percentage) {
        if (applyProgress(percentage)) notify(OperationProperty::ProgressPercentage);
    }

    void OperationState::raiseProgressTo(double percentage) {
        percentage = std::clamp(percentage, 0.0, 100.0);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_progress && *_progress >= percentage) return;
            _progress = percentage;
        }
        notify(OperationProperty::ProgressPercentage);
    }

    void OperationState::clear() {
        for (auto property : applyClear()) {
            notify(property);
        }
    }

    bool OperationState::applyLoading(bool loading) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_isLoading == loading) return false;
        _isLoading = loading;
        return true;
    }

    bool OperationState::applyStatusMessage(std::string message) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_statusMessage == message) return false;
        _statusMessage = std::move(message);
        return true;
    }

    bool OperationState::applyProgress(std::optional<double> percentage) {
        if (percentage) {
            percentage = std::clamp(*percentage, 0.0, 100.0);
        }
        std::lock_guard<std::mutex> lock(_mutex);
        if (_progress == percentage) return false;
        _progress = percentage;
        return true;
    }

    std::vector<OperationProperty> OperationState::applyClear() {
        std::vector<OperationProperty> changed;
        if (applyLoading(false)) changed.push_back(OperationProperty::IsLoading);
        if (applyStatusMessage({})) changed.push_back(OperationProperty::StatusMessage);
        if (applyProgress(std::nullopt)) changed.push_back(OperationProperty::ProgressPercentage);
        return changed;
    }

    OperationState::SubscriptionId OperationState::subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        auto id = _nextId++;
        _handlers.emplace(id, std::move(handler));
        return id;
    }

    bool OperationState::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        return _handlers.erase(id) > 0;
    }

    void OperationState::notify(OperationProperty property) {
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(_handlersMutex);
            handlers.reserve(_handlers.size());
            for (auto& [id, handler] : _handlers) handlers.push_back(handler);
        }
        for (auto& handler : handlers) handler(property);
    }

} // namespace Operations
} // namespace Core
} // namespace Cadence
