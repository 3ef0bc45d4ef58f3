/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "ProgressReporter.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace Cadence {
namespace Core {
namespace Progress {

    ProgressReporter::ProgressReporter()
        : ProgressReporter(Config{}) {
    }

    ProgressReporter::ProgressReporter(const Config& config)
        : _config(config)
        , _startedAt(std::chrono::steady_clock::now()) {
    }

    void ProgressReporter::reset() {
        std::lock_guard<std::mutex> publishLock(_publishMutex);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _percentage = 0.0;
            _message.clear();
            _startedAt = std::chrono::steady_clock::now();
        }
        // Observers see the drop back to 0 even though reports never decrease
        notify(ProgressChangedEvent{});
    }

    void ProgressReporter::reportProgress(double percentage) {
        publish(std::nullopt, percentage);
    }

    void ProgressReporter::reportProgress(std::string_view message, double percentage) {
        publish(message, percentage);
    }

    void ProgressReporter::publish(std::optional<std::string_view> message, double percentage) {
        if (std::isnan(percentage)) percentage = 0.0;
        percentage = std::clamp(percentage, 0.0, 100.0);
        if (_config.totalSteps > 0) {
            double step = 100.0 / _config.totalSteps;
            percentage = std::min(100.0, std::floor(percentage / step + 1e-9) * step);
        }

        std::lock_guard<std::mutex> publishLock(_publishMutex);
        ProgressChangedEvent event;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _percentage = std::max(_percentage, percentage);
            if (message) _message.assign(message->data(), message->size());
            event.percentage = _percentage;
            event.message = _message;
            event.elapsed = std::chrono::steady_clock::now() - _startedAt;
        }
        notify(event);
    }

    void ProgressReporter::notify(const ProgressChangedEvent& event) {
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(_handlersMutex);
            handlers.reserve(_handlers.size());
            for (auto& [id, handler] : _handlers) handlers.push_back(handler);
        }
        for (auto& handler : handlers) handler(event);
    }

    double ProgressReporter::percentage() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _percentage;
    }

    std::string ProgressReporter::statusMessage() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _message;
    }

    std::chrono::steady_clock::duration ProgressReporter::elapsed() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::chrono::steady_clock::now() - _startedAt;
    }

    ProgressReporter::SubscriptionId ProgressReporter::subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        auto id = _nextId++;
        _handlers.emplace(id, std::move(handler));
        return id;
    }

    bool ProgressReporter::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(_handlersMutex);
        return _handlers.erase(id) > 0;
    }

} // namespace Progress
} // namespace Core
} // namespace Cadence
