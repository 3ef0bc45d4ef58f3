/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file OperationState.h
 * @brief Loading/status/progress properties exposed to bound UI
 *
 * Each setter raises a property-change notification naming the property, but
 * only when the value actually changes. Handlers run synchronously on the
 * thread that made the change, outside the state's lock.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Cadence {
namespace Core {
namespace Operations {

    enum class OperationProperty {
        IsLoading,
        StatusMessage,
        ProgressPercentage
    };

    const char* operationPropertyName(OperationProperty property);

    struct OperationStateSnapshot {
        bool isLoading = false;
        std::string statusMessage;
        std::optional<double> progressPercentage;
    };

    class OperationState {
    public:
        using Handler = std::function<void(OperationProperty)>;
        using SubscriptionId = uint64_t;

        bool isLoading() const;
        std::string statusMessage() const;
        std::optional<double> progressPercentage() const;
        OperationStateSnapshot snapshot() const;

        void setLoading(bool loading);
        void setStatusMessage(std::string message);
        void setProgressPercentage(std::optional<double> percentage);

        /**
         * @brief Raise ProgressPercentage to percentage if it is higher or unset
         *
         * Compare and store happen under one lock, so concurrent callers can
         * never move the value backwards.
         */
        void raiseProgressTo(double percentage);

        /// Back to {false, "", unset}
        void clear();

        SubscriptionId subscribe(Handler handler);
        bool unsubscribe(SubscriptionId id);

    private:
        friend class AsyncOperationExecutor;

        // Store without notifying; each returns whether the value changed
        bool applyLoading(bool loading);
        bool applyStatusMessage(std::string message);
        bool applyProgress(std::optional<double> percentage);
        std::vector<OperationProperty> applyClear();

        void notify(OperationProperty property);

        mutable std::mutex _mutex;
        bool _isLoading = false;
        std::string _statusMessage;
        std::optional<double> _progress;

        std::mutex _handlersMutex;
        std::map<SubscriptionId, Handler> _handlers;
        SubscriptionId _nextId = 1;
    };

} // namespace Operations
} // namespace Core
} // namespace Cadence
