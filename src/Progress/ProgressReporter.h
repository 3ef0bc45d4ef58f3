/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file ProgressReporter.h
 * @brief Monotonic percentage reporting for one operation
 *
 * Reported values are clamped to [0, 100] and never move backwards within an
 * operation: the visible percentage is max(previous, reported). reset() starts
 * a new operation at 0 and restarts the elapsed-time clock.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Cadence {
namespace Core {
namespace Progress {

    struct ProgressChangedEvent {
        double percentage = 0.0;
        std::string message;
        std::chrono::steady_clock::duration elapsed{};
    };

    class ProgressReporter {
    public:
        using Handler = std::function<void(const ProgressChangedEvent&)>;
        using SubscriptionId = uint64_t;

        struct Config {
            /// When non-zero, percentages are floored to multiples of 100/totalSteps
            uint32_t totalSteps = 0;
        };

        ProgressReporter();
        explicit ProgressReporter(const Config& config);

        void reset();

        void reportProgress(double percentage);
        void reportProgress(std::string_view message, double percentage);

        double percentage() const;
        std::string statusMessage() const;
        std::chrono::steady_clock::duration elapsed() const;

        /**
         * @brief Observe every report
         *
         * Handlers run synchronously on the reporting thread. Reports are
         * delivered one at a time in the order their values were computed, so
         * a handler never sees a lower value after a higher one (until reset).
         * A handler must not report on the reporter that invoked it.
         */
        SubscriptionId subscribe(Handler handler);
        bool unsubscribe(SubscriptionId id);

    private:
        void publish(std::optional<std::string_view> message, double percentage);
        void notify(const ProgressChangedEvent& event);

        Config _config;

        // Held from computing an event until every handler has seen it
        std::mutex _publishMutex;
        mutable std::mutex _mutex;
        double _percentage = 0.0;
        std::string _message;
        std::chrono::steady_clock::time_point _startedAt;

        std::mutex _handlersMutex;
        std::map<SubscriptionId, Handler> _handlers;
        SubscriptionId _nextId = 1;
    };

} // namespace Progress
} // namespace Core
} // namespace Cadence
