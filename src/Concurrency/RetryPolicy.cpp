/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "RetryPolicy.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <random>
#include <stdexcept>

namespace Cadence {
namespace Core {
namespace Concurrency {

    RetryPolicy::RetryPolicy()
        : RetryPolicy(Config{}) {
    }

    RetryPolicy::RetryPolicy(Config config, Logging::Logger& logger)
        : _config(std::move(config))
        , _logger(&logger) {
        if (_config.maxRetries < 0) {
            throw std::invalid_argument("RetryPolicy maxRetries must be non-negative");
        }
        if (_config.backoffMultiplier < 1.0) {
            throw std::invalid_argument("RetryPolicy backoffMultiplier must be at least 1.0");
        }
        _config.jitterFraction = std::clamp(_config.jitterFraction, 0.0, 1.0);
    }

    std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const {
        auto delay = _config.initialDelay;
        for (int i = 0; i < attempt; ++i) {
            delay = nextDelay(delay);
        }
        return capped(delay);
    }

    std::chrono::milliseconds RetryPolicy::capped(std::chrono::milliseconds delay) const {
        auto limit = kDelayCeiling;
        if (_config.maxDelay.count() > 0 && _config.maxDelay < limit) {
            limit = _config.maxDelay;
        }
        return std::min(delay, limit);
    }

    std::chrono::milliseconds RetryPolicy::jittered(std::chrono::milliseconds delay) const {
        if (_config.jitterFraction <= 0.0) return delay;
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(1.0 - _config.jitterFraction, 1.0 + _config.jitterFraction);
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay.count() * dist(rng))));
    }

    std::chrono::milliseconds RetryPolicy::nextDelay(std::chrono::milliseconds delay) const {
        // Saturate in floating point before converting back to an integer count
        double next = static_cast<double>(capped(delay).count()) * _config.backoffMultiplier;
        if (!std::isfinite(next) || next >= static_cast<double>(kDelayCeiling.count())) {
            return capped(kDelayCeiling);
        }
        return capped(std::chrono::milliseconds(static_cast<int64_t>(std::llround(next))));
    }

    void RetryPolicy::reportRetry(int failedAttempt, std::chrono::milliseconds delay, std::exception_ptr error) const {
        _logger->warning("Retry", std::format("Attempt {} failed, retrying in {}ms: {}",
                                              failedAttempt, delay.count(), describeException(error)));
        if (_config.onRetry) {
            _config.onRetry(failedAttempt, delay, error);
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
