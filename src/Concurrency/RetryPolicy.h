/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file RetryPolicy.h
 * @brief Bounded exponential-backoff retry
 *
 * Attempts run 0..maxRetries inclusive. Between attempts the policy logs a
 * warning naming the failed attempt and the delay, sleeps (waking immediately
 * on cancellation) and multiplies the delay by backoffMultiplier. When the last
 * attempt fails it throws RetryExhaustedException carrying the last error.
 * OperationCancelledException is never retried.
 */

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <type_traits>
#include "CancellationToken.h"
#include "OperationErrors.h"
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    /**
     * @brief Retry wrapper for fallible operations
     *
     * The operation may take the CancellationToken or nothing.
     *
     * @code
     * RetryPolicy::Config config;
     * config.maxRetries = 2;
     * RetryPolicy retry(config, logger);
     * auto rows = retry.execute([&](const CancellationToken& token) {
     *     return repository.fetchAll(token);
     * }, source.token());
     * @endcode
     */
    class RetryPolicy {
    public:
        /// Every delay saturates here, whatever maxDelay and the multiplier say
        static constexpr std::chrono::milliseconds kDelayCeiling = std::chrono::hours(1);

        struct Config {
            int maxRetries = 3;
            std::chrono::milliseconds initialDelay{500};
            double backoffMultiplier = 2.0;
            std::chrono::milliseconds maxDelay{0};     ///< 0 means only kDelayCeiling applies
            double jitterFraction = 0.0;               ///< Delay scaled by a uniform factor in [1-j, 1+j]

            /// Decides whether a failure is retried; empty retries everything
            std::function<bool(std::exception_ptr)> shouldRetry;

            /// Called before each backoff sleep with the 1-based failed attempt
            std::function<void(int attempt, std::chrono::milliseconds delay, std::exception_ptr error)> onRetry;
        };

        RetryPolicy();
        explicit RetryPolicy(Config config, Logging::Logger& logger = Logging::Logger::global());

        const Config& config() const noexcept { return _config; }

        /**
         * @brief Un-jittered delay slept after the given 0-based failed attempt
         */
        std::chrono::milliseconds delayForAttempt(int attempt) const;

        template<typename Fn>
        auto execute(Fn&& operation, const CancellationToken& token = {}) {
            auto delay = _config.initialDelay;
            std::exception_ptr lastError;

            for (int attempt = 0; attempt <= _config.maxRetries; ++attempt) {
                token.throwIfCancellationRequested();
                try {
                    return invokeOperation(operation, token);
                } catch (const OperationCancelledException&) {
                    throw;
                } catch (...) {
                    lastError = std::current_exception();
                }

                // Failures the caller chose not to retry propagate unchanged
                if (_config.shouldRetry && !_config.shouldRetry(lastError)) {
                    std::rethrow_exception(lastError);
                }
                if (attempt == _config.maxRetries) break;

                auto wait = jittered(capped(delay));
                reportRetry(attempt + 1, wait, lastError);

                token.throwIfCancellationRequested();
                if (token.waitFor(wait)) {
                    token.throwIfCancellationRequested();
                }
                delay = nextDelay(delay);
            }

            throw RetryExhaustedException(_config.maxRetries + 1, lastError);
        }

        /**
         * @brief One-shot form taking maxRetries directly
         */
        template<typename Fn>
        static auto executeWithRetry(Fn&& operation, int maxRetries, const CancellationToken& token = {},
                                     Logging::Logger& logger = Logging::Logger::global()) {
            Config config;
            config.maxRetries = maxRetries;
            return RetryPolicy(config, logger).execute(std::forward<Fn>(operation), token);
        }

    private:
        template<typename Fn>
        static decltype(auto) invokeOperation(Fn& operation, const CancellationToken& token) {
            if constexpr (std::is_invocable_v<Fn&, const CancellationToken&>) {
                return operation(token);
            } else {
                return operation();
            }
        }

        std::chrono::milliseconds capped(std::chrono::milliseconds delay) const;
        std::chrono::milliseconds jittered(std::chrono::milliseconds delay) const;
        std::chrono::milliseconds nextDelay(std::chrono::milliseconds delay) const;
        void reportRetry(int failedAttempt, std::chrono::milliseconds delay, std::exception_ptr error) const;

        Config _config;
        Logging::Logger* _logger;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
