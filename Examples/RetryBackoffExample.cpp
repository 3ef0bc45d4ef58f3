/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <Concurrency/CancellationToken.h>
#include <Concurrency/OperationErrors.h>
#include <Concurrency/RetryPolicy.h>
#include <Logging/Logger.h>

#include <chrono>
#include <format>
#include <thread>

using namespace Cadence::Core;
using namespace Cadence::Core::Concurrency;

/**
 * Retry Backoff Example
 *
 * Shows the delay schedule, a call that recovers on its third attempt, a call
 * that exhausts its retries and a backoff cut short by cancellation.
 */
int main() {
    RetryPolicy::Config config;
    config.maxRetries = 3;
    config.initialDelay = std::chrono::milliseconds(50);
    RetryPolicy policy(config);

    for (int attempt = 0; attempt < config.maxRetries; ++attempt) {
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(policy.delayForAttempt(attempt));
        CADENCE_LOG_INFO(std::format("[RetryBackoffExample] attempt {} waits {}ms", attempt, delay.count()));
    }

    int calls = 0;
    int value = policy.execute([&] {
        if (++calls < 3) throw std::runtime_error("transient failure");
        return 42;
    });
    CADENCE_LOG_INFO(std::format("[RetryBackoffExample] recovered with {} after {} calls", value, calls));

    try {
        RetryPolicy::executeWithRetry([]() -> int { throw std::runtime_error("service unavailable"); }, 1);
    } catch (const RetryExhaustedException& e) {
        CADENCE_LOG_WARNING(std::format("[RetryBackoffExample] {}", e.what()));
    }

    CancellationSource source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });
    try {
        policy.execute([]() -> int { throw std::runtime_error("still failing"); }, source.token());
    } catch (const OperationCancelledException& e) {
        CADENCE_LOG_INFO(std::format("[RetryBackoffExample] backoff interrupted: {}", e.what()));
    }
    canceller.join();

    return 0;
}
