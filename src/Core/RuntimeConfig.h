/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file RuntimeConfig.h
 * @brief Aggregated component configuration with environment overrides
 *
 * Recognised variables:
 * - CADENCE_LOG_LEVEL           trace|debug|info|warning|error|fatal|off
 * - CADENCE_MAX_RETRIES         non-negative integer
 * - CADENCE_RETRY_BASE_DELAY_MS non-negative integer, at most 3600000
 * - CADENCE_RETRY_JITTER        fraction in [0, 1]
 * - CADENCE_WORKER_THREADS      non-negative integer, 0 = hardware concurrency
 * - CADENCE_LOAD_TIMEOUT_MS     non-negative integer, 0 = no timeout race
 * - CADENCE_AUTO_REFRESH_MS     non-negative integer, 0 = no auto refresh
 *
 * Malformed values are logged at Warning and the default is kept.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "Concurrency/RetryPolicy.h"
#include "Concurrency/WorkService.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {

struct RuntimeConfig {
    Logging::LogLevel logLevel = Logging::LogLevel::Info;
    Concurrency::RetryPolicy::Config retry;
    Concurrency::WorkService::Config work;
    std::chrono::milliseconds loadTimeout{30000};
    std::chrono::milliseconds autoRefreshInterval{std::chrono::minutes(5)};

    using EnvironmentLookup = std::function<std::optional<std::string>(const char*)>;

    /// Defaults overridden by the process environment
    static RuntimeConfig fromEnvironment(Logging::Logger& logger = Logging::Logger::global());

    /// Defaults overridden through lookup; used by tests to inject variables
    static RuntimeConfig fromLookup(const EnvironmentLookup& lookup,
                                    Logging::Logger& logger = Logging::Logger::global());
};

} // namespace Core
} // namespace Cadence
