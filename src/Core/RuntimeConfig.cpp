/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "RuntimeConfig.h"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>

namespace Cadence {
namespace Core {

namespace {
    std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        if (getenv_s(&required, nullptr, 0, name) != 0 || required == 0) return std::nullopt;
        std::string value(required, '\0');
        size_t read = 0;
        if (getenv_s(&read, value.data(), value.size(), name) != 0 || read == 0) return std::nullopt;
        value.resize(read - 1);
        return value;
#else
        const char* value = std::getenv(name);
        if (!value) return std::nullopt;
        return std::string(value);
#endif
    }

    std::optional<int64_t> parseNonNegative(const std::string& text) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> parseFraction(const std::string& text) {
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value < 0.0 || value > 1.0) {
            return std::nullopt;
        }
        return value;
    }

    void rejectValue(Logging::Logger& logger, const char* variable, const std::string& value) {
        logger.warning("Config", std::format("Ignoring malformed {}='{}', keeping default", variable, value));
    }
}

RuntimeConfig RuntimeConfig::fromEnvironment(Logging::Logger& logger) {
    return fromLookup([](const char* name) { return safeGetEnv(name); }, logger);
}

RuntimeConfig RuntimeConfig::fromLookup(const EnvironmentLookup& lookup, Logging::Logger& logger) {
    RuntimeConfig config;

    if (auto value = lookup("CADENCE_LOG_LEVEL")) {
        if (auto level = Logging::parseLogLevel(*value)) {
            config.logLevel = *level;
        } else {
            rejectValue(logger, "CADENCE_LOG_LEVEL", *value);
        }
    }

    if (auto value = lookup("CADENCE_MAX_RETRIES")) {
        auto parsed = parseNonNegative(*value);
        if (parsed && *parsed <= 100) {
            config.retry.maxRetries = static_cast<int>(*parsed);
        } else {
            rejectValue(logger, "CADENCE_MAX_RETRIES", *value);
        }
    }

    if (auto value = lookup("CADENCE_RETRY_BASE_DELAY_MS")) {
        auto parsed = parseNonNegative(*value);
        if (parsed && *parsed <= Concurrency::RetryPolicy::kDelayCeiling.count()) {
            config.retry.initialDelay = std::chrono::milliseconds(*parsed);
        } else {
            rejectValue(logger, "CADENCE_RETRY_BASE_DELAY_MS", *value);
        }
    }

    if (auto value = lookup("CADENCE_RETRY_JITTER")) {
        if (auto parsed = parseFraction(*value)) {
            config.retry.jitterFraction = *parsed;
        } else {
            rejectValue(logger, "CADENCE_RETRY_JITTER", *value);
        }
    }

    if (auto value = lookup("CADENCE_WORKER_THREADS")) {
        auto parsed = parseNonNegative(*value);
        if (parsed && *parsed <= 1024) {
            config.work.threadCount = static_cast<uint32_t>(*parsed);
        } else {
            rejectValue(logger, "CADENCE_WORKER_THREADS", *value);
        }
    }

    if (auto value = lookup("CADENCE_LOAD_TIMEOUT_MS")) {
        if (auto parsed = parseNonNegative(*value)) {
            config.loadTimeout = std::chrono::milliseconds(*parsed);
        } else {
            rejectValue(logger, "CADENCE_LOAD_TIMEOUT_MS", *value);
        }
    }

    if (auto value = lookup("CADENCE_AUTO_REFRESH_MS")) {
        if (auto parsed = parseNonNegative(*value)) {
            config.autoRefreshInterval = std::chrono::milliseconds(*parsed);
        } else {
            rejectValue(logger, "CADENCE_AUTO_REFRESH_MS", *value);
        }
    }

    return config;
}

} // namespace Core
} // namespace Cadence
