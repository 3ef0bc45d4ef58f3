/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <gtest/gtest.h>
#include <map>
#include <string>
#include "Core/RuntimeConfig.h"
#include "TestHelpers/CaptureSink.h"

using namespace Cadence::Core;
using namespace Cadence::Core::Logging;
using Cadence::Testing::CapturedLogger;
using namespace std::chrono_literals;

namespace {
    RuntimeConfig::EnvironmentLookup lookupFrom(std::map<std::string, std::string> vars) {
        return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) return std::nullopt;
            return it->second;
        };
    }
}

TEST(RuntimeConfigTest, DefaultsWithEmptyEnvironment) {
    CapturedLogger captured;
    auto config = RuntimeConfig::fromLookup(lookupFrom({}), captured.logger);

    EXPECT_EQ(config.logLevel, LogLevel::Info);
    EXPECT_EQ(config.retry.maxRetries, 3);
    EXPECT_EQ(config.retry.initialDelay, 500ms);
    EXPECT_DOUBLE_EQ(config.retry.jitterFraction, 0.0);
    EXPECT_EQ(config.work.threadCount, 0u);
    EXPECT_EQ(config.loadTimeout, 30000ms);
    EXPECT_EQ(config.autoRefreshInterval, std::chrono::minutes(5));
    EXPECT_TRUE(captured.sink->entries().empty());
}

TEST(RuntimeConfigTest, ValuesAreApplied) {
    CapturedLogger captured;
    auto config = RuntimeConfig::fromLookup(lookupFrom({
        {"CADENCE_LOG_LEVEL", "debug"},
        {"CADENCE_MAX_RETRIES", "5"},
        {"CADENCE_RETRY_BASE_DELAY_MS", "250"},
        {"CADENCE_RETRY_JITTER", "0.2"},
        {"CADENCE_WORKER_THREADS", "8"},
        {"CADENCE_LOAD_TIMEOUT_MS", "1500"},
        {"CADENCE_AUTO_REFRESH_MS", "0"},
    }), captured.logger);

    EXPECT_EQ(config.logLevel, LogLevel::Debug);
    EXPECT_EQ(config.retry.maxRetries, 5);
    EXPECT_EQ(config.retry.initialDelay, 250ms);
    EXPECT_DOUBLE_EQ(config.retry.jitterFraction, 0.2);
    EXPECT_EQ(config.work.threadCount, 8u);
    EXPECT_EQ(config.loadTimeout, 1500ms);
    EXPECT_EQ(config.autoRefreshInterval, 0ms);
    EXPECT_EQ(captured.sink->count(LogLevel::Warning), 0u);
}

TEST(RuntimeConfigTest, MalformedValuesKeepDefaults) {
    CapturedLogger captured;
    auto config = RuntimeConfig::fromLookup(lookupFrom({
        {"CADENCE_LOG_LEVEL", "chatty"},
        {"CADENCE_MAX_RETRIES", "-1"},
        {"CADENCE_RETRY_BASE_DELAY_MS", "12abc"},
        {"CADENCE_RETRY_JITTER", "1.5"},
        {"CADENCE_WORKER_THREADS", "5000"},
        {"CADENCE_LOAD_TIMEOUT_MS", ""},
    }), captured.logger);

    EXPECT_EQ(config.logLevel, LogLevel::Info);
    EXPECT_EQ(config.retry.maxRetries, 3);
    EXPECT_EQ(config.retry.initialDelay, 500ms);
    EXPECT_DOUBLE_EQ(config.retry.jitterFraction, 0.0);
    EXPECT_EQ(config.work.threadCount, 0u);
    EXPECT_EQ(config.loadTimeout, 30000ms);

    EXPECT_EQ(captured.sink->count(LogLevel::Warning), 6u);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Warning,
              "Ignoring malformed CADENCE_MAX_RETRIES='-1', keeping default"), 1u);
    for (const auto& entry : captured.sink->entries()) {
        EXPECT_EQ(entry.category, "Config");
    }
}

TEST(RuntimeConfigTest, RetryLimitIsBounded) {
    CapturedLogger captured;
    auto accepted = RuntimeConfig::fromLookup(lookupFrom({{"CADENCE_MAX_RETRIES", "100"}}), captured.logger);
    EXPECT_EQ(accepted.retry.maxRetries, 100);

    auto rejected = RuntimeConfig::fromLookup(lookupFrom({{"CADENCE_MAX_RETRIES", "101"}}), captured.logger);
    EXPECT_EQ(rejected.retry.maxRetries, 3);
}

TEST(RuntimeConfigTest, RetryDelayIsBounded) {
    CapturedLogger captured;
    auto accepted = RuntimeConfig::fromLookup(lookupFrom({{"CADENCE_RETRY_BASE_DELAY_MS", "3600000"}}),
                                              captured.logger);
    EXPECT_EQ(accepted.retry.initialDelay, 3600000ms);

    auto rejected = RuntimeConfig::fromLookup(lookupFrom({{"CADENCE_RETRY_BASE_DELAY_MS", "9223372036854775807"}}),
                                              captured.logger);
    EXPECT_EQ(rejected.retry.initialDelay, 500ms);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Warning, "CADENCE_RETRY_BASE_DELAY_MS"), 1u);
}
