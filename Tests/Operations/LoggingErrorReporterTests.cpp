/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include "Operations/LoggingErrorReporter.h"
#include "TestHelpers/CaptureSink.h"

using namespace Cadence::Core::Logging;
using namespace Cadence::Core::Operations;
using Cadence::Testing::CapturedLogger;

namespace {
    std::exception_ptr makeError(const char* message) {
        return std::make_exception_ptr(std::runtime_error(message));
    }
}

TEST(LoggingErrorReporterTest, ErrorIsLoggedWithCorrelationId) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);

    auto id = reporter.reportError(makeError("database unreachable"), "EnterpriseLoader");

    EXPECT_EQ(id.size(), 36u);
    auto entries = captured.sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
    EXPECT_EQ(entries[0].category, "ErrorReporting");
    EXPECT_EQ(entries[0].message,
              "Error occurred in EnterpriseLoader: database unreachable (CorrelationId: " + id + ")");
}

TEST(LoggingErrorReporterTest, CorrelationIdsAreUnique) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);
    auto first = reporter.reportError(makeError("a"), "X");
    auto second = reporter.reportError(makeError("a"), "X");
    EXPECT_NE(first, second);
}

TEST(LoggingErrorReporterTest, CallbackReceivesReport) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);
    std::optional<ErrorReport> received;
    reporter.setErrorReportedCallback([&](const ErrorReport& report) { received = report; });

    auto id = reporter.reportError(makeError("boom"), "Loader", true);

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->correlationId, id);
    EXPECT_EQ(received->context, "Loader");
    EXPECT_EQ(received->message, "boom");
    EXPECT_TRUE(received->showToUser);
    EXPECT_THROW(std::rethrow_exception(received->error), std::runtime_error);
}

TEST(LoggingErrorReporterTest, SuppressedDialogsAreLogged) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);
    reporter.setSuppressUserDialogs(true);
    std::optional<ErrorReport> received;
    reporter.setErrorReportedCallback([&](const ErrorReport& report) { received = report; });

    reporter.reportError(makeError("boom"), "Loader", true);

    ASSERT_TRUE(received.has_value());
    EXPECT_FALSE(received->showToUser);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Info, "Suppressed error dialog"), 1u);

    // Nothing to suppress when the caller did not ask for a dialog
    captured.sink->clear();
    reporter.reportError(makeError("quiet"), "Loader", false);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Info, "Suppressed error dialog"), 0u);
}

TEST(LoggingErrorReporterTest, EmptyContextBecomesUnknown) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);
    reporter.reportError(makeError("x"), "");
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Error, "Error occurred in Unknown: x"), 1u);
    EXPECT_EQ(reporter.reportCount("Unknown"), 1);
}

TEST(LoggingErrorReporterTest, WarningsAndCounters) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);

    reporter.reportError(makeError("e1"), "Loader");
    reporter.reportError(makeError("e2"), "Loader");
    reporter.reportWarning("slow query", "Loader");

    EXPECT_EQ(captured.sink->countContaining(LogLevel::Warning, "Warning in Loader: slow query"), 1u);
    EXPECT_EQ(reporter.counter("errors"), 2);
    EXPECT_EQ(reporter.counter("warnings"), 1);
    EXPECT_EQ(reporter.reportCount("Loader"), 3);
    EXPECT_EQ(reporter.counter("never"), 0);
    EXPECT_EQ(reporter.incrementCounter("custom", 5), 5);
    EXPECT_EQ(reporter.incrementCounter("custom"), 6);
}

TEST(LoggingErrorReporterTest, NonStandardExceptionsAreDescribed) {
    CapturedLogger captured;
    LoggingErrorReporter reporter(captured.logger);
    std::optional<ErrorReport> received;
    reporter.setErrorReportedCallback([&](const ErrorReport& report) { received = report; });

    reporter.reportError(std::make_exception_ptr(42), "Loader");
    ASSERT_TRUE(received.has_value());
    EXPECT_FALSE(received->message.empty());
}
