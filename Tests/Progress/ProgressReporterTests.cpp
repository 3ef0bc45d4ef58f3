/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>
#include "Progress/ProgressReporter.h"

using namespace Cadence::Core::Progress;

TEST(ProgressReporterTest, StartsAtZero) {
    ProgressReporter reporter;
    EXPECT_DOUBLE_EQ(reporter.percentage(), 0.0);
    EXPECT_TRUE(reporter.statusMessage().empty());
}

TEST(ProgressReporterTest, ValuesAreClampedAndNeverDecrease) {
    ProgressReporter reporter;
    std::vector<double> seen;
    reporter.subscribe([&](const ProgressChangedEvent& e) { seen.push_back(e.percentage); });

    reporter.reportProgress(40.0);
    reporter.reportProgress(25.0);
    reporter.reportProgress(-10.0);
    reporter.reportProgress(250.0);
    reporter.reportProgress(std::numeric_limits<double>::quiet_NaN());

    EXPECT_EQ(seen, (std::vector<double>{40.0, 40.0, 40.0, 100.0, 100.0}));
    EXPECT_DOUBLE_EQ(reporter.percentage(), 100.0);
}

TEST(ProgressReporterTest, MessageIsKeptUntilReplaced) {
    ProgressReporter reporter;
    ProgressChangedEvent last;
    reporter.subscribe([&](const ProgressChangedEvent& e) { last = e; });

    reporter.reportProgress("Querying database...", 30.0);
    EXPECT_EQ(last.message, "Querying database...");

    reporter.reportProgress(45.0);
    EXPECT_EQ(last.message, "Querying database...");
    EXPECT_DOUBLE_EQ(last.percentage, 45.0);

    reporter.reportProgress("Processing results...", 60.0);
    EXPECT_EQ(reporter.statusMessage(), "Processing results...");
}

TEST(ProgressReporterTest, ResetNotifiesAndAllowsLowerValues) {
    ProgressReporter reporter;
    reporter.reportProgress("Done", 100.0);

    std::vector<ProgressChangedEvent> events;
    reporter.subscribe([&](const ProgressChangedEvent& e) { events.push_back(e); });

    reporter.reset();
    reporter.reportProgress(10.0);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_DOUBLE_EQ(events[0].percentage, 0.0);
    EXPECT_TRUE(events[0].message.empty());
    EXPECT_DOUBLE_EQ(events[1].percentage, 10.0);
}

TEST(ProgressReporterTest, StepQuantization) {
    ProgressReporter reporter(ProgressReporter::Config{4});
    reporter.reportProgress(30.0);
    EXPECT_DOUBLE_EQ(reporter.percentage(), 25.0);
    reporter.reportProgress(74.9);
    EXPECT_DOUBLE_EQ(reporter.percentage(), 50.0);
    reporter.reportProgress(100.0);
    EXPECT_DOUBLE_EQ(reporter.percentage(), 100.0);
}

TEST(ProgressReporterTest, ElapsedIsReported) {
    ProgressReporter reporter;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ProgressChangedEvent last;
    reporter.subscribe([&](const ProgressChangedEvent& e) { last = e; });
    reporter.reportProgress(1.0);
    EXPECT_GE(last.elapsed, std::chrono::milliseconds(5));
}

TEST(ProgressReporterTest, ConcurrentReportersStayMonotonic) {
    for (int iteration = 0; iteration < 50; ++iteration) {
        ProgressReporter reporter;
        std::vector<double> delivered;
        std::mutex seenMutex;
        reporter.subscribe([&](const ProgressChangedEvent& e) {
            std::lock_guard<std::mutex> lock(seenMutex);
            delivered.push_back(e.percentage);
        });

        std::thread low([&reporter] {
            for (int i = 1; i <= 50; ++i) reporter.reportProgress(i);
        });
        std::thread high([&reporter] {
            for (int i = 41; i <= 90; ++i) reporter.reportProgress(i);
        });
        low.join();
        high.join();

        ASSERT_EQ(delivered.size(), 100u);
        EXPECT_TRUE(std::is_sorted(delivered.begin(), delivered.end())) << "iteration " << iteration;
        EXPECT_DOUBLE_EQ(delivered.back(), 90.0);
        EXPECT_DOUBLE_EQ(reporter.percentage(), 90.0);
    }
}

TEST(ProgressReporterTest, UnsubscribedHandlerIsNotCalled) {
    ProgressReporter reporter;
    int calls = 0;
    auto id = reporter.subscribe([&](const ProgressChangedEvent&) { ++calls; });
    reporter.reportProgress(5.0);
    EXPECT_TRUE(reporter.unsubscribe(id));
    reporter.reportProgress(6.0);
    EXPECT_EQ(calls, 1);
}
