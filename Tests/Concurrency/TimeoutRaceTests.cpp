/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "Concurrency/CancellationToken.h"
#include "Concurrency/TimeoutRace.h"
#include "Concurrency/WorkService.h"

using namespace Cadence::Core::Concurrency;
using namespace std::chrono_literals;

class TimeoutRaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        workService = std::make_unique<WorkService>(WorkService::Config{2});
        workService->start();
    }

    void TearDown() override {
        release.store(true);
        workService->stop();
    }

    std::unique_ptr<WorkService> workService;
    std::atomic<bool> release{false};
};

TEST_F(TimeoutRaceTest, FastOperationWins) {
    auto race = raceWithTimeout(workService->submitTask([] { return 9; }), 5s);
    EXPECT_EQ(race.outcome, RaceOutcome::Completed);
    EXPECT_TRUE(race.completed());
    EXPECT_EQ(race.get(), 9);
}

TEST_F(TimeoutRaceTest, FailedOperationStillCountsAsCompleted) {
    auto race = raceWithTimeout(workService->submitTask([]() -> int { throw std::runtime_error("x"); }), 5s);
    EXPECT_EQ(race.outcome, RaceOutcome::Completed);
    EXPECT_THROW(race.get(), std::runtime_error);
}

TEST_F(TimeoutRaceTest, DelayWinsAgainstSlowOperation) {
    auto handle = workService->submitTask([this] {
        while (!release.load()) std::this_thread::sleep_for(1ms);
        return 1;
    });

    auto start = std::chrono::steady_clock::now();
    auto race = raceWithTimeout(handle, 30ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(race.outcome, RaceOutcome::TimedOut);
    EXPECT_FALSE(race.completed());
    EXPECT_GE(elapsed, 30ms);
    EXPECT_LT(elapsed, 2s);

    // The operation keeps running after losing
    EXPECT_FALSE(handle.isComplete());
    release.store(true);
    EXPECT_EQ(handle.get(), 1);
}

TEST_F(TimeoutRaceTest, CancellationEndsTheRace) {
    CancellationSource source;
    auto handle = workService->submitTask([this] {
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });
    auto race = raceWithTimeout(handle, 10s, source.token());
    canceller.join();

    EXPECT_EQ(race.outcome, RaceOutcome::Cancelled);
}
