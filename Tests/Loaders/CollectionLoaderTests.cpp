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
#include <chrono>
#include <mutex>
#include <thread>
#include "Concurrency/InlineDispatcher.h"
#include "Concurrency/WorkService.h"
#include "Core/TimerService.h"
#include "Loaders/CollectionLoader.h"
#include "Operations/AsyncOperationExecutor.h"
#include "Operations/LoggingErrorReporter.h"
#include "TestHelpers/CaptureSink.h"
#include "TestHelpers/FakeRepository.h"

using namespace Cadence::Core;
using namespace Cadence::Core::Collections;
using namespace Cadence::Core::Concurrency;
using namespace Cadence::Core::Data;
using namespace Cadence::Core::Loaders;
using namespace Cadence::Core::Logging;
using namespace Cadence::Core::Operations;
using namespace Cadence::Core::Progress;
using namespace Cadence::Testing;
using namespace std::chrono_literals;

using EnterpriseLoader = CollectionLoader<Enterprise>;

class CollectionLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository = std::make_shared<FakeEnterpriseRepository>(fourEnterprises());
        reporter = std::make_shared<LoggingErrorReporter>(captured.logger);
        reporter->setSuppressUserDialogs(true);
        executor = std::make_unique<AsyncOperationExecutor>(captured.logger, reporter);
        work = std::make_unique<WorkService>(WorkService::Config{2});
        work->start();
    }

    void TearDown() override {
        repository->release();
        work->stop();
    }

    EnterpriseLoader::Config fastRetry(int maxRetries = 2) {
        EnterpriseLoader::Config config;
        config.name = "EnterpriseLoader";
        config.operationName = "Loading Enterprises";
        config.statusMessage = "Loading enterprises...";
        config.retry.maxRetries = maxRetries;
        config.retry.initialDelay = 1ms;
        return config;
    }

    std::unique_ptr<EnterpriseLoader> makeLoader(EnterpriseLoader::Config config) {
        return std::make_unique<EnterpriseLoader>(repository, collection, *executor, std::move(config),
                                                  work.get(), captured.logger);
    }

    size_t retryWarnings() const {
        size_t count = 0;
        for (const auto& entry : captured.sink->entries()) {
            if (entry.level == LogLevel::Warning && entry.category == "Retry") ++count;
        }
        return count;
    }

    CapturedLogger captured;
    std::shared_ptr<FakeEnterpriseRepository> repository;
    std::shared_ptr<LoggingErrorReporter> reporter;
    std::unique_ptr<AsyncOperationExecutor> executor;
    std::unique_ptr<WorkService> work;
    InlineDispatcher dispatcher;
    ThreadSafeCollection<Enterprise> collection{dispatcher};
};

TEST_F(CollectionLoaderTest, RecoversAfterTransientFailures) {
    repository->failFirst(2);
    auto loader = makeLoader(fastRetry(2));

    auto outcome = loader->load();

    EXPECT_EQ(outcome, LoadOutcome::Loaded);
    EXPECT_EQ(repository->fetchCount(), 3);
    EXPECT_EQ(collection.snapshot(), fourEnterprises());
    EXPECT_FALSE(executor->state().isLoading());
    EXPECT_TRUE(executor->state().statusMessage().empty());
    EXPECT_FALSE(loader->isLoading());
    EXPECT_EQ(retryWarnings(), 2u);
    EXPECT_EQ(loader->lastOutcome(), LoadOutcome::Loaded);
    EXPECT_FALSE(loader->lastError());
}

TEST_F(CollectionLoaderTest, ReplacementRaisesOneReset) {
    collection.addAsync(Enterprise{99, "Stale", "Old"}).get();
    int resets = 0;
    int others = 0;
    collection.subscribe([&](const CollectionChange<Enterprise>& change) {
        (change.action == CollectionChangeAction::Reset ? resets : others)++;
    });

    makeLoader(fastRetry())->load();

    EXPECT_EQ(resets, 1);
    EXPECT_EQ(others, 0);
    EXPECT_EQ(collection.size(), 4u);
}

TEST_F(CollectionLoaderTest, ExhaustedRetriesFailAndReport) {
    repository->setAlwaysFail(true);
    auto loader = makeLoader(fastRetry(2));

    auto outcome = loader->load();

    EXPECT_EQ(outcome, LoadOutcome::Failed);
    EXPECT_EQ(repository->fetchCount(), 3);
    EXPECT_THROW(std::rethrow_exception(loader->lastError()), RetryExhaustedException);
    EXPECT_EQ(reporter->counter("errors"), 1);
    EXPECT_FALSE(executor->state().isLoading());
    EXPECT_TRUE(collection.empty());
}

TEST_F(CollectionLoaderTest, FallbackAppliedOnFailure) {
    repository->setAlwaysFail(true);
    auto config = fastRetry(0);
    config.fallback = [] { return std::vector<Enterprise>{{1, "Fallback Corp", "Sample"}}; };
    auto loader = makeLoader(std::move(config));

    EXPECT_EQ(loader->load(), LoadOutcome::Failed);
    ASSERT_EQ(collection.size(), 1u);
    EXPECT_EQ(collection[0].name, "Fallback Corp");
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Info, "applying fallback data"), 1u);
}

TEST_F(CollectionLoaderTest, FallbackUsedForEmptyResults) {
    repository->setRecords({});
    auto config = fastRetry();
    config.fallback = [] { return sampleEnterprises(); };
    auto loader = makeLoader(std::move(config));

    EXPECT_EQ(loader->load(), LoadOutcome::Loaded);
    EXPECT_EQ(collection.snapshot(), sampleEnterprises());
}

TEST_F(CollectionLoaderTest, OverlappingLoadIsSkipped) {
    repository->closeGate();
    auto loader = makeLoader(fastRetry());

    auto first = loader->loadAsync(*work);
    ASSERT_TRUE(repository->waitForEntered(1));
    EXPECT_TRUE(loader->isLoading());

    EXPECT_EQ(loader->load(), LoadOutcome::SkippedDuplicate);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Info,
              "Load already in progress, skipping duplicate request"), 1u);

    repository->release();
    EXPECT_EQ(first.get(), LoadOutcome::Loaded);
    EXPECT_EQ(repository->fetchCount(), 1);
    EXPECT_EQ(loader->lastOutcome(), LoadOutcome::Loaded);
}

TEST_F(CollectionLoaderTest, TimerAndManualLoadsCoalesce) {
    TimerService timers;
    timers.setWorkService(work.get());
    timers.start();

    repository->closeGate();
    auto loader = makeLoader(fastRetry());
    loader->enableAutoRefresh(timers, 10ms);
    EXPECT_TRUE(loader->autoRefreshEnabled());
    ASSERT_TRUE(repository->waitForEntered(1));

    EXPECT_EQ(loader->load(), LoadOutcome::SkippedDuplicate);
    EXPECT_EQ(repository->fetchCount(), 1);

    // Disabling waits for the in-flight refresh, so let it finish first
    repository->release();
    loader->disableAutoRefresh();
    EXPECT_FALSE(loader->autoRefreshEnabled());
    timers.stop();
}

TEST_F(CollectionLoaderTest, SlowQueryTimesOut) {
    repository->closeGate();
    auto config = fastRetry(0);
    config.timeout = 50ms;
    auto loader = makeLoader(std::move(config));
    StepProgressTracker tracker(captured.logger);
    ProgressReporter progress;

    std::mutex progressMutex;
    double highestShown = 0.0;
    executor->state().subscribe([&](OperationProperty p) {
        if (p != OperationProperty::ProgressPercentage) return;
        auto value = executor->state().progressPercentage();
        std::lock_guard<std::mutex> lock(progressMutex);
        if (value) highestShown = std::max(highestShown, *value);
    });

    auto outcome = loader->loadWithSteps(tracker, &progress);

    EXPECT_EQ(outcome, LoadOutcome::TimedOut);
    EXPECT_EQ(captured.sink->countContaining(LogLevel::Warning, "Query timed out after 50ms"), 1u);
    EXPECT_EQ(tracker.statusMessage(), "Operation failed: Operation timed out after 50ms");
    // A timed-out load never shows a finished bar
    EXPECT_LT(progress.percentage(), 100.0);
    {
        std::lock_guard<std::mutex> lock(progressMutex);
        EXPECT_LT(highestShown, 100.0);
    }
    EXPECT_FALSE(executor->state().isLoading());
    EXPECT_FALSE(executor->state().progressPercentage().has_value());
    EXPECT_FALSE(loader->isLoading());
    EXPECT_TRUE(collection.empty());
}

TEST_F(CollectionLoaderTest, NonStandardFailureStaysInsideLoad) {
    repository->setThrowOpaque(true);
    auto config = fastRetry(2);
    config.retry.shouldRetry = [](std::exception_ptr) { return false; };
    config.fallback = [] { return std::vector<Enterprise>{{1, "Fallback Corp", "Sample"}}; };
    auto loader = makeLoader(std::move(config));
    StepProgressTracker tracker(captured.logger);

    LoadOutcome outcome = LoadOutcome::Loaded;
    EXPECT_NO_THROW(outcome = loader->loadWithSteps(tracker));

    EXPECT_EQ(outcome, LoadOutcome::Failed);
    EXPECT_EQ(repository->fetchCount(), 1);
    EXPECT_THROW(std::rethrow_exception(loader->lastError()), OpaqueRepositoryFailure);
    EXPECT_EQ(loader->lastOutcome(), LoadOutcome::Failed);
    EXPECT_EQ(tracker.statusMessage(), "Operation failed: Load failed: unknown error");
    ASSERT_EQ(collection.size(), 1u);
    EXPECT_EQ(collection[0].name, "Fallback Corp");
    EXPECT_FALSE(executor->state().isLoading());
    EXPECT_FALSE(loader->isLoading());
}

TEST_F(CollectionLoaderTest, TimeoutRequiresWorkService) {
    auto config = fastRetry();
    config.timeout = 10ms;
    EXPECT_THROW((void)EnterpriseLoader(repository, collection, *executor, config, nullptr, captured.logger),
                 std::invalid_argument);
    EXPECT_THROW((void)EnterpriseLoader(nullptr, collection, *executor, fastRetry(), nullptr, captured.logger),
                 std::invalid_argument);
}

TEST_F(CollectionLoaderTest, ExecutorCancellationEndsTheLoad) {
    repository->closeGate();
    auto loader = makeLoader(fastRetry());

    auto handle = loader->loadAsync(*work);
    ASSERT_TRUE(repository->waitForEntered(1));
    executor->cancelOperations();

    EXPECT_EQ(handle.get(), LoadOutcome::Cancelled);
    EXPECT_EQ(repository->fetchCount(), 1);
    EXPECT_EQ(reporter->counter("errors"), 0);
    EXPECT_THROW(std::rethrow_exception(loader->lastError()), OperationCancelledException);
}

TEST_F(CollectionLoaderTest, TrackerCancellationEndsTheLoad) {
    repository->closeGate();
    auto loader = makeLoader(fastRetry());
    StepProgressTracker tracker(captured.logger);

    auto handle = work->submitTask([&] { return loader->loadWithSteps(tracker); });
    ASSERT_TRUE(repository->waitForEntered(1));
    tracker.cancelOperation();

    EXPECT_EQ(handle.get(), LoadOutcome::Cancelled);
    EXPECT_EQ(tracker.statusMessage(), "Operation cancelled");
    EXPECT_TRUE(collection.empty());
}

TEST_F(CollectionLoaderTest, StepsAllCompleteOnSuccess) {
    auto loader = makeLoader(fastRetry());
    StepProgressTracker tracker(captured.logger);
    ProgressReporter progress;
    std::vector<size_t> stepIndices;
    tracker.subscribe([&](const StepProgressEvent& e) {
        if (e.kind == StepProgressEventKind::StepChanged) stepIndices.push_back(e.stepIndex);
    });

    EXPECT_EQ(loader->loadWithSteps(tracker, &progress), LoadOutcome::Loaded);

    auto steps = tracker.steps();
    ASSERT_EQ(steps.size(), 6u);
    for (const auto& s : steps) EXPECT_TRUE(s.isCompleted);
    EXPECT_EQ(stepIndices, (std::vector<size_t>{0, 1, 2, 3, 4, 5}));
    EXPECT_EQ(tracker.statusMessage(), "Operation completed successfully");
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}

TEST(CollectionLoaderStepsTest, DefaultStepTitles) {
    auto steps = EnterpriseLoader::defaultSteps();
    ASSERT_EQ(steps.size(), 6u);
    EXPECT_EQ(steps[0].title, "Initializing");
    EXPECT_EQ(steps[1].title, "Connecting");
    EXPECT_EQ(steps[2].title, "Querying");
    EXPECT_EQ(steps[3].title, "Processing");
    EXPECT_EQ(steps[4].title, "Updating");
    EXPECT_EQ(steps[5].title, "Finalizing");
}
