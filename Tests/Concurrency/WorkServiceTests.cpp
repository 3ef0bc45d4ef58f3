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
#include <set>
#include <thread>
#include <vector>
#include "Concurrency/WorkService.h"

using namespace Cadence::Core;
using namespace Cadence::Core::Concurrency;
using namespace std::chrono_literals;

TEST(WorkServiceTest, IdentifiesItselfAsService) {
    WorkService service;
    EXPECT_STREQ(service.id(), "com.cadence.core.work");
    EXPECT_EQ(service.typeId(), TypeSystem::createTypeId<WorkService>());
    EXPECT_GE(service.threadCount(), 1u);
}

TEST(WorkServiceTest, SubmitBeforeStartIsRejected) {
    WorkService service(WorkService::Config{2});
    EXPECT_EQ(service.submit([] {}), WorkService::SubmitResult::NotRunning);

    auto handle = service.submitTask([] { return 1; });
    EXPECT_EQ(handle.status(), AsyncStatus::Failed);
    EXPECT_THROW(handle.get(), std::runtime_error);
}

TEST(WorkServiceTest, TasksRunOnWorkersAndReturnResults) {
    WorkService service(WorkService::Config{4});
    service.start();

    std::vector<AsyncHandle<int>> handles;
    for (int i = 0; i < 32; ++i) {
        handles.push_back(service.submitTask([i] { return i * i; }));
    }
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(handles[i].get(), i * i);
    }

    auto onWorker = service.submitTask([&service] { return service.isWorkerThread(); });
    EXPECT_TRUE(onWorker.get());
    EXPECT_FALSE(service.isWorkerThread());

    service.stop();
    EXPECT_GE(service.executedCount(), 33u);
}

TEST(WorkServiceTest, ExceptionsTravelThroughTheHandle) {
    WorkService service(WorkService::Config{1});
    service.start();
    auto handle = service.submitTask([]() -> int { throw std::runtime_error("worker failed"); });
    EXPECT_THROW(handle.get(), std::runtime_error);
    EXPECT_EQ(handle.status(), AsyncStatus::Failed);
    service.stop();
}

TEST(WorkServiceTest, StopDrainsQueuedWork) {
    WorkService service(WorkService::Config{1});
    service.start();

    std::atomic<int> ran{0};
    for (int i = 0; i < 20; ++i) {
        service.submit([&ran] {
            std::this_thread::sleep_for(1ms);
            ++ran;
        });
    }
    service.stop();

    EXPECT_EQ(ran.load(), 20);
    EXPECT_FALSE(service.isRunning());
    EXPECT_EQ(service.submit([] {}), WorkService::SubmitResult::NotRunning);
}

TEST(WorkServiceTest, QueueLimitReportsFull) {
    WorkService::Config config;
    config.threadCount = 1;
    config.maxQueuedWork = 1;
    WorkService service(config);
    service.start();

    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    service.submit([&] {
        started.store(true);
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });
    while (!started.load()) std::this_thread::sleep_for(1ms);

    EXPECT_EQ(service.submit([] {}), WorkService::SubmitResult::Scheduled);
    EXPECT_EQ(service.submit([] {}), WorkService::SubmitResult::QueueFull);

    release.store(true);
    service.stop();
}

TEST(WorkServiceTest, RestartAfterStop) {
    WorkService service(WorkService::Config{2});
    service.start();
    service.stop();
    service.start();
    EXPECT_TRUE(service.isRunning());
    EXPECT_EQ(service.submitTask([] { return 3; }).get(), 3);
    service.stop();
}
