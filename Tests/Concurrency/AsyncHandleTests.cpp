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
#include "Concurrency/AsyncHandle.h"
#include "Concurrency/OperationErrors.h"

using namespace Cadence::Core::Concurrency;
using namespace std::chrono_literals;

TEST(AsyncHandleTest, DefaultHandleIsInvalidAndPending) {
    AsyncHandle<int> handle;
    EXPECT_FALSE(handle.valid());
    EXPECT_EQ(handle.status(), AsyncStatus::Pending);
    EXPECT_FALSE(handle.isComplete());
    EXPECT_FALSE(handle.waitFor(1ms));
    EXPECT_THROW(handle.get(), std::logic_error);
}

TEST(AsyncHandleTest, CompletedAndFailedFactories) {
    auto ok = AsyncHandle<int>::completed(5);
    EXPECT_EQ(ok.status(), AsyncStatus::Complete);
    EXPECT_EQ(ok.get(), 5);

    auto bad = AsyncHandle<int>::failed(std::make_exception_ptr(std::runtime_error("nope")));
    EXPECT_EQ(bad.status(), AsyncStatus::Failed);
    EXPECT_THROW(bad.get(), std::runtime_error);
    EXPECT_EQ(describeException(bad.error()), "nope");
}

TEST(AsyncHandleTest, CancellationExceptionMapsToCancelledStatus) {
    auto handle = DispatchHandle::failed(std::make_exception_ptr(OperationCancelledException()));
    EXPECT_EQ(handle.status(), AsyncStatus::Cancelled);
    EXPECT_THROW(handle.get(), OperationCancelledException);
}

TEST(AsyncHandleTest, FirstCompletionWins) {
    AsyncPromise<int> promise;
    EXPECT_TRUE(promise.setValue(1));
    EXPECT_FALSE(promise.setValue(2));
    EXPECT_FALSE(promise.setException(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_EQ(promise.handle().get(), 1);
}

TEST(AsyncHandleTest, WaitBlocksUntilAnotherThreadCompletes) {
    AsyncPromise<std::string> promise;
    auto handle = promise.handle();

    std::thread producer([promise]() mutable {
        std::this_thread::sleep_for(10ms);
        promise.setValue("done");
    });

    EXPECT_EQ(handle.get(), "done");
    EXPECT_TRUE(isTerminal(handle.status()));
    producer.join();
}

TEST(AsyncHandleTest, OnCompleteRunsInlineOrOnCompletion) {
    AsyncPromise<void> promise;
    auto handle = promise.handle();
    int calls = 0;

    handle.onComplete([&] { ++calls; });
    EXPECT_EQ(calls, 0);
    promise.setValue();
    EXPECT_EQ(calls, 1);

    handle.onComplete([&] { ++calls; });
    EXPECT_EQ(calls, 2);
}

TEST(AsyncHandleTest, FulfillCapturesExceptions) {
    AsyncPromise<int> promise;
    fulfill(promise, []() -> int { throw std::out_of_range("index"); });
    EXPECT_EQ(promise.handle().status(), AsyncStatus::Failed);
    EXPECT_THROW(promise.handle().get(), std::out_of_range);
}

TEST(AsyncHandleTest, WaitPumpsTheProgressHook) {
    AsyncPromise<void> promise;
    std::atomic<int> pumped{0};
    auto* raw = &promise;
    promise.setProgressHook([&pumped, raw] {
        if (++pumped == 3) raw->setValue();
    });

    promise.handle().wait();
    EXPECT_GE(pumped.load(), 3);
}
