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
#include "Concurrency/OperationErrors.h"

using namespace Cadence::Core::Concurrency;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, NoneTokenIsNeverCancelled) {
    auto token = CancellationToken::none();
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_FALSE(token.isCancellationRequested());
    EXPECT_EQ(token.epoch(), 0u);
    EXPECT_NO_THROW(token.throwIfCancellationRequested());
}

TEST(CancellationTokenTest, CancelSignalsEveryTokenOfTheEpoch) {
    CancellationSource source;
    auto a = source.token();
    auto b = source.token();
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.isCancellationRequested());

    source.cancel();

    EXPECT_TRUE(a.isCancellationRequested());
    EXPECT_TRUE(b.isCancellationRequested());
    EXPECT_TRUE(source.isCancellationRequested());
    EXPECT_THROW(a.throwIfCancellationRequested(), OperationCancelledException);
}

TEST(CancellationTokenTest, CancelledExceptionCarriesEpoch) {
    CancellationSource source;
    auto token = source.token();
    source.cancel();

    try {
        token.throwIfCancellationRequested();
        FAIL() << "expected OperationCancelledException";
    } catch (const OperationCancelledException& e) {
        EXPECT_EQ(e.epoch(), token.epoch());
        EXPECT_TRUE(isCancellation(std::current_exception()));
    }
}

TEST(CancellationTokenTest, ResetInvalidatesPreviousEpoch) {
    CancellationSource source;
    auto stale = source.token();
    auto firstEpoch = source.epoch();

    auto fresh = source.reset();

    EXPECT_TRUE(stale.isCancellationRequested());
    EXPECT_FALSE(fresh.isCancellationRequested());
    EXPECT_GT(source.epoch(), firstEpoch);
    EXPECT_EQ(source.token(), fresh);
    EXPECT_FALSE(stale == fresh);
}

TEST(CancellationTokenTest, WaitForReturnsEarlyOnCancel) {
    CancellationSource source;
    auto token = source.token();

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    bool cancelled = token.waitFor(5s);
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(cancelled);
    EXPECT_LT(waited, 2s);
}

TEST(CancellationTokenTest, WaitForTimesOutWithoutCancel) {
    CancellationSource source;
    EXPECT_FALSE(source.token().waitFor(10ms));
}

TEST(CancellationTokenTest, CallbacksRunOnceAndRegistrationCanBeReleased) {
    CancellationSource source;
    auto token = source.token();
    std::atomic<int> kept{0};
    std::atomic<int> dropped{0};

    auto keep = token.registerCallback([&] { ++kept; });
    {
        auto drop = token.registerCallback([&] { ++dropped; });
        EXPECT_TRUE(static_cast<bool>(drop));
    }

    source.cancel();
    source.cancel();

    EXPECT_EQ(kept.load(), 1);
    EXPECT_EQ(dropped.load(), 0);
}

TEST(CancellationTokenTest, CallbackOnCancelledTokenRunsInline) {
    CancellationSource source;
    source.cancel();
    bool ran = false;
    auto registration = source.token().registerCallback([&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_FALSE(static_cast<bool>(registration));
}

TEST(CancellationTokenTest, LinkedSourceFollowsEitherParent) {
    CancellationSource first;
    CancellationSource second;

    auto linkedA = CancellationSource::createLinked(first.token(), second.token());
    auto linkedB = CancellationSource::createLinked(first.token(), second.token());

    second.cancel();
    EXPECT_TRUE(linkedA->token().isCancellationRequested());
    EXPECT_TRUE(linkedB->token().isCancellationRequested());
    EXPECT_FALSE(first.isCancellationRequested());
}

TEST(CancellationTokenTest, LinkedSourceCancelDoesNotReachParents) {
    CancellationSource parent;
    auto linked = CancellationSource::createLinked(parent.token(), CancellationToken::none());

    linked->cancel();

    EXPECT_TRUE(linked->isCancellationRequested());
    EXPECT_FALSE(parent.isCancellationRequested());
}

TEST(CancellationTokenTest, LinkedToAlreadyCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    auto linked = CancellationSource::createLinked(parent.token(), CancellationToken::none());
    EXPECT_TRUE(linked->isCancellationRequested());
}
