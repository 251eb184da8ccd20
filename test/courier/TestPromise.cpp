//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <thread>
#include "gtest/gtest.h"
#include "courier/Promise.hpp"
#include "courier/scheduler/BenchScheduler.hpp"
#include "courier/scheduler/ThreadPoolScheduler.hpp"

using courier::Outcome;
using courier::Promise;
using courier::Termination;
using courier::scheduler::BenchScheduler;
using courier::scheduler::ThreadPoolScheduler;

TEST(Promise, StartsIncomplete) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);

    EXPECT_FALSE(promise->get().has_value());
    EXPECT_FALSE(promise->isCancelled());
}

TEST(Promise, CompletesWithValue) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);

    promise->success(123);

    auto result = promise->get();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_value());
    EXPECT_EQ(result->get_value(), 123);
}

TEST(Promise, CompletesEmpty) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);

    promise->empty();

    auto result = promise->get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->termination(), Termination::Empty);
}

TEST(Promise, ThrowsOnSecondCompletion) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);

    promise->success(123);
    EXPECT_THROW(promise->success(456), std::runtime_error);
    EXPECT_THROW(promise->error("broke"), std::runtime_error);
    EXPECT_EQ(promise->get()->get_value(), 123);
}

TEST(Promise, IgnoresCompletionAfterCancel) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);
    int cancel_counter = 0;

    promise->onCancel([&cancel_counter] { cancel_counter++; });
    promise->cancel();
    promise->cancel();
    promise->success(123);

    EXPECT_TRUE(promise->isCancelled());
    EXPECT_FALSE(promise->get().has_value());
    EXPECT_EQ(cancel_counter, 1);
}

TEST(Promise, SubmitsCompletionCallbacksToScheduler) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);
    std::optional<int> received;

    promise->onComplete([&received](auto outcome) {
        received = outcome.get_value();
    });

    promise->success(123);
    EXPECT_FALSE(received.has_value());

    sched->run_ready_tasks();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, 123);
}

TEST(Promise, CallbackRegisteredAfterCompletionStillRuns) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);
    std::optional<std::string> received;

    promise->error("broke");
    promise->onComplete([&received](auto outcome) {
        received = outcome.get_error();
    });

    sched->run_ready_tasks();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, "broke");
}

TEST(Promise, AwaitBlocksUntilCompletedFromAnotherThread) {
    auto sched = std::make_shared<ThreadPoolScheduler>(2);
    auto promise = Promise<int,std::string>::create(sched);

    sched->submitAfter(10, [promise] {
        promise->success(123);
    });

    auto outcome = promise->await();
    ASSERT_TRUE(outcome.is_value());
    EXPECT_EQ(outcome.get_value(), 123);
}

TEST(Promise, AwaitThrowsWhenCanceled) {
    auto sched = std::make_shared<BenchScheduler>();
    auto promise = Promise<int,std::string>::create(sched);

    promise->cancel();
    EXPECT_THROW(promise->await(), std::runtime_error);
}
