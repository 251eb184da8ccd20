//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "courier/scheduler/ThreadPoolScheduler.hpp"

using courier::scheduler::ThreadPoolScheduler;

const static std::chrono::milliseconds sleep_time(1);

class ThreadPoolSchedulerTest : public ::testing::TestWithParam<int> {
protected:

    void SetUp() override {
        sched = std::make_shared<ThreadPoolScheduler>(GetParam());
    }

    void awaitIdle() {
        int num_retries = 1000;
        while(num_retries > 0) {
            if(sched->isIdle()) {
                return;
            } else {
                std::this_thread::sleep_for(sleep_time);
                num_retries--;
            }
        }

        FAIL() << "Expected scheduler to return to idle within 1 second.";
    }

    std::shared_ptr<ThreadPoolScheduler> sched;
};

TEST_P(ThreadPoolSchedulerTest, IdlesAtStart) {
    EXPECT_TRUE(sched->isIdle());
}

TEST_P(ThreadPoolSchedulerTest, SubmitSingle) {
    std::promise<std::thread::id> ran;
    auto ranOn = ran.get_future();

    sched->submit([&ran] {
        ran.set_value(std::this_thread::get_id());
    });

    EXPECT_NE(ranOn.get(), std::this_thread::get_id());
    awaitIdle();
}

TEST_P(ThreadPoolSchedulerTest, SubmitBulk) {
    const static int num_tasks = 100;
    std::atomic_int num_executed(0);
    std::promise<void> done;
    auto finished = done.get_future();

    std::vector<std::function<void()>> tasks;
    for(int i = 0; i < num_tasks; i++) {
        tasks.push_back([&num_executed, &done] {
            if(++num_executed == num_tasks) {
                done.set_value();
            }
        });
    }

    sched->submitBulk(tasks);

    ASSERT_EQ(finished.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(num_executed.load(), num_tasks);
    awaitIdle();
}

TEST_P(ThreadPoolSchedulerTest, SubmitAfter) {
    std::promise<void> fired;
    auto firedFuture = fired.get_future();

    auto before = std::chrono::steady_clock::now();
    sched->submitAfter(25, [&fired] {
        fired.set_value();
    });
    firedFuture.wait();
    auto after = std::chrono::steady_clock::now();

    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(after - before).count();
    EXPECT_GE(milliseconds, 25);
    awaitIdle();
}

TEST_P(ThreadPoolSchedulerTest, SubmitAfterCancel) {
    std::atomic_int timer_counter(0);
    std::atomic_int cancel_counter(0);
    std::promise<void> fired;
    auto firedFuture = fired.get_future();

    auto firstHandle = sched->submitAfter(25, [&timer_counter] { timer_counter++; });
    auto secondHandle = sched->submitAfter(25, [&fired] { fired.set_value(); });

    firstHandle->onCancel([&cancel_counter] { cancel_counter++; });
    secondHandle->onCancel([&cancel_counter] { cancel_counter++; });

    firstHandle->cancel();
    firstHandle->cancel();

    firedFuture.wait();
    awaitIdle();

    EXPECT_EQ(cancel_counter.load(), 1);
    EXPECT_EQ(timer_counter.load(), 0);
}

TEST_P(ThreadPoolSchedulerTest, RunsShutdownCallbackAfterTimerTaskCompletion) {
    std::promise<void> shutdown;
    auto shutdownFuture = shutdown.get_future();

    auto cancelable = sched->submitAfter(25, [] {});
    cancelable->onShutdown([&shutdown] {
        shutdown.set_value();
    });

    EXPECT_EQ(shutdownFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    awaitIdle();
}

TEST_P(ThreadPoolSchedulerTest, DestroyedFromOwnWorker) {
    std::promise<void> released;
    auto releasedFuture = released.get_future();

    auto pool = std::make_shared<ThreadPoolScheduler>(GetParam());

    pool->submit([pool, &released]() mutable {
        pool.reset();
        released.set_value();
    });
    pool.reset();

    EXPECT_EQ(releasedFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

INSTANTIATE_TEST_SUITE_P(Scheduler, ThreadPoolSchedulerTest, ::testing::Values(1, 2, 4, 16));
