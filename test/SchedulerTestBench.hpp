#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "courier/Scheduler.hpp"
#include "courier/scheduler/ThreadPoolScheduler.hpp"

struct SchedulerTestBenchEntry {
    std::function<std::shared_ptr<courier::Scheduler>()> factory;
    std::string name;
};

static const SchedulerTestBenchEntry SchedulerTestEntries[] = {
    { []() { return std::make_shared<courier::scheduler::ThreadPoolScheduler>(1); }, "ThreadPoolScheduler_1thread" },
    { []() { return std::make_shared<courier::scheduler::ThreadPoolScheduler>(2); }, "ThreadPoolScheduler_2threads" },
    { []() { return std::make_shared<courier::scheduler::ThreadPoolScheduler>(4); }, "ThreadPoolScheduler_4threads" },
    { []() { return std::make_shared<courier::scheduler::ThreadPoolScheduler>(8); }, "ThreadPoolScheduler_8threads" },
};

class SchedulerTestBench : public ::testing::TestWithParam<SchedulerTestBenchEntry> {
public:
    std::shared_ptr<courier::Scheduler> sched;

    void awaitIdle() {
        const static std::chrono::milliseconds sleep_time(1);

        int num_retries = 60000;
        while(num_retries > 0) {
            if(sched->isIdle()) {
                return;
            } else {
                std::this_thread::sleep_for(sleep_time);
                num_retries--;
            }
        }

        FAIL() << "Expected scheduler to return to idle within 60 seconds.";
    }

protected:
    void SetUp() override {
        sched = GetParam().factory();
    }
};

#define GENERATE_SCHEDULER_TEST_BENCH_FIXTURE(testName) \
    class testName : public SchedulerTestBench {};


#define INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(testName) \
    GENERATE_SCHEDULER_TEST_BENCH_FIXTURE(testName) \
    INSTANTIATE_TEST_SUITE_P( \
        testName, \
        testName, \
        ::testing::ValuesIn(SchedulerTestEntries), \
        [](const ::testing::TestParamInfo<SchedulerTestBenchEntry>& info) { \
            return info.param.name; \
        })
