//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_THREAD_POOL_SCHEDULER_H_
#define _COURIER_THREAD_POOL_SCHEDULER_H_

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <tuple>
#include <vector>

#include "../Scheduler.hpp"

namespace courier::scheduler {

/**
 * A fixed size pool of worker threads fed from a single ready queue, plus
 * one timer thread which moves expired timers onto the ready queue.
 *
 * Workers only share the pool's internal state - not the scheduler object
 * itself - so the last reference to a scheduler may safely be dropped from
 * inside one of its own tasks.
 */
class ThreadPoolScheduler final : public Scheduler {
public:
    /**
     * Construct a scheduler optionally configuring the number of threads
     * to use.
     *
     * @param poolSize The number of threads to use - defaults to matching
     *                 the number of hardware threads available in the system.
     */
    explicit ThreadPoolScheduler(unsigned int poolSize = std::thread::hardware_concurrency());

    /**
     * Destruct the scheduler. Destruction stops all workers and the timer
     * thread. Tasks still waiting in the ready queue are discarded.
     */
    ~ThreadPoolScheduler() override;

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    CancelableRef submitAfter(int64_t milliseconds, const std::function<void()>& task) override;
    bool isIdle() const override;

private:
    using TimerEntry = std::tuple<int64_t, std::function<void()>>;

    struct State {
        std::atomic_bool should_run;
        std::mutex readyQueueMutex;
        std::condition_variable dataInQueue;
        std::queue<std::function<void()>> readyQueue;
        std::size_t poolSize;
        std::atomic_size_t idleThreads;
        std::mutex timerMutex;
        std::condition_variable timerCondition;
        std::map<int64_t,std::vector<TimerEntry>> timers;
        std::atomic_int64_t next_id;

        explicit State(std::size_t poolSize);
        void enqueue(const std::vector<std::function<void()>>& tasks);
    };

    std::shared_ptr<State> state;
    std::vector<std::thread> threads;

    static void run(const std::shared_ptr<State>& state);
    static void timer(const std::shared_ptr<State>& state);
    static int64_t current_time_ms();

    class CancelableTimer final : public Cancelable {
    public:
        CancelableTimer(
            const std::shared_ptr<State>& state,
            int64_t time_slot,
            int64_t id
        );

        void cancel() override;
        void onCancel(const std::function<void()>& callback) override;
        void onShutdown(const std::function<void()>& callback) override;
    private:
        std::shared_ptr<State> state;
        int64_t time_slot;
        int64_t id;
        std::vector<std::function<void()>> callbacks;
        std::mutex callback_mutex;
        bool canceled;
    };
};

} // namespace courier::scheduler

#endif
