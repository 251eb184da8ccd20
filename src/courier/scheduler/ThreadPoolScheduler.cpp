//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/scheduler/ThreadPoolScheduler.hpp"
#include <algorithm>
#include <chrono>

namespace courier::scheduler {

ThreadPoolScheduler::State::State(std::size_t poolSize)
    : should_run(true)
    , readyQueueMutex()
    , dataInQueue()
    , readyQueue()
    , poolSize(poolSize)
    , idleThreads(poolSize)
    , timerMutex()
    , timerCondition()
    , timers()
    , next_id(0)
{}

void ThreadPoolScheduler::State::enqueue(const std::vector<std::function<void()>>& tasks) {
    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        for(auto& task : tasks) {
            readyQueue.emplace(task);
        }
    }

    if(tasks.size() == 1) {
        dataInQueue.notify_one();
    } else {
        dataInQueue.notify_all();
    }
}

ThreadPoolScheduler::ThreadPoolScheduler(unsigned int poolSize)
    : state(std::make_shared<State>(std::max(poolSize, 1u)))
    , threads()
{
    threads.reserve(state->poolSize + 1);

    for(std::size_t i = 0; i < state->poolSize; i++) {
        threads.emplace_back(&ThreadPoolScheduler::run, state);
    }

    threads.emplace_back(&ThreadPoolScheduler::timer, state);
}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    state->should_run.store(false);
    state->dataInQueue.notify_all();
    state->timerCondition.notify_all();

    for(auto& thread : threads) {
        // The final reference may be released by a task running on one of
        // our own workers. That worker exits on its own once it observes
        // should_run - it only touches the shared state from here on.
        if(thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

void ThreadPoolScheduler::submit(const std::function<void()>& task) {
    {
        std::lock_guard<std::mutex> guard(state->readyQueueMutex);
        state->readyQueue.emplace(task);
    }
    state->dataInQueue.notify_one();
}

void ThreadPoolScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    state->enqueue(tasks);
}

CancelableRef ThreadPoolScheduler::submitAfter(int64_t milliseconds, const std::function<void()>& task) {
    auto id = state->next_id++;
    auto executionTick = current_time_ms() + milliseconds;

    {
        std::lock_guard<std::mutex> guard(state->timerMutex);
        state->timers[executionTick].emplace_back(id, task);
    }

    state->timerCondition.notify_one();

    return std::make_shared<CancelableTimer>(state, executionTick, id);
}

bool ThreadPoolScheduler::isIdle() const {
    std::lock_guard<std::mutex> guard(state->readyQueueMutex);
    return state->idleThreads.load() == state->poolSize && state->readyQueue.empty();
}

void ThreadPoolScheduler::run(const std::shared_ptr<State>& state) {
    std::unique_lock<std::mutex> readyQueueLock(state->readyQueueMutex, std::defer_lock);
    std::chrono::milliseconds max_wait_time(10);
    bool idling = true;

    while(state->should_run.load()) {
        readyQueueLock.lock();

        if(!idling && state->readyQueue.empty()) {
            idling = true;
            state->idleThreads++;
        }

        if(state->dataInQueue.wait_for(readyQueueLock, max_wait_time, [&state]() { return !state->readyQueue.empty(); })) {
            if(idling) {
                idling = false;
                state->idleThreads--;
            }

            auto task = std::move(state->readyQueue.front());
            state->readyQueue.pop();
            readyQueueLock.unlock();
            task();
        } else {
            readyQueueLock.unlock();
        }
    }
}

void ThreadPoolScheduler::timer(const std::shared_ptr<State>& state) {
    auto dormant_sleep_time = std::chrono::milliseconds(1000);
    auto sleep_time = dormant_sleep_time;

    while(true) {
        std::unique_lock<std::mutex> lock(state->timerMutex);
        state->timerCondition.wait_for(lock, sleep_time);

        if(!state->should_run.load(std::memory_order_relaxed)) {
            break;
        }

        auto current_time = current_time_ms();
        std::vector<std::function<void()>> expiredTasks;

        // Timers are ordered by execution time so we can stop at
        // the first one which is still in the future.
        auto timer_iter = state->timers.begin();
        while(timer_iter != state->timers.end() && timer_iter->first <= current_time) {
            for(auto& entry : timer_iter->second) {
                expiredTasks.emplace_back(std::get<1>(entry));
            }
            timer_iter = state->timers.erase(timer_iter);
        }

        if(state->timers.empty()) {
            sleep_time = dormant_sleep_time;
        } else {
            auto next_timer_sleep_time = std::chrono::milliseconds(state->timers.begin()->first - current_time);
            next_timer_sleep_time = std::min(next_timer_sleep_time, dormant_sleep_time);
            sleep_time = std::max(next_timer_sleep_time, std::chrono::milliseconds(0));
        }

        lock.unlock();

        if(!expiredTasks.empty()) {
            state->enqueue(expiredTasks);
        }
    }
}

int64_t ThreadPoolScheduler::current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

ThreadPoolScheduler::CancelableTimer::CancelableTimer(
    const std::shared_ptr<State>& state,
    int64_t time_slot,
    int64_t id
)   : state(state)
    , time_slot(time_slot)
    , id(id)
    , callbacks()
    , callback_mutex()
    , canceled(false)
{}

void ThreadPoolScheduler::CancelableTimer::cancel() {
    std::vector<std::function<void()>> callbacks_to_run;

    {
        std::lock_guard<std::mutex> state_guard(state->timerMutex);
        std::lock_guard<std::mutex> self_guard(callback_mutex);

        if(canceled) {
            return;
        }

        auto tasks = state->timers.find(time_slot);
        if(tasks != state->timers.end()) {
            auto& entries = tasks->second;
            auto removed = std::remove_if(entries.begin(), entries.end(), [this](auto& entry) {
                return std::get<0>(entry) == id;
            });

            if(removed != entries.end()) {
                canceled = true;
                entries.erase(removed, entries.end());
                std::swap(callbacks_to_run, callbacks);
            }

            if(entries.empty()) {
                state->timers.erase(tasks);
            }
        }
    }

    for(auto& cb : callbacks_to_run) {
        cb();
    }
}

void ThreadPoolScheduler::CancelableTimer::onCancel(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(callback_mutex);
        if(canceled) {
            runNow = true;
        } else {
            callbacks.emplace_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

void ThreadPoolScheduler::CancelableTimer::onShutdown(const std::function<void()>& shutdownCallback) {
    bool found = false;

    {
        std::lock_guard<std::mutex> state_guard(state->timerMutex);
        auto tasks = state->timers.find(time_slot);

        if(tasks != state->timers.end()) {
            for(auto& entry : tasks->second) {
                if(std::get<0>(entry) == id) {
                    found = true;
                    auto entryCallback = std::get<1>(entry);
                    std::get<1>(entry) = [entryCallback, shutdownCallback]() {
                        entryCallback();
                        shutdownCallback();
                    };
                }
            }
        }
    }

    // Already fired (or canceled) - there is nothing left to wait for.
    if(!found) {
        bool wasCanceled = false;
        {
            std::lock_guard<std::mutex> guard(callback_mutex);
            wasCanceled = canceled;
        }

        if(!wasCanceled) {
            shutdownCallback();
        }
    }
}

} // namespace courier::scheduler
