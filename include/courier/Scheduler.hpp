//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_SCHEDULER_H_
#define _COURIER_SCHEDULER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "Cancelable.hpp"

namespace courier {

class Scheduler;
using SchedulerRef = std::shared_ptr<Scheduler>;

/**
 * A Scheduler represents the worker pool upon which producers run their
 * transformation chains. The thread that received an HTTP request never
 * runs producer work itself - it hands the subscription to a scheduler.
 */
class Scheduler {
public:
    /**
     * Obtain a reference to the global default scheduler.
     *
     * @return The default globally available scheduler instance.
     */
    static SchedulerRef global();

    /**
     * Submit a task for execution in the worker pool. This task will
     * execute after an indeterminite amount of time as resources free
     * to perform the task.
     *
     * @param task The task to submit for execution.
     */
    virtual void submit(const std::function<void()>& task) = 0;

    /**
     * Submit several tasks at once to the worker pool. The order
     * these tasks will be taken up and executed is undefined.
     *
     * @param tasks The vector of tasks to submit in-bulk.
     */
    virtual void submitBulk(const std::vector<std::function<void()>>& tasks) = 0;

    /**
     * Submit a task to the pool after _at least_ the given amount
     * of time has passed. The returned handle may be used to cancel
     * the timer before it fires.
     *
     * @param milliseconds The number of milliseconds to wait before
     *                     submitting to the pool
     * @param task The task the submit after the wait time has elapsed.
     * @return A handle which cancels the pending timer.
     */
    virtual CancelableRef submitAfter(int64_t milliseconds, const std::function<void()>& task) = 0;

    /**
     * Check if the scheduler is currently idle - meaning all threads are
     * currently waiting for tasks to execute.
     *
     * @return true if the scheduler is idle.
     */
    virtual bool isIdle() const = 0;

    virtual ~Scheduler() = default;
};

} // namespace courier

#endif
