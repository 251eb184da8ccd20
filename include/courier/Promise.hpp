//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_PROMISE_H_
#define _COURIER_PROMISE_H_

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include "Cancelable.hpp"
#include "Error.hpp"
#include "Outcome.hpp"
#include "Scheduler.hpp"

namespace courier {

template <class T, class E>
class Promise;

template <class T, class E = Error>
using PromiseRef = std::shared_ptr<Promise<T,E>>;

/**
 * A `Promise` represents the "producer" side of a running asynchronous operation. An
 * upstream collaborator completes the operation from its own callback by calling one of
 * `success`, `empty`, `error` or `complete`, at which point every registered completion
 * callback is submitted to the promise's scheduler.
 */
template <class T, class E = Error>
class Promise final : public Cancelable {
public:
    /**
     * Create a promise which executes completion callbacks on the given scheduler.
     *
     * @param sched The scheduler to run completion callbacks on.
     * @return A reference to the created promise.
     */
    static PromiseRef<T,E> create(const SchedulerRef& sched);

    /**
     * Construct a promise. Provided purely for compatibility with `std::make_shared`
     * and can cause issues if used directly. Please use `Promise<T,E>::create` instead.
     */
    explicit Promise(SchedulerRef sched);

    /**
     * Complete this promise with the given value.
     *
     * @param value The value to use when completing the promise.
     */
    void success(const T& value);

    /**
     * Complete this promise with the given value.
     *
     * @param value The value to use when completing the promise.
     */
    void success(T&& value);

    /**
     * Complete this promise without a value.
     */
    void empty();

    /**
     * Complete this promise with the given error.
     *
     * @param error The error to use when completing the promise.
     */
    void error(const E& error);

    /**
     * Complete this promise with the given outcome. Completing a promise
     * twice is a defect and throws. Completing a canceled promise is
     * ignored.
     *
     * @param result The outcome to complete the promise with.
     */
    void complete(Outcome<T,E>&& result);

    /**
     * Attempt to retrieve the outcome of this promise. Will return nothing
     * if the promise has not yet completed or has been canceled.
     *
     * @return The outcome of this promise or nothing.
     */
    std::optional<Outcome<T,E>> get() const;

    /**
     * Block the calling thread until the promise completes. Never call this
     * from a task running on the same scheduler which completes the promise.
     *
     * @return The outcome of this promise.
     * @throws std::runtime_error if the promise is canceled instead.
     */
    Outcome<T,E> await() const;

    /**
     * Check if this promise is already cancelled.
     *
     * @return True iff the promise is cancelled.
     */
    bool isCancelled() const;

    /**
     * Register a callback which receives the outcome once the promise completes.
     * The callback is submitted to the promise's scheduler - immediately if the
     * promise has already completed.
     *
     * @param callback The callback to run on completion.
     */
    void onComplete(const std::function<void(const Outcome<T,E>&)>& callback);

    void onCancel(const std::function<void()>& callback) override;
    void onShutdown(const std::function<void()>& callback) override;
    void cancel() override;

private:
    mutable std::mutex mutex;
    mutable std::condition_variable completed;
    std::optional<Outcome<T,E>> resultOpt;
    bool canceled;
    std::vector<std::function<void(const Outcome<T,E>&)>> completeCallbacks;
    std::vector<std::function<void()>> cancelCallbacks;
    SchedulerRef sched;
};

template <class T, class E>
PromiseRef<T,E> Promise<T,E>::create(const SchedulerRef& sched) {
    return std::make_shared<Promise<T,E>>(sched);
}

template <class T, class E>
Promise<T,E>::Promise(SchedulerRef sched)
    : mutex()
    , completed()
    , resultOpt(std::nullopt)
    , canceled(false)
    , completeCallbacks()
    , cancelCallbacks()
    , sched(std::move(sched))
{}

template <class T, class E>
void Promise<T,E>::success(const T& value) {
    complete(Outcome<T,E>::value(value));
}

template <class T, class E>
void Promise<T,E>::success(T&& value) {
    complete(Outcome<T,E>::value(std::move(value)));
}

template <class T, class E>
void Promise<T,E>::empty() {
    complete(Outcome<T,E>::empty());
}

template <class T, class E>
void Promise<T,E>::error(const E& error) {
    complete(Outcome<T,E>::error(error));
}

template <class T, class E>
void Promise<T,E>::complete(Outcome<T,E>&& result) {
    std::vector<std::function<void(const Outcome<T,E>&)>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);

        if(canceled) {
            return;
        } else if(resultOpt.has_value()) {
            switch(resultOpt->termination()) {
                case Termination::Value:
                    throw std::runtime_error("Promise already successfully completed.");
                case Termination::Empty:
                    throw std::runtime_error("Promise already completed without a value.");
                default:
                    throw std::runtime_error("Promise already completed with an error.");
            }
        }

        resultOpt = std::move(result);
        std::swap(completeCallbacks, callbacks);
        cancelCallbacks.clear();
    }

    completed.notify_all();

    auto outcome = *resultOpt;
    for(auto& callback : callbacks) {
        sched->submit([callback, outcome]() {
            callback(outcome);
        });
    }
}

template <class T, class E>
std::optional<Outcome<T,E>> Promise<T,E>::get() const {
    std::lock_guard<std::mutex> guard(mutex);
    if(canceled) {
        return {};
    } else {
        return resultOpt;
    }
}

template <class T, class E>
Outcome<T,E> Promise<T,E>::await() const {
    std::unique_lock<std::mutex> lock(mutex);
    completed.wait(lock, [this]() { return canceled || resultOpt.has_value(); });

    if(canceled) {
        throw std::runtime_error("Promise canceled before completion.");
    }

    return *resultOpt;
}

template <class T, class E>
bool Promise<T,E>::isCancelled() const {
    std::lock_guard<std::mutex> guard(mutex);
    return canceled;
}

template <class T, class E>
void Promise<T,E>::onComplete(const std::function<void(const Outcome<T,E>&)>& callback) {
    std::optional<Outcome<T,E>> immediate;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(resultOpt.has_value()) {
            immediate = resultOpt;
        } else if(!canceled) {
            completeCallbacks.push_back(callback);
        }
    }

    if(immediate.has_value()) {
        auto outcome = *immediate;
        sched->submit([callback, outcome]() {
            callback(outcome);
        });
    }
}

template <class T, class E>
void Promise<T,E>::cancel() {
    std::vector<std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(resultOpt.has_value() || canceled) {
            return;
        }

        canceled = true;
        std::swap(cancelCallbacks, callbacks);
        completeCallbacks.clear();
    }

    completed.notify_all();

    for(auto& callback : callbacks) {
        callback();
    }
}

template <class T, class E>
void Promise<T,E>::onCancel(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(canceled) {
            runNow = true;
        } else if(!resultOpt.has_value()) {
            cancelCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

template <class T, class E>
void Promise<T,E>::onShutdown(const std::function<void()>& callback) {
    onComplete([callback](auto) {
        return callback();
    });
}

} // namespace courier

#endif
