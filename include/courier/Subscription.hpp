//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_SUBSCRIPTION_H_
#define _COURIER_SUBSCRIPTION_H_

#include <mutex>
#include <optional>
#include <vector>
#include "Cancelable.hpp"
#include "Logging.hpp"
#include "Observer.hpp"
#include "Outcome.hpp"

namespace courier {

/**
 * The lifecycle of a single subscription. `Terminated` and `Canceled`
 * are absorbing - no event is delivered once either is reached.
 */
enum class SubscriptionState { Pending, Active, Terminated, Canceled };

template <class T, class E>
class Subscription;

template <class T, class E>
using SubscriptionRef = std::shared_ptr<Subscription<T,E>>;

/**
 * A subscription sits between a producer and the observer attached to it.
 * It owns the observer until the first terminal event or cancelation, at
 * which point the observer is released - so every later event is dropped
 * rather than delivered. It also owns the handle to the upstream
 * computation so that canceling the subscription cancels the work.
 */
template <class T, class E>
class Subscription final : public Observer<T,E>, public Cancelable {
public:
    explicit Subscription(const ObserverRef<T,E>& downstream);

    /**
     * Move from `Pending` to `Active`. Events are only delivered
     * to active subscriptions.
     */
    void activate();

    /**
     * Attach the handle of the upstream computation. If the subscription
     * was canceled before the handle became available the handle is
     * canceled immediately.
     *
     * @param upstream The upstream computation handle.
     */
    void attach(const CancelableRef& upstream);

    SubscriptionState state() const;

    /**
     * @return How the subscription terminated - or nothing if it
     *         has not terminated (yet).
     */
    std::optional<Termination> termination() const;

    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;

    void cancel() override;
    void onCancel(const std::function<void()>& callback) override;
    void onShutdown(const std::function<void()>& callback) override;

private:
    ObserverRef<T,E> claim(Termination kind);
    void finish();

    mutable std::mutex mutex;
    SubscriptionState currentState;
    std::optional<Termination> terminatedBy;
    ObserverRef<T,E> downstream;
    CancelableRef upstream;
    std::vector<std::function<void()>> cancelCallbacks;
    std::vector<std::function<void()>> shutdownCallbacks;
};

template <class T, class E>
Subscription<T,E>::Subscription(const ObserverRef<T,E>& downstream)
    : mutex()
    , currentState(SubscriptionState::Pending)
    , terminatedBy()
    , downstream(downstream)
    , upstream()
    , cancelCallbacks()
    , shutdownCallbacks()
{}

template <class T, class E>
void Subscription<T,E>::activate() {
    std::lock_guard<std::mutex> guard(mutex);
    if(currentState == SubscriptionState::Pending) {
        currentState = SubscriptionState::Active;
    }
}

template <class T, class E>
void Subscription<T,E>::attach(const CancelableRef& handle) {
    bool cancelNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState == SubscriptionState::Active) {
            upstream = handle;
        } else if(currentState == SubscriptionState::Canceled) {
            cancelNow = true;
        }
    }

    if(cancelNow && handle) {
        handle->cancel();
    }
}

template <class T, class E>
SubscriptionState Subscription<T,E>::state() const {
    std::lock_guard<std::mutex> guard(mutex);
    return currentState;
}

template <class T, class E>
std::optional<Termination> Subscription<T,E>::termination() const {
    std::lock_guard<std::mutex> guard(mutex);
    return terminatedBy;
}

template <class T, class E>
void Subscription<T,E>::onSuccess(T&& value) {
    if(auto observer = claim(Termination::Value)) {
        observer->onSuccess(std::move(value));
        finish();
    }
}

template <class T, class E>
void Subscription<T,E>::onEmpty() {
    if(auto observer = claim(Termination::Empty)) {
        observer->onEmpty();
        finish();
    }
}

template <class T, class E>
void Subscription<T,E>::onError(const E& error) {
    if(auto observer = claim(Termination::Failure)) {
        observer->onError(error);
        finish();
    }
}

template <class T, class E>
void Subscription<T,E>::cancel() {
    CancelableRef toCancel;
    std::vector<std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState != SubscriptionState::Pending && currentState != SubscriptionState::Active) {
            return;
        }

        currentState = SubscriptionState::Canceled;
        downstream.reset();
        shutdownCallbacks.clear();
        std::swap(toCancel, upstream);
        std::swap(callbacks, cancelCallbacks);
    }

    logging::logger()->debug("Subscription canceled before termination");

    if(toCancel) {
        toCancel->cancel();
    }

    for(auto& callback : callbacks) {
        callback();
    }
}

template <class T, class E>
void Subscription<T,E>::onCancel(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState == SubscriptionState::Canceled) {
            runNow = true;
        } else if(currentState != SubscriptionState::Terminated) {
            cancelCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

template <class T, class E>
void Subscription<T,E>::onShutdown(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState == SubscriptionState::Terminated) {
            runNow = true;
        } else if(currentState != SubscriptionState::Canceled) {
            shutdownCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

template <class T, class E>
ObserverRef<T,E> Subscription<T,E>::claim(Termination kind) {
    ObserverRef<T,E> observer;
    SubscriptionState observed;

    {
        std::lock_guard<std::mutex> guard(mutex);
        observed = currentState;
        if(currentState == SubscriptionState::Active) {
            currentState = SubscriptionState::Terminated;
            terminatedBy = kind;
            std::swap(observer, downstream);
            cancelCallbacks.clear();
        }
    }

    if(!observer) {
        logging::logger()->debug(
            "Dropped late terminal event on a {} subscription",
            observed == SubscriptionState::Canceled ? "canceled" : "terminated"
        );
    }

    return observer;
}

template <class T, class E>
void Subscription<T,E>::finish() {
    std::vector<std::function<void()>> callbacks;
    CancelableRef released;

    {
        std::lock_guard<std::mutex> guard(mutex);
        std::swap(callbacks, shutdownCallbacks);
        std::swap(released, upstream);
    }

    for(auto& callback : callbacks) {
        callback();
    }
}

} // namespace courier

#endif
