//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_PROMISE_PRODUCER_H_
#define _COURIER_PROMISE_PRODUCER_H_

#include <atomic>
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

/**
 * Forward the outcome of a promise to the given observer.
 */
template <class T, class E>
void forwardOutcome(const PromiseRef<T,E>& promise, const ObserverRef<T,E>& observer) {
    promise->onComplete([observer](const Outcome<T,E>& outcome) {
        switch(outcome.termination()) {
            case Termination::Value: {
                T value = outcome.get_value();
                observer->onSuccess(std::move(value));
                break;
            }
            case Termination::Empty:
                observer->onEmpty();
                break;
            case Termination::Failure:
                observer->onError(outcome.get_error());
                break;
        }
    });
}

/**
 * A hot producer backed by a promise which was created elsewhere. The
 * operation behind the promise runs exactly once, so the producer may only
 * be subscribed once. Canceling the subscription cancels the promise.
 */
template <class T, class E>
class PromiseProducer final : public Producer<T,E> {
public:
    explicit PromiseProducer(const PromiseRef<T,E>& promise);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    PromiseRef<T,E> promise;
    mutable std::atomic_bool consumed;
};

/**
 * A restartable producer which starts a fresh asynchronous operation for
 * every subscription.
 */
template <class T, class E>
class DeferActionProducer final : public Producer<T,E> {
public:
    explicit DeferActionProducer(const std::function<PromiseRef<T,E>(const SchedulerRef&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    std::function<PromiseRef<T,E>(const SchedulerRef&)> predicate;
};

template <class T, class E>
PromiseProducer<T,E>::PromiseProducer(const PromiseRef<T,E>& promise)
    : promise(promise)
    , consumed(false)
{}

template <class T, class E>
CancelableRef PromiseProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>& observer) const {
    if(consumed.exchange(true)) {
        throw AlreadyConsumed();
    }

    forwardOutcome(promise, observer);
    return promise;
}

template <class T, class E>
DeferActionProducer<T,E>::DeferActionProducer(const std::function<PromiseRef<T,E>(const SchedulerRef&)>& predicate)
    : predicate(predicate)
{}

template <class T, class E>
CancelableRef DeferActionProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    PromiseRef<T,E> promise;

    try {
        promise = predicate(sched);
    } catch(E& error) {
        observer->onError(error);
        return std::make_shared<IgnoreCancelation>();
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*observer, failure)) {
            throw;
        }
        return std::make_shared<IgnoreCancelation>();
    }

    forwardOutcome(promise, observer);
    return promise;
}

} // namespace courier::producer

#endif
