//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_ZIP_PRODUCER_H_
#define _COURIER_ZIP_PRODUCER_H_

#include <mutex>
#include "../CompositeCancelable.hpp"
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

/**
 * The state shared between both inputs of a zip. Every terminal event of an
 * input is recorded under the mutex, and the first event which decides the
 * combined outcome marks the state as finished - so downstream is signaled
 * exactly once regardless of the order in which the inputs terminate.
 */
template <class A, class B, class T, class E>
class ZipState {
public:
    ZipState(
        const std::function<T(const A&, const B&)>& combiner,
        const ObserverRef<T,E>& downstream,
        const CompositeCancelableRef& composite
    );

    void leftSuccess(A&& value);
    void rightSuccess(B&& value);
    void leftEmpty();
    void rightEmpty();
    void failure(const E& error);

private:
    void completeIfReady(std::unique_lock<std::mutex>& lock);

    std::mutex mutex;
    bool finished;
    bool leftDone;
    bool rightDone;
    std::optional<A> leftValue;
    std::optional<B> rightValue;
    std::function<T(const A&, const B&)> combiner;
    ObserverRef<T,E> downstream;
    CompositeCancelableRef composite;
};

/**
 * Represents a producer combining the values of two upstream producers.
 * Normally obtained by calling `Producer<T>::zip`.
 */
template <class A, class B, class T, class E>
class ZipProducer final : public Producer<T,E> {
public:
    ZipProducer(
        const ProducerRef<A,E>& left,
        const ProducerRef<B,E>& right,
        const std::function<T(const A&, const B&)>& combiner
    );
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<A,E> left;
    ProducerRef<B,E> right;
    std::function<T(const A&, const B&)> combiner;
};

template <class A, class B, class T, class E>
ZipState<A,B,T,E>::ZipState(
    const std::function<T(const A&, const B&)>& combiner,
    const ObserverRef<T,E>& downstream,
    const CompositeCancelableRef& composite
)   : mutex()
    , finished(false)
    , leftDone(false)
    , rightDone(false)
    , leftValue()
    , rightValue()
    , combiner(combiner)
    , downstream(downstream)
    , composite(composite)
{}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::leftSuccess(A&& value) {
    std::unique_lock<std::mutex> lock(mutex);
    leftDone = true;
    leftValue.emplace(std::move(value));
    completeIfReady(lock);
}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::rightSuccess(B&& value) {
    std::unique_lock<std::mutex> lock(mutex);
    rightDone = true;
    rightValue.emplace(std::move(value));
    completeIfReady(lock);
}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::leftEmpty() {
    std::unique_lock<std::mutex> lock(mutex);
    leftDone = true;
    completeIfReady(lock);
}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::rightEmpty() {
    std::unique_lock<std::mutex> lock(mutex);
    rightDone = true;
    completeIfReady(lock);
}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::failure(const E& error) {
    {
        std::lock_guard<std::mutex> guard(mutex);
        if(finished) {
            return;
        }
        finished = true;
    }

    composite->cancel();
    downstream->onError(error);
}

template <class A, class B, class T, class E>
void ZipState<A,B,T,E>::completeIfReady(std::unique_lock<std::mutex>& lock) {
    if(finished || !leftDone || !rightDone) {
        return;
    }

    finished = true;

    if(!leftValue.has_value() || !rightValue.has_value()) {
        lock.unlock();
        composite->shutdown();
        downstream->onEmpty();
        return;
    }

    std::optional<T> combined;
    try {
        combined.emplace(combiner(*leftValue, *rightValue));
    } catch(E& error) {
        lock.unlock();
        composite->shutdown();
        downstream->onError(error);
        return;
    } catch(const std::exception& failure) {
        lock.unlock();
        composite->shutdown();
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    lock.unlock();
    composite->shutdown();
    downstream->onSuccess(std::move(*combined));
}

/**
 * Subscribe one zip input from its scheduler task. A failing subscribe
 * fails the whole zip through the input's observer.
 */
template <class V, class E>
void subscribeInput(
    const SchedulerRef& sched,
    const CompositeCancelableRef& composite,
    const ProducerRef<V,E>& upstream,
    const std::shared_ptr<CallbackObserver<V,E>>& observer
) {
    if(composite->isCanceled()) {
        return;
    }

    try {
        composite->add(upstream->subscribe(sched, observer));
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*observer, failure)) {
            throw;
        }
    }
}

template <class A, class B, class T, class E>
ZipProducer<A,B,T,E>::ZipProducer(
    const ProducerRef<A,E>& left,
    const ProducerRef<B,E>& right,
    const std::function<T(const A&, const B&)>& combiner
)   : left(left)
    , right(right)
    , combiner(combiner)
{}

template <class A, class B, class T, class E>
CancelableRef ZipProducer<A,B,T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();
    auto state = std::make_shared<ZipState<A,B,T,E>>(combiner, observer, composite);

    auto leftObserver = std::make_shared<CallbackObserver<A,E>>(
        [state](A&& value) { state->leftSuccess(std::move(value)); },
        [state]() { state->leftEmpty(); },
        [state](const E& error) { state->failure(error); }
    );

    auto rightObserver = std::make_shared<CallbackObserver<B,E>>(
        [state](B&& value) { state->rightSuccess(std::move(value)); },
        [state]() { state->rightEmpty(); },
        [state](const E& error) { state->failure(error); }
    );

    sched->submitBulk({
        [sched, composite, upstream = left, leftObserver]() {
            subscribeInput(sched, composite, upstream, leftObserver);
        },
        [sched, composite, upstream = right, rightObserver]() {
            subscribeInput(sched, composite, upstream, rightObserver);
        }
    });

    return composite;
}

} // namespace courier::producer

#endif
