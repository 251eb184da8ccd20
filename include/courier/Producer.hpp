//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_PRODUCER_H_
#define _COURIER_PRODUCER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include "Cancelable.hpp"
#include "Error.hpp"
#include "Observer.hpp"
#include "Promise.hpp"
#include "Scheduler.hpp"
#include "Subscription.hpp"

namespace courier {

template <class T, class E>
class Producer;

template <class T, class E = Error>
using ProducerRef = std::shared_ptr<const Producer<T,E>>;

/**
 * A Producer represents zero or one eventual value of type `T`, or a failure of
 * type `E`. It is the single-result peer of an observable: evaluation begins when
 * an observer is attached via `subscribe` and ends with exactly one of a value,
 * an empty completion, or an error.
 *
 * Producers are lazily evaluated. Unless stated otherwise (see `forPromise`) every
 * subscription constructs its own complete pipeline - nothing is shared, and
 * subscribing twice runs the upstream work twice.
 */
template <class T, class E = Error>
class Producer : public std::enable_shared_from_this<Producer<T,E>> {
public:
    /**
     * Create a producer housing a single pure value.
     *
     * @param value The value to emit when subscribed.
     * @return A new producer wrapping the given value.
     */
    static ProducerRef<T,E> pure(const T& value);

    /**
     * Create a producer which completes without a value.
     *
     * @return A new empty producer.
     */
    static ProducerRef<T,E> empty();

    /**
     * Create a producer which, upon subscription, immediately fails.
     *
     * @param error The error to fail with.
     * @return A new producer wrapping the given error.
     */
    static ProducerRef<T,E> raiseError(const E& error);

    /**
     * Create a producer which evaluates the given function upon subscription
     * and emits its result. If the function throws `E` the producer fails.
     *
     * @param predicate The function to evaluate.
     * @return A producer wrapping the given function.
     */
    static ProducerRef<T,E> eval(const std::function<T()>& predicate);

    /**
     * Create a producer which evaluates the given function upon subscription.
     * Returning nothing completes the producer empty.
     *
     * @param predicate The function to evaluate.
     * @return A producer wrapping the given function.
     */
    static ProducerRef<T,E> evalOptional(const std::function<std::optional<T>()>& predicate);

    /**
     * Create a producer which, upon subscription, defers that subscription to
     * the producer created by the provided method.
     *
     * @param predicate The method to use for creating a producer.
     * @return A producer wrapping the given deferral function.
     */
    static ProducerRef<T,E> defer(const std::function<ProducerRef<T,E>()>& predicate);

    /**
     * Create a producer for a callback based collaborator. Upon every subscription
     * the given method starts the operation and returns the promise it will
     * complete.
     *
     * @param predicate The method starting the asynchronous operation.
     * @return A restartable producer wrapping the operation.
     */
    static ProducerRef<T,E> deferAction(const std::function<PromiseRef<T,E>(const SchedulerRef&)>& predicate);

    /**
     * Create a producer for an operation which is already running. The
     * resulting producer is hot and may only be subscribed once - a second
     * subscription throws `AlreadyConsumed`.
     *
     * @param promise The promise of the running operation.
     * @return A producer completing with the promise.
     */
    static ProducerRef<T,E> forPromise(const PromiseRef<T,E>& promise);

    /**
     * Create a producer which never terminates.
     *
     * @return A producer which never terminates.
     */
    static ProducerRef<T,E> never();

    /**
     * Combine two producers. Both inputs are subscribed concurrently and the
     * combiner runs exactly once, after both produced a value. The first failure
     * of either input fails the result and cancels the other input. An empty
     * input completes the result empty once the other input terminated.
     *
     * @param left The first input.
     * @param right The second input.
     * @param combiner The function combining both values.
     * @return A producer of the combined value.
     */
    template <class A, class B>
    static ProducerRef<T,E> zip(
        const ProducerRef<A,E>& left,
        const ProducerRef<B,E>& right,
        const std::function<T(const A&, const B&)>& combiner
    );

    /**
     * Attach an observer and begin evaluation of this producer.
     *
     * @param sched The scheduler to run asynchronous stages on.
     * @param observer The observer receiving the terminal event.
     * @return The subscription - cancel it to stop the evaluation.
     */
    SubscriptionRef<T,E> subscribe(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const;

    /**
     * Attach handlers for each of the terminal events and begin evaluation
     * of this producer.
     *
     * @return The subscription - cancel it to stop the evaluation.
     */
    SubscriptionRef<T,E> subscribeHandlers(
        const SchedulerRef& sched,
        const std::function<void(T&&)>& onSuccess,
        const std::function<void()>& onEmpty = [](){},
        const std::function<void(const E&)>& onError = [](auto){}
    ) const;

    /**
     * Begin evaluation of this producer and capture its outcome in a promise.
     * Canceling the promise cancels the evaluation.
     *
     * @param sched The scheduler to run on.
     * @return The promise receiving the outcome.
     */
    PromiseRef<T,E> run(const SchedulerRef& sched) const;

    /**
     * Transform the value of this producer. Empty and failed producers
     * pass through unchanged.
     *
     * @param predicate The transformation, which may throw `E` to fail.
     * @return The transformed producer.
     */
    template <class T2>
    ProducerRef<T2,E> map(const std::function<T2(const T&)>& predicate) const;

    /**
     * Transform the error of this producer.
     *
     * @param predicate The transformation to apply to an error.
     * @return The transformed producer.
     */
    template <class E2>
    ProducerRef<T,E2> mapError(const std::function<E2(const E&)>& predicate) const;

    /**
     * Switch to the producer created from the value of this one. Failures
     * from either stage propagate.
     *
     * @param predicate The method creating the next producer.
     * @return The switched producer.
     */
    template <class T2>
    ProducerRef<T2,E> switchMap(const std::function<ProducerRef<T2,E>(const T&)>& predicate) const;

    /**
     * Switch to the given fallback if this producer completes empty. The
     * fallback is never subscribed otherwise.
     *
     * @param fallback The producer to use when this one is empty.
     * @return The producer with a fallback.
     */
    ProducerRef<T,E> switchIfEmpty(const ProducerRef<T,E>& fallback) const;

    /**
     * Emit the given value if this producer completes empty.
     *
     * @param value The value to default to.
     * @return The producer with a default.
     */
    ProducerRef<T,E> defaultIfEmpty(const T& value) const;

    /**
     * Recover from a failure by substituting a value. The handler may
     * throw `E` to fail with a different error instead.
     *
     * @param predicate The method creating a substitute value.
     * @return The recovering producer.
     */
    ProducerRef<T,E> onErrorReturn(const std::function<T(const E&)>& predicate) const;

    /**
     * Recover from a failure by switching to another producer.
     *
     * @param predicate The method creating the substitute producer.
     * @return The recovering producer.
     */
    ProducerRef<T,E> onErrorResume(const std::function<ProducerRef<T,E>(const E&)>& predicate) const;

    /**
     * Fail with the given error if this producer does not terminate within
     * the given number of milliseconds. The upstream is canceled on timeout
     * and the timer is canceled once the upstream terminates.
     *
     * @param milliseconds The amount of time to wait for a terminal event.
     * @param error The error to fail with.
     * @return The producer with a timeout.
     */
    ProducerRef<T,E> timeout(int64_t milliseconds, const E& error) const;

    /**
     * Move the subscription to this producer onto the scheduler rather than
     * performing it on the calling thread.
     *
     * @return The producer with an asynchronous boundary.
     */
    ProducerRef<T,E> asyncBoundary() const;

    /**
     * Run the given callback when this producer terminates - whether with a
     * value, empty or with an error - before the terminal event is passed on.
     * It does not run when the subscription is canceled.
     *
     * @param callback The callback to run.
     * @return The producer running the callback.
     */
    ProducerRef<T,E> doOnTerminate(const std::function<void()>& callback) const;

    virtual ~Producer() = default;

protected:
    /**
     * Begin evaluation for the given observer. Implementations must deliver at
     * most one terminal event to the observer and return a handle which stops
     * any outstanding work.
     *
     * @param sched The scheduler to run asynchronous stages on.
     * @param observer The observer - always a subscription guard.
     * @return The handle of the outstanding work.
     */
    virtual CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const = 0;
};

} // namespace courier

#include "producer/CallbackObserver.hpp"
#include "producer/SourceProducers.hpp"
#include "producer/PromiseProducer.hpp"
#include "producer/DeferProducer.hpp"
#include "producer/MapProducer.hpp"
#include "producer/MapErrorProducer.hpp"
#include "producer/SwitchMapProducer.hpp"
#include "producer/SwitchIfEmptyProducer.hpp"
#include "producer/OnErrorProducer.hpp"
#include "producer/ZipProducer.hpp"
#include "producer/TimeoutProducer.hpp"
#include "producer/AsyncBoundaryProducer.hpp"
#include "producer/TerminateProducer.hpp"

namespace courier {

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::pure(const T& value) {
    return std::make_shared<producer::PureProducer<T,E>>(value);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::empty() {
    return std::make_shared<producer::EmptyProducer<T,E>>();
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::raiseError(const E& error) {
    return std::make_shared<producer::ErrorProducer<T,E>>(error);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::eval(const std::function<T()>& predicate) {
    return evalOptional([predicate]() -> std::optional<T> {
        return predicate();
    });
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::evalOptional(const std::function<std::optional<T>()>& predicate) {
    return std::make_shared<producer::EvalProducer<T,E>>(predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::defer(const std::function<ProducerRef<T,E>()>& predicate) {
    return std::make_shared<producer::DeferProducer<T,E>>(predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::deferAction(const std::function<PromiseRef<T,E>(const SchedulerRef&)>& predicate) {
    return std::make_shared<producer::DeferActionProducer<T,E>>(predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::forPromise(const PromiseRef<T,E>& promise) {
    return std::make_shared<producer::PromiseProducer<T,E>>(promise);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::never() {
    return std::make_shared<producer::NeverProducer<T,E>>();
}

template <class T, class E>
template <class A, class B>
ProducerRef<T,E> Producer<T,E>::zip(
    const ProducerRef<A,E>& left,
    const ProducerRef<B,E>& right,
    const std::function<T(const A&, const B&)>& combiner
) {
    return std::make_shared<producer::ZipProducer<A,B,T,E>>(left, right, combiner);
}

template <class T, class E>
SubscriptionRef<T,E> Producer<T,E>::subscribe(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto subscription = std::make_shared<Subscription<T,E>>(observer);
    subscription->activate();

    CancelableRef handle;
    try {
        handle = subscribeActual(sched, subscription);
    } catch(...) {
        subscription->cancel();
        throw;
    }

    subscription->attach(handle);
    return subscription;
}

template <class T, class E>
SubscriptionRef<T,E> Producer<T,E>::subscribeHandlers(
    const SchedulerRef& sched,
    const std::function<void(T&&)>& onSuccess,
    const std::function<void()>& onEmpty,
    const std::function<void(const E&)>& onError
) const {
    auto observer = std::make_shared<producer::CallbackObserver<T,E>>(onSuccess, onEmpty, onError);
    return subscribe(sched, observer);
}

template <class T, class E>
PromiseRef<T,E> Producer<T,E>::run(const SchedulerRef& sched) const {
    auto promise = Promise<T,E>::create(sched);

    auto subscription = subscribeHandlers(
        sched,
        [promise](T&& value) { promise->success(std::move(value)); },
        [promise]() { promise->empty(); },
        [promise](const E& error) { promise->error(error); }
    );

    promise->onCancel([subscription]() {
        subscription->cancel();
    });

    return promise;
}

template <class T, class E>
template <class T2>
ProducerRef<T2,E> Producer<T,E>::map(const std::function<T2(const T&)>& predicate) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::MapProducer<T,T2,E>>(self, predicate);
}

template <class T, class E>
template <class E2>
ProducerRef<T,E2> Producer<T,E>::mapError(const std::function<E2(const E&)>& predicate) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::MapErrorProducer<T,E,E2>>(self, predicate);
}

template <class T, class E>
template <class T2>
ProducerRef<T2,E> Producer<T,E>::switchMap(const std::function<ProducerRef<T2,E>(const T&)>& predicate) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::SwitchMapProducer<T,T2,E>>(self, predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::switchIfEmpty(const ProducerRef<T,E>& fallback) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::SwitchIfEmptyProducer<T,E>>(self, fallback);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::defaultIfEmpty(const T& value) const {
    return switchIfEmpty(Producer<T,E>::pure(value));
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::onErrorReturn(const std::function<T(const E&)>& predicate) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::OnErrorReturnProducer<T,E>>(self, predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::onErrorResume(const std::function<ProducerRef<T,E>(const E&)>& predicate) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::OnErrorResumeProducer<T,E>>(self, predicate);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::timeout(int64_t milliseconds, const E& error) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::TimeoutProducer<T,E>>(self, milliseconds, error);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::asyncBoundary() const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::AsyncBoundaryProducer<T,E>>(self);
}

template <class T, class E>
ProducerRef<T,E> Producer<T,E>::doOnTerminate(const std::function<void()>& callback) const {
    auto self = this->shared_from_this();
    return std::make_shared<producer::TerminateProducer<T,E>>(self, callback);
}

} // namespace courier

#endif
