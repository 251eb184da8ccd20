//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_SWITCH_IF_EMPTY_PRODUCER_H_
#define _COURIER_SWITCH_IF_EMPTY_PRODUCER_H_

#include "../CompositeCancelable.hpp"
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

template <class T, class E>
class SwitchIfEmptyObserver final : public Observer<T,E> {
public:
    SwitchIfEmptyObserver(
        const SchedulerRef& sched,
        const ProducerRef<T,E>& fallback,
        const ObserverRef<T,E>& downstream,
        const CompositeCancelableRef& composite
    );

    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    SchedulerRef sched;
    ProducerRef<T,E> fallback;
    ObserverRef<T,E> downstream;
    CompositeCancelableRef composite;
};

/**
 * Represents a producer which subscribes to a fallback when its upstream
 * completes empty. The fallback is left untouched in every other case.
 * Normally obtained by calling `Producer<T>::switchIfEmpty`.
 */
template <class T, class E>
class SwitchIfEmptyProducer final : public Producer<T,E> {
public:
    SwitchIfEmptyProducer(const ProducerRef<T,E>& upstream, const ProducerRef<T,E>& fallback);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
    ProducerRef<T,E> fallback;
};

template <class T, class E>
SwitchIfEmptyObserver<T,E>::SwitchIfEmptyObserver(
    const SchedulerRef& sched,
    const ProducerRef<T,E>& fallback,
    const ObserverRef<T,E>& downstream,
    const CompositeCancelableRef& composite
)   : sched(sched)
    , fallback(fallback)
    , downstream(downstream)
    , composite(composite)
{}

template <class T, class E>
void SwitchIfEmptyObserver<T,E>::onSuccess(T&& value) {
    downstream->onSuccess(std::move(value));
}

template <class T, class E>
void SwitchIfEmptyObserver<T,E>::onEmpty() {
    try {
        composite->add(fallback->subscribe(sched, downstream));
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
    }
}

template <class T, class E>
void SwitchIfEmptyObserver<T,E>::onError(const E& error) {
    downstream->onError(error);
}

template <class T, class E>
SwitchIfEmptyProducer<T,E>::SwitchIfEmptyProducer(const ProducerRef<T,E>& upstream, const ProducerRef<T,E>& fallback)
    : upstream(upstream)
    , fallback(fallback)
{}

template <class T, class E>
CancelableRef SwitchIfEmptyProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();
    auto emptyObserver = std::make_shared<SwitchIfEmptyObserver<T,E>>(sched, fallback, observer, composite);
    composite->add(upstream->subscribe(sched, emptyObserver));
    return composite;
}

} // namespace courier::producer

#endif
