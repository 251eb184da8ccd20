//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_SWITCH_MAP_PRODUCER_H_
#define _COURIER_SWITCH_MAP_PRODUCER_H_

#include "../CompositeCancelable.hpp"
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

/**
 * Receives the value of the upstream producer and subscribes the downstream
 * observer to the producer created from it. The inner subscription is added
 * to the shared composite so that canceling the outer subscription reaches it.
 */
template <class TI, class TO, class E>
class SwitchMapObserver final : public Observer<TI,E> {
public:
    SwitchMapObserver(
        const SchedulerRef& sched,
        const std::function<ProducerRef<TO,E>(const TI&)>& predicate,
        const ObserverRef<TO,E>& downstream,
        const CompositeCancelableRef& composite
    );

    void onSuccess(TI&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    SchedulerRef sched;
    std::function<ProducerRef<TO,E>(const TI&)> predicate;
    ObserverRef<TO,E> downstream;
    CompositeCancelableRef composite;
};

/**
 * Represents a producer which switches to the producer created from the
 * value of its upstream. Normally obtained by calling `Producer<T>::switchMap`.
 */
template <class TI, class TO, class E>
class SwitchMapProducer final : public Producer<TO,E> {
public:
    SwitchMapProducer(const ProducerRef<TI,E>& upstream, const std::function<ProducerRef<TO,E>(const TI&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<TO,E>& observer) const override;
private:
    ProducerRef<TI,E> upstream;
    std::function<ProducerRef<TO,E>(const TI&)> predicate;
};

template <class TI, class TO, class E>
SwitchMapObserver<TI,TO,E>::SwitchMapObserver(
    const SchedulerRef& sched,
    const std::function<ProducerRef<TO,E>(const TI&)>& predicate,
    const ObserverRef<TO,E>& downstream,
    const CompositeCancelableRef& composite
)   : sched(sched)
    , predicate(predicate)
    , downstream(downstream)
    , composite(composite)
{}

template <class TI, class TO, class E>
void SwitchMapObserver<TI,TO,E>::onSuccess(TI&& value) {
    ProducerRef<TO,E> inner;

    try {
        inner = predicate(value);
    } catch(E& error) {
        downstream->onError(error);
        return;
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    try {
        composite->add(inner->subscribe(sched, downstream));
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
    }
}

template <class TI, class TO, class E>
void SwitchMapObserver<TI,TO,E>::onEmpty() {
    downstream->onEmpty();
}

template <class TI, class TO, class E>
void SwitchMapObserver<TI,TO,E>::onError(const E& error) {
    downstream->onError(error);
}

template <class TI, class TO, class E>
SwitchMapProducer<TI,TO,E>::SwitchMapProducer(
    const ProducerRef<TI,E>& upstream,
    const std::function<ProducerRef<TO,E>(const TI&)>& predicate
)   : upstream(upstream)
    , predicate(predicate)
{}

template <class TI, class TO, class E>
CancelableRef SwitchMapProducer<TI,TO,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<TO,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();
    auto switchObserver = std::make_shared<SwitchMapObserver<TI,TO,E>>(sched, predicate, observer, composite);
    composite->add(upstream->subscribe(sched, switchObserver));
    return composite;
}

} // namespace courier::producer

#endif
