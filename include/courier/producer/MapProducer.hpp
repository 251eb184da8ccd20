//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_MAP_PRODUCER_H_
#define _COURIER_MAP_PRODUCER_H_

#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

/**
 * Represents an observer that transforms the value received from upstream and
 * passes the transformed value to a downstream observer. Normally obtained by
 * calling `Producer<T>::map` and then subscribing to the resulting producer.
 */
template <class TI, class TO, class E>
class MapObserver final : public Observer<TI,E> {
public:
    MapObserver(const std::function<TO(const TI&)>& predicate, const ObserverRef<TO,E>& downstream);
    void onSuccess(TI&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    std::function<TO(const TI&)> predicate;
    ObserverRef<TO,E> downstream;
};

/**
 * Represents a producer that transforms the value of an upstream producer
 * using the given predicate function. Normally obtained by calling `Producer<T>::map`.
 */
template <class TI, class TO, class E>
class MapProducer final : public Producer<TO,E> {
public:
    MapProducer(const ProducerRef<TI,E>& upstream, const std::function<TO(const TI&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<TO,E>& observer) const override;
private:
    ProducerRef<TI,E> upstream;
    std::function<TO(const TI&)> predicate;
};

template <class TI, class TO, class E>
MapObserver<TI,TO,E>::MapObserver(const std::function<TO(const TI&)>& predicate, const ObserverRef<TO,E>& downstream)
    : predicate(predicate)
    , downstream(downstream)
{}

template <class TI, class TO, class E>
void MapObserver<TI,TO,E>::onSuccess(TI&& value) {
    std::optional<TO> result;

    try {
        result.emplace(predicate(value));
    } catch(E& error) {
        downstream->onError(error);
        return;
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    downstream->onSuccess(std::move(*result));
}

template <class TI, class TO, class E>
void MapObserver<TI,TO,E>::onEmpty() {
    downstream->onEmpty();
}

template <class TI, class TO, class E>
void MapObserver<TI,TO,E>::onError(const E& error) {
    downstream->onError(error);
}

template <class TI, class TO, class E>
MapProducer<TI,TO,E>::MapProducer(const ProducerRef<TI,E>& upstream, const std::function<TO(const TI&)>& predicate)
    : upstream(upstream)
    , predicate(predicate)
{}

template <class TI, class TO, class E>
CancelableRef MapProducer<TI,TO,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<TO,E>& observer) const {
    auto mapObserver = std::make_shared<MapObserver<TI,TO,E>>(predicate, observer);
    return upstream->subscribe(sched, mapObserver);
}

} // namespace courier::producer

#endif
