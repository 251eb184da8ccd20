//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_MAP_ERROR_PRODUCER_H_
#define _COURIER_MAP_ERROR_PRODUCER_H_

#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

template <class T, class EI, class EO>
class MapErrorObserver final : public Observer<T,EI> {
public:
    MapErrorObserver(const std::function<EO(const EI&)>& predicate, const ObserverRef<T,EO>& downstream);
    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const EI& error) override;
private:
    std::function<EO(const EI&)> predicate;
    ObserverRef<T,EO> downstream;
};

/**
 * Represents a producer that transforms the error of an upstream producer.
 * Normally obtained by calling `Producer<T>::mapError`.
 */
template <class T, class EI, class EO>
class MapErrorProducer final : public Producer<T,EO> {
public:
    MapErrorProducer(const ProducerRef<T,EI>& upstream, const std::function<EO(const EI&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,EO>& observer) const override;
private:
    ProducerRef<T,EI> upstream;
    std::function<EO(const EI&)> predicate;
};

template <class T, class EI, class EO>
MapErrorObserver<T,EI,EO>::MapErrorObserver(const std::function<EO(const EI&)>& predicate, const ObserverRef<T,EO>& downstream)
    : predicate(predicate)
    , downstream(downstream)
{}

template <class T, class EI, class EO>
void MapErrorObserver<T,EI,EO>::onSuccess(T&& value) {
    downstream->onSuccess(std::move(value));
}

template <class T, class EI, class EO>
void MapErrorObserver<T,EI,EO>::onEmpty() {
    downstream->onEmpty();
}

template <class T, class EI, class EO>
void MapErrorObserver<T,EI,EO>::onError(const EI& error) {
    std::optional<EO> result;

    try {
        result.emplace(predicate(error));
    } catch(EO& thrown) {
        result.emplace(thrown);
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    downstream->onError(*result);
}

template <class T, class EI, class EO>
MapErrorProducer<T,EI,EO>::MapErrorProducer(const ProducerRef<T,EI>& upstream, const std::function<EO(const EI&)>& predicate)
    : upstream(upstream)
    , predicate(predicate)
{}

template <class T, class EI, class EO>
CancelableRef MapErrorProducer<T,EI,EO>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,EO>& observer) const {
    auto mapObserver = std::make_shared<MapErrorObserver<T,EI,EO>>(predicate, observer);
    return upstream->subscribe(sched, mapObserver);
}

} // namespace courier::producer

#endif
