//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_DEFER_PRODUCER_H_
#define _COURIER_DEFER_PRODUCER_H_

#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

template <class T, class E>
class DeferProducer final : public Producer<T,E> {
public:
    explicit DeferProducer(const std::function<ProducerRef<T,E>()>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    std::function<ProducerRef<T,E>()> predicate;
};

template <class T, class E>
DeferProducer<T,E>::DeferProducer(const std::function<ProducerRef<T,E>()>& predicate)
    : predicate(predicate)
{}

template <class T, class E>
CancelableRef DeferProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    ProducerRef<T,E> deferred;

    try {
        deferred = predicate();
    } catch(E& error) {
        observer->onError(error);
        return std::make_shared<IgnoreCancelation>();
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*observer, failure)) {
            throw;
        }
        return std::make_shared<IgnoreCancelation>();
    }

    return deferred->subscribe(sched, observer);
}

} // namespace courier::producer

#endif
