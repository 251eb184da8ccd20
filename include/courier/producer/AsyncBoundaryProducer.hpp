//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_ASYNC_BOUNDARY_PRODUCER_H_
#define _COURIER_ASYNC_BOUNDARY_PRODUCER_H_

#include "../CompositeCancelable.hpp"
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

/**
 * Represents a producer whose upstream is subscribed from a task submitted
 * to the scheduler instead of the subscribing thread.
 */
template <class T, class E>
class AsyncBoundaryProducer final : public Producer<T,E> {
public:
    explicit AsyncBoundaryProducer(const ProducerRef<T,E>& upstream);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
};

template <class T, class E>
AsyncBoundaryProducer<T,E>::AsyncBoundaryProducer(const ProducerRef<T,E>& upstream)
    : upstream(upstream)
{}

template <class T, class E>
CancelableRef AsyncBoundaryProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();

    sched->submit([sched, composite, upstream = upstream, observer]() {
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
    });

    return composite;
}

} // namespace courier::producer

#endif
