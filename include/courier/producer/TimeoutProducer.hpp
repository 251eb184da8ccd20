//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_TIMEOUT_PRODUCER_H_
#define _COURIER_TIMEOUT_PRODUCER_H_

#include <atomic>
#include "../CompositeCancelable.hpp"
#include "../Logging.hpp"
#include "../Producer.hpp"

namespace courier::producer {

/**
 * Races the upstream terminal event against a timer. Whichever arrives
 * first claims the observer and cancels the other.
 */
template <class T, class E>
class TimeoutObserver final : public Observer<T,E> {
public:
    TimeoutObserver(const ObserverRef<T,E>& downstream, const CompositeCancelableRef& composite);

    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;

    /**
     * Called by the timer. Fails downstream unless the upstream
     * already terminated.
     */
    void onTimeout(int64_t milliseconds, const E& error);

private:
    bool claim();

    std::atomic_bool claimed;
    ObserverRef<T,E> downstream;
    CompositeCancelableRef composite;
};

/**
 * Represents a producer failing with a fixed error when its upstream does not
 * terminate in time. Normally obtained by calling `Producer<T>::timeout`.
 */
template <class T, class E>
class TimeoutProducer final : public Producer<T,E> {
public:
    TimeoutProducer(const ProducerRef<T,E>& upstream, int64_t milliseconds, const E& error);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
    int64_t milliseconds;
    E error;
};

template <class T, class E>
TimeoutObserver<T,E>::TimeoutObserver(const ObserverRef<T,E>& downstream, const CompositeCancelableRef& composite)
    : claimed(false)
    , downstream(downstream)
    , composite(composite)
{}

template <class T, class E>
bool TimeoutObserver<T,E>::claim() {
    if(claimed.exchange(true)) {
        return false;
    }

    // Stops the timer - or the upstream when the timer won.
    composite->cancel();
    return true;
}

template <class T, class E>
void TimeoutObserver<T,E>::onSuccess(T&& value) {
    if(claim()) {
        downstream->onSuccess(std::move(value));
    }
}

template <class T, class E>
void TimeoutObserver<T,E>::onEmpty() {
    if(claim()) {
        downstream->onEmpty();
    }
}

template <class T, class E>
void TimeoutObserver<T,E>::onError(const E& error) {
    if(claim()) {
        downstream->onError(error);
    }
}

template <class T, class E>
void TimeoutObserver<T,E>::onTimeout(int64_t milliseconds, const E& error) {
    if(claim()) {
        logging::logger()->warn("No terminal event within {}ms, failing with a timeout", milliseconds);
        downstream->onError(error);
    }
}

template <class T, class E>
TimeoutProducer<T,E>::TimeoutProducer(const ProducerRef<T,E>& upstream, int64_t milliseconds, const E& error)
    : upstream(upstream)
    , milliseconds(milliseconds)
    , error(error)
{}

template <class T, class E>
CancelableRef TimeoutProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();
    auto timeoutObserver = std::make_shared<TimeoutObserver<T,E>>(observer, composite);

    composite->add(sched->submitAfter(milliseconds, [timeoutObserver, milliseconds = milliseconds, error = error]() {
        timeoutObserver->onTimeout(milliseconds, error);
    }));

    try {
        composite->add(upstream->subscribe(sched, timeoutObserver));
    } catch(...) {
        composite->cancel();
        throw;
    }

    return composite;
}

} // namespace courier::producer

#endif
