//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_TERMINATE_PRODUCER_H_
#define _COURIER_TERMINATE_PRODUCER_H_

#include "../Logging.hpp"
#include "../Producer.hpp"

namespace courier::producer {

template <class T, class E>
class TerminateObserver final : public Observer<T,E> {
public:
    TerminateObserver(const std::function<void()>& callback, const ObserverRef<T,E>& downstream);
    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    void runCallback();

    std::function<void()> callback;
    ObserverRef<T,E> downstream;
};

/**
 * Represents a producer running a callback on any terminal event of its
 * upstream. Normally obtained by calling `Producer<T>::doOnTerminate`.
 */
template <class T, class E>
class TerminateProducer final : public Producer<T,E> {
public:
    TerminateProducer(const ProducerRef<T,E>& upstream, const std::function<void()>& callback);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
    std::function<void()> callback;
};

template <class T, class E>
TerminateObserver<T,E>::TerminateObserver(const std::function<void()>& callback, const ObserverRef<T,E>& downstream)
    : callback(callback)
    , downstream(downstream)
{}

template <class T, class E>
void TerminateObserver<T,E>::runCallback() {
    // The terminal event is forwarded whether or not the callback succeeds.
    try {
        callback();
    } catch(const std::exception& failure) {
        logging::logger()->error("Terminate callback threw: {}", failure.what());
    }
}

template <class T, class E>
void TerminateObserver<T,E>::onSuccess(T&& value) {
    runCallback();
    downstream->onSuccess(std::move(value));
}

template <class T, class E>
void TerminateObserver<T,E>::onEmpty() {
    runCallback();
    downstream->onEmpty();
}

template <class T, class E>
void TerminateObserver<T,E>::onError(const E& error) {
    runCallback();
    downstream->onError(error);
}

template <class T, class E>
TerminateProducer<T,E>::TerminateProducer(const ProducerRef<T,E>& upstream, const std::function<void()>& callback)
    : upstream(upstream)
    , callback(callback)
{}

template <class T, class E>
CancelableRef TerminateProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto terminateObserver = std::make_shared<TerminateObserver<T,E>>(callback, observer);
    return upstream->subscribe(sched, terminateObserver);
}

} // namespace courier::producer

#endif
