//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_ON_ERROR_PRODUCER_H_
#define _COURIER_ON_ERROR_PRODUCER_H_

#include "../CompositeCancelable.hpp"
#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

template <class T, class E>
class OnErrorReturnObserver final : public Observer<T,E> {
public:
    OnErrorReturnObserver(const std::function<T(const E&)>& predicate, const ObserverRef<T,E>& downstream);
    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    std::function<T(const E&)> predicate;
    ObserverRef<T,E> downstream;
};

/**
 * Represents a producer which substitutes a value for an upstream failure.
 * Normally obtained by calling `Producer<T>::onErrorReturn`.
 */
template <class T, class E>
class OnErrorReturnProducer final : public Producer<T,E> {
public:
    OnErrorReturnProducer(const ProducerRef<T,E>& upstream, const std::function<T(const E&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
    std::function<T(const E&)> predicate;
};

template <class T, class E>
class OnErrorResumeObserver final : public Observer<T,E> {
public:
    OnErrorResumeObserver(
        const SchedulerRef& sched,
        const std::function<ProducerRef<T,E>(const E&)>& predicate,
        const ObserverRef<T,E>& downstream,
        const CompositeCancelableRef& composite
    );

    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;
private:
    SchedulerRef sched;
    std::function<ProducerRef<T,E>(const E&)> predicate;
    ObserverRef<T,E> downstream;
    CompositeCancelableRef composite;
};

/**
 * Represents a producer which switches to another producer when its
 * upstream fails. Normally obtained by calling `Producer<T>::onErrorResume`.
 */
template <class T, class E>
class OnErrorResumeProducer final : public Producer<T,E> {
public:
    OnErrorResumeProducer(const ProducerRef<T,E>& upstream, const std::function<ProducerRef<T,E>(const E&)>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    ProducerRef<T,E> upstream;
    std::function<ProducerRef<T,E>(const E&)> predicate;
};

template <class T, class E>
OnErrorReturnObserver<T,E>::OnErrorReturnObserver(const std::function<T(const E&)>& predicate, const ObserverRef<T,E>& downstream)
    : predicate(predicate)
    , downstream(downstream)
{}

template <class T, class E>
void OnErrorReturnObserver<T,E>::onSuccess(T&& value) {
    downstream->onSuccess(std::move(value));
}

template <class T, class E>
void OnErrorReturnObserver<T,E>::onEmpty() {
    downstream->onEmpty();
}

template <class T, class E>
void OnErrorReturnObserver<T,E>::onError(const E& error) {
    std::optional<T> substitute;

    try {
        substitute.emplace(predicate(error));
    } catch(E& rethrown) {
        downstream->onError(rethrown);
        return;
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    downstream->onSuccess(std::move(*substitute));
}

template <class T, class E>
OnErrorReturnProducer<T,E>::OnErrorReturnProducer(const ProducerRef<T,E>& upstream, const std::function<T(const E&)>& predicate)
    : upstream(upstream)
    , predicate(predicate)
{}

template <class T, class E>
CancelableRef OnErrorReturnProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto errorObserver = std::make_shared<OnErrorReturnObserver<T,E>>(predicate, observer);
    return upstream->subscribe(sched, errorObserver);
}

template <class T, class E>
OnErrorResumeObserver<T,E>::OnErrorResumeObserver(
    const SchedulerRef& sched,
    const std::function<ProducerRef<T,E>(const E&)>& predicate,
    const ObserverRef<T,E>& downstream,
    const CompositeCancelableRef& composite
)   : sched(sched)
    , predicate(predicate)
    , downstream(downstream)
    , composite(composite)
{}

template <class T, class E>
void OnErrorResumeObserver<T,E>::onSuccess(T&& value) {
    downstream->onSuccess(std::move(value));
}

template <class T, class E>
void OnErrorResumeObserver<T,E>::onEmpty() {
    downstream->onEmpty();
}

template <class T, class E>
void OnErrorResumeObserver<T,E>::onError(const E& error) {
    ProducerRef<T,E> resumed;

    try {
        resumed = predicate(error);
    } catch(E& rethrown) {
        downstream->onError(rethrown);
        return;
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
        return;
    }

    try {
        composite->add(resumed->subscribe(sched, downstream));
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*downstream, failure)) {
            throw;
        }
    }
}

template <class T, class E>
OnErrorResumeProducer<T,E>::OnErrorResumeProducer(const ProducerRef<T,E>& upstream, const std::function<ProducerRef<T,E>(const E&)>& predicate)
    : upstream(upstream)
    , predicate(predicate)
{}

template <class T, class E>
CancelableRef OnErrorResumeProducer<T,E>::subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const {
    auto composite = std::make_shared<CompositeCancelable>();
    auto errorObserver = std::make_shared<OnErrorResumeObserver<T,E>>(sched, predicate, observer, composite);
    composite->add(upstream->subscribe(sched, errorObserver));
    return composite;
}

} // namespace courier::producer

#endif
