//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_SOURCE_PRODUCERS_H_
#define _COURIER_SOURCE_PRODUCERS_H_

#include "../Producer.hpp"
#include "UnexpectedFailure.hpp"

namespace courier::producer {

template <class T, class E>
class PureProducer final : public Producer<T,E> {
public:
    explicit PureProducer(const T& value);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    T value;
};

template <class T, class E>
class EmptyProducer final : public Producer<T,E> {
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
};

template <class T, class E>
class ErrorProducer final : public Producer<T,E> {
public:
    explicit ErrorProducer(const E& error);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    E error;
};

template <class T, class E>
class NeverProducer final : public Producer<T,E> {
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
};

/**
 * Evaluates a function on every subscription. The function may throw `E`
 * to fail or return nothing to complete empty.
 */
template <class T, class E>
class EvalProducer final : public Producer<T,E> {
public:
    explicit EvalProducer(const std::function<std::optional<T>()>& predicate);
protected:
    CancelableRef subscribeActual(const SchedulerRef& sched, const ObserverRef<T,E>& observer) const override;
private:
    std::function<std::optional<T>()> predicate;
};

template <class T, class E>
PureProducer<T,E>::PureProducer(const T& value)
    : value(value)
{}

template <class T, class E>
CancelableRef PureProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>& observer) const {
    T copy = value;
    observer->onSuccess(std::move(copy));
    return std::make_shared<IgnoreCancelation>();
}

template <class T, class E>
CancelableRef EmptyProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>& observer) const {
    observer->onEmpty();
    return std::make_shared<IgnoreCancelation>();
}

template <class T, class E>
ErrorProducer<T,E>::ErrorProducer(const E& error)
    : error(error)
{}

template <class T, class E>
CancelableRef ErrorProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>& observer) const {
    observer->onError(error);
    return std::make_shared<IgnoreCancelation>();
}

template <class T, class E>
CancelableRef NeverProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>&) const {
    return std::make_shared<IgnoreCancelation>();
}

template <class T, class E>
EvalProducer<T,E>::EvalProducer(const std::function<std::optional<T>()>& predicate)
    : predicate(predicate)
{}

template <class T, class E>
CancelableRef EvalProducer<T,E>::subscribeActual(const SchedulerRef&, const ObserverRef<T,E>& observer) const {
    std::optional<T> result;

    try {
        result = predicate();
    } catch(E& error) {
        observer->onError(error);
        return std::make_shared<IgnoreCancelation>();
    } catch(const std::exception& failure) {
        if(!deliverUnexpected(*observer, failure)) {
            throw;
        }
        return std::make_shared<IgnoreCancelation>();
    }

    if(result.has_value()) {
        observer->onSuccess(std::move(*result));
    } else {
        observer->onEmpty();
    }

    return std::make_shared<IgnoreCancelation>();
}

} // namespace courier::producer

#endif
