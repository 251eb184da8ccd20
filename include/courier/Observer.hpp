//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_OBSERVER_H_
#define _COURIER_OBSERVER_H_

#include <memory>

namespace courier {

template <class T, class E>
class Observer;

template <class T, class E>
using ObserverRef = std::shared_ptr<Observer<T,E>>;

/**
 * An observer represents the consumer of a producer's single result.
 *
 * Producers must implement the following rules when calling methods
 * on this interface:
 *
 *   1. Exactly one of `onSuccess`, `onEmpty` or `onError` is called at
 *      most once per subscription.
 *   2. Nothing is called after the subscription has been canceled.
 *
 * Every subscription is wrapped in a `Subscription` guard which enforces
 * these rules - so late or duplicate events from a misbehaving upstream
 * never reach an observer.
 */
template <class T, class E>
class Observer {
public:
    /**
     * Handle the terminal value of the producer.
     */
    virtual void onSuccess(T&& value) = 0;

    /**
     * Handle the producer completing without a value.
     */
    virtual void onEmpty() = 0;

    /**
     * Handle the producer failing.
     */
    virtual void onError(const E& error) = 0;

    virtual ~Observer() = default;
};

} // namespace courier

#endif
