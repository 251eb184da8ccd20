//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_CANCELABLE_H_
#define _COURIER_CANCELABLE_H_

#include <functional>
#include <memory>

namespace courier {

class Cancelable;

using CancelableRef = std::shared_ptr<Cancelable>;

/**
 * Represents a computation that can be canceled - a running
 * subscription, a pending timer or an in-flight dispatch.
 */
class Cancelable {
public:
    /**
     * Cancel an ongoing and uncompleted background computation.
     * Cancel may be called multiple times without error - the
     * cancellation will only be attempted once. Canceling a
     * computation which already completed has no effect.
     */
    virtual void cancel() = 0;

    /**
     * Register a callback to be processed in the event of a cancelation.
     * If the computation is already canceled the callback runs immediately.
     *
     * @param callback The callback to run if this computation is canceled.
     */
    virtual void onCancel(const std::function<void()>& callback) = 0;

    /**
     * Register a callback to be processed in the event the computation
     * completes without being cancelled.
     *
     * @param callback The callback to run if the computation is completed
     *                 without being cancelled.
     */
    virtual void onShutdown(const std::function<void()>& callback) = 0;

    virtual ~Cancelable() = default;
};

class IgnoreCancelation final : public Cancelable {
public:
    void cancel() override {}
    void onCancel(const std::function<void()>&) override {}
    void onShutdown(const std::function<void()>&) override {}
};

} // namespace courier

#endif
