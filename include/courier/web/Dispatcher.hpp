//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_DISPATCHER_H_
#define _COURIER_WEB_DISPATCHER_H_

#include <functional>
#include <memory>
#include "../Cancelable.hpp"
#include "../Producer.hpp"
#include "../Scheduler.hpp"
#include "DispatcherConfig.hpp"
#include "ErrorHandlerRegistry.hpp"
#include "Exchange.hpp"
#include "ResponseHelper.hpp"

namespace courier::web {

/**
 * A controller action. It receives the request snapshot and the response
 * helper - never the exchange itself - and returns the producer of its
 * response.
 */
using Action = std::function<ProducerRef<ResponseAction>(const ExchangeContext&, const ResponseHelper&)>;

/**
 * Binds the producer returned by a controller action to its HTTP exchange.
 * The producer is subscribed on the dispatcher's scheduler and its terminal
 * event is turned into exactly one response:
 *
 *   - a value is applied as is,
 *   - an empty completion applies the empty action of the dispatch call,
 *   - a failure applies the action of the handler registered for its
 *     category, or the configured failure action when there is none.
 *
 * Aborting the exchange cancels the subscription.
 */
class Dispatcher {
public:
    explicit Dispatcher(const SchedulerRef& sched, const DispatcherConfig& config = DispatcherConfig());

    /**
     * Register the failure handler for a category. Handlers are looked up
     * by the exact category of a failure first and its parent category second.
     *
     * @return This dispatcher for chaining.
     */
    Dispatcher& onError(const std::string& category, const ErrorHandler& handler);

    /**
     * Dispatch a producer using the configured empty action.
     *
     * @throws ProtocolViolation if the exchange was already dispatched.
     * @return A handle which cancels the dispatch and aborts the exchange.
     */
    CancelableRef dispatch(const ExchangeRef& exchange, const ProducerRef<ResponseAction>& producer);

    /**
     * Dispatch a producer, applying the given action if it completes empty.
     *
     * @throws ProtocolViolation if the exchange was already dispatched.
     * @return A handle which cancels the dispatch and aborts the exchange.
     */
    CancelableRef dispatch(
        const ExchangeRef& exchange,
        const ProducerRef<ResponseAction>& producer,
        const ResponseAction& emptyAction
    );

    /**
     * Invoke a controller action on the calling thread and dispatch the
     * producer it returns. An `Error` thrown by the action is dispatched
     * as a failure.
     *
     * @throws ProtocolViolation if the exchange was already dispatched.
     * @return A handle which cancels the dispatch and aborts the exchange.
     */
    CancelableRef dispatch(const ExchangeRef& exchange, const Action& action);

    const ResponseHelper& helper() const;
    const DispatcherConfig& config() const;

    /**
     * The state shared with in-flight dispatches, which may outlive
     * the dispatcher.
     */
    struct State {
        DispatcherConfig config;
        ErrorHandlerRegistry registry;
        ResponseHelper helper;

        explicit State(const DispatcherConfig& config);

        ResponseAction resolveFailure(const Error& error, const ExchangeContext& context) const;
    };

private:
    CancelableRef launch(
        const ExchangeRef& exchange,
        const ProducerRef<ResponseAction>& producer,
        const ResponseAction& emptyAction
    );

    SchedulerRef sched;
    std::shared_ptr<State> state;
};

} // namespace courier::web

#endif
