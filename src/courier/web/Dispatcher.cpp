//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/Dispatcher.hpp"
#include "courier/CompositeCancelable.hpp"
#include "courier/Logging.hpp"

namespace courier::web {

namespace {

void applyTo(const ExchangeRef& exchange, const ResponseAction& action) {
    auto& context = exchange->context();

    try {
        if(exchange->apply(action)) {
            logging::logger()->debug("Applied {} to {} {}", action.describe(), context.method(), context.path());
        } else {
            logging::logger()->debug("Dropped {} for aborted {} {}", action.describe(), context.method(), context.path());
        }
    } catch(const ProtocolViolation& violation) {
        logging::logger()->error("Protocol violation: {}", violation.what());
    } catch(const std::exception& failure) {
        logging::logger()->error(
            "Writing {} for {} {} failed: {}",
            action.describe(), context.method(), context.path(), failure.what()
        );
    }
}

class DispatchObserver final : public Observer<ResponseAction,Error> {
public:
    DispatchObserver(
        const std::shared_ptr<const Dispatcher::State>& state,
        const ExchangeRef& exchange,
        const ResponseAction& emptyAction,
        const CompositeCancelableRef& handle
    )   : state(state)
        , exchange(exchange)
        , emptyAction(emptyAction)
        , handle(handle)
    {}

    void onSuccess(ResponseAction&& action) override {
        applyTo(exchange, action);
        handle->shutdown();
    }

    void onEmpty() override {
        applyTo(exchange, emptyAction);
        handle->shutdown();
    }

    void onError(const Error& error) override {
        applyTo(exchange, state->resolveFailure(error, exchange->context()));
        handle->shutdown();
    }

private:
    std::shared_ptr<const Dispatcher::State> state;
    ExchangeRef exchange;
    ResponseAction emptyAction;
    CompositeCancelableRef handle;
};

} // namespace

Dispatcher::State::State(const DispatcherConfig& config)
    : config(config)
    , registry()
    , helper()
{}

ResponseAction Dispatcher::State::resolveFailure(const Error& error, const ExchangeContext& context) const {
    if(auto handler = registry.lookup(error)) {
        try {
            return (*handler)(error, context);
        } catch(const std::exception& failure) {
            logging::logger()->error(
                "Handler for {} failure of {} {} threw: {}",
                error.category(), context.method(), context.path(), failure.what()
            );
            return config.failureAction;
        }
    }

    if(error.isA(category::TIMEOUT)) {
        return config.timeoutAction;
    }

    logging::logger()->error(
        "Unhandled {} failure for {} {}: {}",
        error.category(), context.method(), context.path(), error.what()
    );
    return config.failureAction;
}

Dispatcher::Dispatcher(const SchedulerRef& sched, const DispatcherConfig& config)
    : sched(sched)
    , state(std::make_shared<State>(config))
{}

Dispatcher& Dispatcher::onError(const std::string& category, const ErrorHandler& handler) {
    state->registry.set(category, handler);
    return *this;
}

CancelableRef Dispatcher::dispatch(const ExchangeRef& exchange, const ProducerRef<ResponseAction>& producer) {
    return dispatch(exchange, producer, state->config.emptyAction);
}

CancelableRef Dispatcher::dispatch(
    const ExchangeRef& exchange,
    const ProducerRef<ResponseAction>& producer,
    const ResponseAction& emptyAction
) {
    exchange->bind();
    return launch(exchange, producer, emptyAction);
}

CancelableRef Dispatcher::dispatch(const ExchangeRef& exchange, const Action& action) {
    exchange->bind();

    ExchangeContext context = exchange->context();
    ProducerRef<ResponseAction> producer;

    try {
        producer = action(context, state->helper);
    } catch(const Error& error) {
        producer = Producer<ResponseAction>::raiseError(error);
    } catch(const std::exception& failure) {
        logging::logger()->error("Action for {} {} threw: {}", context.method(), context.path(), failure.what());
        producer = Producer<ResponseAction>::raiseError(Error::defect(failure.what(), std::current_exception()));
    }

    if(!producer) {
        producer = Producer<ResponseAction>::empty();
    }

    return launch(exchange, producer, state->config.emptyAction);
}

const ResponseHelper& Dispatcher::helper() const {
    return state->helper;
}

const DispatcherConfig& Dispatcher::config() const {
    return state->config;
}

CancelableRef Dispatcher::launch(
    const ExchangeRef& exchange,
    const ProducerRef<ResponseAction>& producer,
    const ResponseAction& emptyAction
) {
    auto& context = exchange->context();
    logging::logger()->debug("Dispatching {} {}", context.method(), context.path());

    auto timeoutMs = state->config.timeoutMs;
    auto guarded = timeoutMs > 0
        ? producer->timeout(timeoutMs, Error::timeout(timeoutMs))
        : producer;

    auto handle = std::make_shared<CompositeCancelable>();
    auto observer = std::make_shared<DispatchObserver>(state, exchange, emptyAction, handle);

    handle->onCancel([exchange]() {
        exchange->abort();
    });

    exchange->onAbort([handle, method = context.method(), path = context.path()]() {
        logging::logger()->info("Exchange {} {} aborted before completion", method, path);
        handle->cancel();
    });

    sched->submit([sched = sched, state = state, guarded, observer, handle, exchange]() {
        if(handle->isCanceled()) {
            return;
        }

        try {
            handle->add(guarded->subscribe(sched, observer));
        } catch(const std::exception& failure) {
            auto& context = exchange->context();
            logging::logger()->error("Subscribing for {} {} failed: {}", context.method(), context.path(), failure.what());
            applyTo(exchange, state->config.failureAction);
            handle->shutdown();
        }
    });

    return handle;
}

} // namespace courier::web
