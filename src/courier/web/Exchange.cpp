//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/Exchange.hpp"
#include "courier/Error.hpp"

namespace courier::web {

Exchange::Exchange(ExchangeContext context)
    : snapshot(std::move(context))
    , mutex()
    , currentState(ExchangeState::Open)
    , bound(false)
    , abortCallbacks()
{}

const ExchangeContext& Exchange::context() const {
    return snapshot;
}

bool Exchange::apply(const ResponseAction& action) {
    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState == ExchangeState::Completed) {
            throw ProtocolViolation(
                "A response was already applied to " + snapshot.method() + " " + snapshot.path()
                + ", refusing " + action.describe()
            );
        } else if(currentState == ExchangeState::Aborted) {
            return false;
        }

        currentState = ExchangeState::Completed;
        abortCallbacks.clear();
    }

    write(action);
    return true;
}

void Exchange::abort() {
    std::vector<std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState != ExchangeState::Open) {
            return;
        }

        currentState = ExchangeState::Aborted;
        std::swap(callbacks, abortCallbacks);
    }

    for(auto& callback : callbacks) {
        callback();
    }
}

void Exchange::onAbort(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(currentState == ExchangeState::Aborted) {
            runNow = true;
        } else if(currentState == ExchangeState::Open) {
            abortCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

void Exchange::bind() {
    std::lock_guard<std::mutex> guard(mutex);
    if(bound) {
        throw ProtocolViolation("Exchange " + snapshot.method() + " " + snapshot.path() + " is already dispatched");
    }
    bound = true;
}

ExchangeState Exchange::state() const {
    std::lock_guard<std::mutex> guard(mutex);
    return currentState;
}

} // namespace courier::web
