//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_EXCHANGE_H_
#define _COURIER_WEB_EXCHANGE_H_

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "ExchangeContext.hpp"
#include "ResponseAction.hpp"

namespace courier::web {

class Exchange;
using ExchangeRef = std::shared_ptr<Exchange>;

enum class ExchangeState { Open, Completed, Aborted };

/**
 * An HTTP request/response pair as seen by the dispatcher. Concrete
 * exchanges perform the actual write in `write` - the base class makes sure
 * that happens at most once, from whichever thread applies the response.
 */
class Exchange {
public:
    explicit Exchange(ExchangeContext context);

    /**
     * @return The request snapshot taken when the exchange was created.
     */
    const ExchangeContext& context() const;

    /**
     * Apply the response to this exchange.
     *
     * @param action The response to write.
     * @return true if the response was written, false if the exchange
     *         was aborted first.
     * @throws ProtocolViolation if a response was already applied.
     */
    bool apply(const ResponseAction& action);

    /**
     * Abort the exchange - typically because the client went away. Abort
     * callbacks run once. Has no effect once a response was applied.
     */
    void abort();

    /**
     * Register a callback to run when the exchange is aborted.
     */
    void onAbort(const std::function<void()>& callback);

    /**
     * Claim the exchange for a dispatcher.
     *
     * @throws ProtocolViolation if the exchange was already dispatched.
     */
    void bind();

    ExchangeState state() const;

    virtual ~Exchange() = default;

protected:
    virtual void write(const ResponseAction& action) = 0;

private:
    ExchangeContext snapshot;
    mutable std::mutex mutex;
    ExchangeState currentState;
    bool bound;
    std::vector<std::function<void()>> abortCallbacks;
};

} // namespace courier::web

#endif
