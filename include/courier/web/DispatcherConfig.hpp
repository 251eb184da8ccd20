//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_DISPATCHER_CONFIG_H_
#define _COURIER_WEB_DISPATCHER_CONFIG_H_

#include <any>
#include <cstdint>
#include "ResponseAction.hpp"

namespace courier::web {

struct DispatcherConfig {
    /**
     * Milliseconds a controller producer may take to terminate before it
     * is failed with a timeout error. Zero disables the timeout.
     */
    int64_t timeoutMs = 30000;

    /**
     * Applied when a producer completes empty and the dispatch call did
     * not name an action of its own.
     */
    ResponseAction emptyAction = ResponseAction::respond(std::any(), 404);

    /**
     * Applied when no handler is registered for a failure.
     */
    ResponseAction failureAction = ResponseAction::respond(std::any(), 500);

    /**
     * Applied on timeout when no handler is registered for timeouts.
     */
    ResponseAction timeoutAction = ResponseAction::respond(std::any(), 503);
};

} // namespace courier::web

#endif
