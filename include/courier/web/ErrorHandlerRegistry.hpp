//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_ERROR_HANDLER_REGISTRY_H_
#define _COURIER_WEB_ERROR_HANDLER_REGISTRY_H_

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "../Error.hpp"
#include "ExchangeContext.hpp"
#include "ResponseAction.hpp"

namespace courier::web {

using ErrorHandler = std::function<ResponseAction(const Error&, const ExchangeContext&)>;

/**
 * Failure handlers keyed by error category. A lookup prefers a handler for
 * the exact category and falls back to one for the parent category.
 */
class ErrorHandlerRegistry {
public:
    /**
     * Register the handler for a category, replacing any previous one.
     * Passing an empty handler removes the registration.
     */
    void set(const std::string& category, const ErrorHandler& handler);

    std::optional<ErrorHandler> lookup(const Error& error) const;

private:
    mutable std::mutex mutex;
    std::map<std::string, ErrorHandler> handlers;
};

} // namespace courier::web

#endif
