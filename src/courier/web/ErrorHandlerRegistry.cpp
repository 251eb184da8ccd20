//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/ErrorHandlerRegistry.hpp"

namespace courier::web {

void ErrorHandlerRegistry::set(const std::string& category, const ErrorHandler& handler) {
    std::lock_guard<std::mutex> guard(mutex);
    if(!handler) {
        handlers.erase(category);
    } else {
        handlers[category] = handler;
    }
}

std::optional<ErrorHandler> ErrorHandlerRegistry::lookup(const Error& error) const {
    std::lock_guard<std::mutex> guard(mutex);

    auto exact = handlers.find(error.category());
    if(exact != handlers.end()) {
        return exact->second;
    }

    if(!error.parentCategory().empty()) {
        auto parent = handlers.find(error.parentCategory());
        if(parent != handlers.end()) {
            return parent->second;
        }
    }

    return {};
}

} // namespace courier::web
