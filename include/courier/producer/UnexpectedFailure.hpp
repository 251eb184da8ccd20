//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_UNEXPECTED_FAILURE_H_
#define _COURIER_UNEXPECTED_FAILURE_H_

#include "../Error.hpp"
#include "../Logging.hpp"
#include "../Observer.hpp"

namespace courier::producer {

/**
 * Deliver an exception caught inside an operator - thrown by a stage
 * function or by a nested subscribe - to the observer as an error. Must be
 * called from within the catch block.
 *
 * @return false when the exception cannot be expressed as `E`, in which
 *         case the caller rethrows it.
 */
template <class T, class E>
bool deliverUnexpected(Observer<T,E>& observer, const std::exception& failure) {
    auto converted = ErrorConversion<E>::convert(failure);
    if(!converted.has_value()) {
        return false;
    }

    logging::logger()->error("Producer stage raised an unexpected exception: {}", failure.what());
    observer.onError(*converted);
    return true;
}

} // namespace courier::producer

#endif
