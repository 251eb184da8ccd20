//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_LOGGING_H_
#define _COURIER_LOGGING_H_

#include <memory>
#include <spdlog/spdlog.h>

namespace courier::logging {

constexpr const char* LOGGER_NAME = "courier";

/**
 * Obtain the logger used by the library. Unless replaced via `setLogger`
 * this is a stderr logger named "courier", created on first use.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Replace the logger used by the library, for example to route library
 * output into a host application's sinks.
 *
 * @param replacement The logger to use from now on.
 */
void setLogger(const std::shared_ptr<spdlog::logger>& replacement);

} // namespace courier::logging

#endif
