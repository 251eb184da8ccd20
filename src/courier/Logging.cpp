//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/Logging.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace courier::logging {

namespace {

std::mutex loggerMutex;
std::shared_ptr<spdlog::logger> current;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> guard(loggerMutex);
    if(!current) {
        current = spdlog::get(LOGGER_NAME);
        if(!current) {
            current = spdlog::stderr_color_mt(LOGGER_NAME);
        }
    }
    return current;
}

void setLogger(const std::shared_ptr<spdlog::logger>& replacement) {
    std::lock_guard<std::mutex> guard(loggerMutex);
    current = replacement;
}

} // namespace courier::logging
