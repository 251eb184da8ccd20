//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <mutex>
#include <vector>
#include "courier/web/Exchange.hpp"

/**
 * An exchange which keeps every written response action in memory.
 */
class RecordingExchange final : public courier::web::Exchange {
public:
    explicit RecordingExchange(courier::web::ExchangeContext context = courier::web::ExchangeContext("GET", "/"))
        : courier::web::Exchange(std::move(context))
    {}

    std::vector<courier::web::ResponseAction> writes() const {
        std::lock_guard<std::mutex> guard(writes_mutex);
        return written;
    }

    std::size_t num_writes() const {
        std::lock_guard<std::mutex> guard(writes_mutex);
        return written.size();
    }

protected:
    void write(const courier::web::ResponseAction& action) override {
        std::lock_guard<std::mutex> guard(writes_mutex);
        written.push_back(action);
    }

private:
    mutable std::mutex writes_mutex;
    std::vector<courier::web::ResponseAction> written;
};
