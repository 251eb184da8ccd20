//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "SchedulerTestBench.hpp"
#include "RecordingExchange.hpp"
#include "courier/Combine.hpp"
#include "courier/web/Dispatcher.hpp"

using courier::Combine;
using courier::CombinedResult;
using courier::Error;
using courier::Producer;
using courier::Promise;
using courier::web::ActionKind;
using courier::web::Dispatcher;
using courier::web::ExchangeContext;
using courier::web::ResponseAction;

INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(DispatcherConcurrencyTest);

TEST_P(DispatcherConcurrencyTest, EveryExchangeGetsOneResponse) {
    const static int num_exchanges = 200;
    Dispatcher dispatcher(sched);
    std::vector<std::shared_ptr<RecordingExchange>> exchanges;

    for(int i = 0; i < num_exchanges; i++) {
        auto exchange = std::make_shared<RecordingExchange>(ExchangeContext("GET", "/books/" + std::to_string(i)));
        exchanges.push_back(exchange);

        auto books = Producer<std::vector<std::string>>::pure({"Dune"})->asyncBoundary();
        auto count = Producer<int64_t>::eval([i]() -> int64_t {
            if(i % 3 == 0) {
                throw Error::upstream("count query failed");
            }
            return i;
        })->asyncBoundary();

        dispatcher.dispatch(exchange, dispatcher.helper().renderWith<CombinedResult<std::string>>(
            "index",
            Combine::listAndCount<std::string>(books, count),
            [](auto& result) { return Combine::toModel(result, "bookList", "bookCount"); }
        ));
    }

    awaitIdle();

    for(int i = 0; i < num_exchanges; i++) {
        auto writes = exchanges[i]->writes();
        ASSERT_EQ(writes.size(), 1);
        if(i % 3 == 0) {
            ASSERT_EQ(writes[0].kind(), ActionKind::Respond);
            EXPECT_EQ(writes[0].asRespond().status, 500);
        } else {
            EXPECT_EQ(writes[0].kind(), ActionKind::Render);
        }
    }
}

TEST_P(DispatcherConcurrencyTest, AbortRacesCompletion) {
    const static int num_exchanges = 200;
    Dispatcher dispatcher(sched);
    std::vector<std::shared_ptr<RecordingExchange>> exchanges;

    for(int i = 0; i < num_exchanges; i++) {
        auto exchange = std::make_shared<RecordingExchange>();
        exchanges.push_back(exchange);

        dispatcher.dispatch(exchange, Producer<ResponseAction>::pure(ResponseAction::render("index"))->asyncBoundary());
        sched->submit([exchange] { exchange->abort(); });
    }

    awaitIdle();

    for(auto& exchange : exchanges) {
        EXPECT_LE(exchange->num_writes(), 1);
        if(exchange->num_writes() == 0) {
            EXPECT_EQ(exchange->state(), courier::web::ExchangeState::Aborted);
        }
    }
}

TEST_P(DispatcherConcurrencyTest, WorkerFailuresStillRespond) {
    const static int num_exchanges = 90;
    Dispatcher dispatcher(sched);
    std::vector<std::shared_ptr<RecordingExchange>> exchanges;

    for(int i = 0; i < num_exchanges; i++) {
        auto exchange = std::make_shared<RecordingExchange>(ExchangeContext("GET", "/shelves/" + std::to_string(i)));
        exchanges.push_back(exchange);

        if(i % 3 == 0) {
            auto consumed = Producer<int>::forPromise(Promise<int>::create(sched));
            consumed->run(sched);
            dispatcher.dispatch(exchange, Producer<ResponseAction>::zip<int,int>(
                Producer<int>::pure(i)->asyncBoundary(),
                consumed,
                [](auto, auto) { return ResponseAction::render("index"); }
            ));
        } else if(i % 3 == 1) {
            dispatcher.dispatch(exchange, Producer<int>::pure(i)->asyncBoundary()->map<ResponseAction>([](auto) -> ResponseAction {
                throw std::out_of_range("no such shelf");
            }));
        } else {
            dispatcher.dispatch(exchange, [](const ExchangeContext& context, const courier::web::ResponseHelper&) -> courier::ProducerRef<ResponseAction> {
                return Producer<ResponseAction>::pure(ResponseAction::respond(std::stoi(context.path()), 200));
            });
        }
    }

    awaitIdle();

    for(auto& exchange : exchanges) {
        auto writes = exchange->writes();
        ASSERT_EQ(writes.size(), 1);
        ASSERT_EQ(writes[0].kind(), ActionKind::Respond);
        EXPECT_EQ(writes[0].asRespond().status, 500);
    }
}
