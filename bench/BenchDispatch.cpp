//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <benchmark/benchmark.h>
#include "courier/Combine.hpp"
#include "courier/Producer.hpp"
#include "courier/scheduler/BenchScheduler.hpp"
#include "courier/web/Dispatcher.hpp"
#include "courier/web/Exchange.hpp"

using courier::Combine;
using courier::CombinedResult;
using courier::Producer;
using courier::scheduler::BenchScheduler;
using courier::web::Dispatcher;
using courier::web::Exchange;
using courier::web::ExchangeContext;
using courier::web::ResponseAction;

namespace {

class CountingExchange final : public Exchange {
public:
    CountingExchange()
        : Exchange(ExchangeContext("GET", "/books"))
        , writes(0)
    {}

    int writes;

protected:
    void write(const ResponseAction&) override {
        writes++;
    }
};

} // namespace

// Benchmark a chain of map operations subscribed synchronously
static void BM_Map_PureChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto sched = std::make_shared<BenchScheduler>();

    auto producer = Producer<int>::pure(0);
    for (int i = 0; i < chain_length; ++i) {
        producer = producer->map<int>([](int value) { return value + 1; });
    }

    for (auto _ : state) {
        auto result = producer->run(sched)->get();
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Map_PureChain)->Range(1, 1024);

// Benchmark a chain of switchMap operations
static void BM_SwitchMap_PureChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto sched = std::make_shared<BenchScheduler>();

    auto producer = Producer<int>::pure(0);
    for (int i = 0; i < chain_length; ++i) {
        producer = producer->switchMap<int>([](int value) {
            return Producer<int>::pure(value + 1);
        });
    }

    for (auto _ : state) {
        auto result = producer->run(sched)->get();
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SwitchMap_PureChain)->Range(1, 256);

// Benchmark zipping a list with its count, including both scheduled subscriptions
static void BM_Zip_ListAndCount(benchmark::State& state) {
    auto sched = std::make_shared<BenchScheduler>();
    auto books = Producer<std::vector<std::string>>::pure({"Dune", "Emma", "Ulysses"});
    auto count = Producer<int64_t>::pure(3);
    auto combined = Combine::listAndCount<std::string>(books, count);

    for (auto _ : state) {
        auto promise = combined->run(sched);
        sched->run_ready_tasks();
        benchmark::DoNotOptimize(promise->get());
    }
}
BENCHMARK(BM_Zip_ListAndCount);

// Benchmark a full dispatch from producer to written response, timeout included
static void BM_Dispatch_Render(benchmark::State& state) {
    auto sched = std::make_shared<BenchScheduler>();
    Dispatcher dispatcher(sched);
    auto books = Producer<std::vector<std::string>>::pure({"Dune", "Emma", "Ulysses"});
    auto count = Producer<int64_t>::pure(3);

    auto producer = dispatcher.helper().renderWith<CombinedResult<std::string>>(
        "index",
        Combine::listAndCount<std::string>(books, count),
        [](auto& result) { return Combine::toModel(result, "bookList", "bookCount"); }
    );

    int64_t writes = 0;
    for (auto _ : state) {
        auto exchange = std::make_shared<CountingExchange>();
        dispatcher.dispatch(exchange, producer);
        sched->run_ready_tasks();
        writes += exchange->writes;
    }

    state.counters["writes"] = static_cast<double>(writes);
}
BENCHMARK(BM_Dispatch_Render);

// Benchmark dispatching an error through the handler registry
static void BM_Dispatch_HandledFailure(benchmark::State& state) {
    auto sched = std::make_shared<BenchScheduler>();
    Dispatcher dispatcher(sched);

    dispatcher.onError(courier::category::UPSTREAM, [](auto&, auto&) {
        return ResponseAction::respond(std::any(), 502);
    });

    auto producer = Producer<ResponseAction>::raiseError(courier::Error::upstream("broke"));

    for (auto _ : state) {
        auto exchange = std::make_shared<CountingExchange>();
        dispatcher.dispatch(exchange, producer);
        sched->run_ready_tasks();
        benchmark::DoNotOptimize(exchange->writes);
    }
}
BENCHMARK(BM_Dispatch_HandledFailure);
