//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <any>
#include "gtest/gtest.h"
#include "courier/Combine.hpp"
#include "courier/scheduler/BenchScheduler.hpp"

using courier::Combine;
using courier::CombinedResult;
using courier::Error;
using courier::Producer;
using courier::scheduler::BenchScheduler;

TEST(CombineListAndCount, CombinesBothQueries) {
    auto sched = std::make_shared<BenchScheduler>();

    auto promise = Combine::listAndCount<std::string>(
        Producer<std::vector<std::string>>::pure({"Dune", "Emma"}),
        Producer<int64_t>::pure(2)
    )->run(sched);

    sched->run_ready_tasks();

    auto result = promise->get();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_value());
    EXPECT_EQ(result->get_value().items.size(), 2);
    EXPECT_EQ(result->get_value().count, 2);
}

TEST(CombineListAndCount, FailsWhenCountFails) {
    auto sched = std::make_shared<BenchScheduler>();

    auto promise = Combine::listAndCount<std::string>(
        Producer<std::vector<std::string>>::pure({"Dune"}),
        Producer<int64_t>::raiseError(Error::upstream("count failed"))
    )->run(sched);

    sched->run_ready_tasks();

    auto result = promise->get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_error());
}

TEST(CombineToModel, StoresItemsAndCount) {
    CombinedResult<std::string> combined{{"Dune", "Emma"}, 2};
    auto model = Combine::toModel(combined, "bookList", "bookCount");

    ASSERT_EQ(model.size(), 2);
    auto items = std::any_cast<std::vector<std::string>>(model.at("bookList"));
    EXPECT_EQ(items[1], "Emma");
    EXPECT_EQ(std::any_cast<int64_t>(model.at("bookCount")), 2);
}
