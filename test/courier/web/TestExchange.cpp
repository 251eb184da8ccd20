//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "RecordingExchange.hpp"
#include "courier/Error.hpp"

using courier::ProtocolViolation;
using courier::web::ExchangeContext;
using courier::web::ExchangeState;
using courier::web::ResponseAction;

TEST(Exchange, AppliesOnce) {
    RecordingExchange exchange;

    EXPECT_TRUE(exchange.apply(ResponseAction::respond(std::string("ok"))));
    EXPECT_EQ(exchange.state(), ExchangeState::Completed);
    EXPECT_THROW(exchange.apply(ResponseAction::respond(std::string("again"))), ProtocolViolation);
    EXPECT_EQ(exchange.num_writes(), 1);
}

TEST(Exchange, DropsActionAfterAbort) {
    RecordingExchange exchange;
    int abort_counter = 0;
    exchange.onAbort([&abort_counter] { abort_counter++; });

    exchange.abort();
    exchange.abort();

    EXPECT_FALSE(exchange.apply(ResponseAction::render("index")));
    EXPECT_EQ(exchange.state(), ExchangeState::Aborted);
    EXPECT_EQ(exchange.num_writes(), 0);
    EXPECT_EQ(abort_counter, 1);
}

TEST(Exchange, AbortAfterCompletionIsIgnored) {
    RecordingExchange exchange;
    int abort_counter = 0;
    exchange.onAbort([&abort_counter] { abort_counter++; });

    exchange.apply(ResponseAction::render("index"));
    exchange.abort();

    EXPECT_EQ(exchange.state(), ExchangeState::Completed);
    EXPECT_EQ(abort_counter, 0);
}

TEST(Exchange, RunsAbortCallbackRegisteredAfterAbort) {
    RecordingExchange exchange;
    int abort_counter = 0;

    exchange.abort();
    exchange.onAbort([&abort_counter] { abort_counter++; });

    EXPECT_EQ(abort_counter, 1);
}

TEST(Exchange, BindsOnce) {
    RecordingExchange exchange;

    exchange.bind();
    EXPECT_THROW(exchange.bind(), ProtocolViolation);
}

TEST(ExchangeContext, HeadersAreCaseInsensitive) {
    ExchangeContext context("GET", "/books", {{"id", "42"}}, {{"Accept", "text/html"}});

    ASSERT_TRUE(context.header("accept").has_value());
    EXPECT_EQ(*context.header("ACCEPT"), "text/html");
    EXPECT_EQ(context.headers().count("accept"), 1);
    EXPECT_FALSE(context.header("cookie").has_value());
}

TEST(ExchangeContext, Params) {
    ExchangeContext context("GET", "/books", {{"id", "42"}});

    ASSERT_TRUE(context.param("id").has_value());
    EXPECT_EQ(*context.param("id"), "42");
    EXPECT_FALSE(context.param("page").has_value());
    EXPECT_EQ(context.method(), "GET");
    EXPECT_EQ(context.path(), "/books");
    EXPECT_TRUE(context.body().empty());
}

TEST(ResponseAction, Describe) {
    EXPECT_EQ(ResponseAction::render("index").describe(), "Render(index)");
    EXPECT_EQ(ResponseAction::respond(std::any(), 404).describe(), "Respond(404)");

    courier::Errors errors{{"title", "blank", "Title must not be blank"}};
    EXPECT_EQ(ResponseAction::respondErrors(errors, "edit").describe(), "RespondErrors(edit, 1 errors)");
}

TEST(ResponseAction, Kinds) {
    auto action = ResponseAction::respond(7, 201);

    ASSERT_EQ(action.kind(), courier::web::ActionKind::Respond);
    EXPECT_EQ(action.asRespond().status, 201);
    EXPECT_EQ(std::any_cast<int>(action.asRespond().payload), 7);
}
