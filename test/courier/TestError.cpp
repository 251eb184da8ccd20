//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "courier/Error.hpp"

using courier::AlreadyConsumed;
using courier::Error;
using courier::ErrorConversion;
using courier::Errors;
using courier::FieldError;
namespace category = courier::category;

TEST(Errors, KeepsInsertionOrder) {
    Errors errors;
    errors.reject("title", "blank", "Title must not be blank")
          .reject("isbn", "invalid", "ISBN is invalid")
          .reject("title", "size", "Title is too long");

    ASSERT_EQ(errors.size(), 3);
    EXPECT_TRUE(errors.hasErrors());
    EXPECT_TRUE(errors.hasFieldErrors("isbn"));
    EXPECT_FALSE(errors.hasFieldErrors("author"));

    auto titleErrors = errors.fieldErrors("title");
    ASSERT_EQ(titleErrors.size(), 2);
    EXPECT_EQ(titleErrors[0].code, "blank");
    EXPECT_EQ(titleErrors[1].code, "size");
    EXPECT_EQ(errors.all()[1].field, "isbn");
}

TEST(Errors, ComparesByContent) {
    Errors left{{"title", "blank", "Title must not be blank"}};
    Errors right;
    right.reject("title", "blank", "Title must not be blank");

    EXPECT_TRUE(left == right);
    EXPECT_FALSE(Errors().hasErrors());
}

TEST(Error, UpstreamHasNoParent) {
    auto error = Error::upstream("database unavailable");

    EXPECT_EQ(error.category(), category::UPSTREAM);
    EXPECT_TRUE(error.parentCategory().empty());
    EXPECT_TRUE(error.isA(category::UPSTREAM));
    EXPECT_FALSE(error.isA(category::VALIDATION));
    EXPECT_STREQ(error.what(), "database unavailable");
}

TEST(Error, UpstreamKeepsCause) {
    auto cause = std::make_exception_ptr(std::runtime_error("connection reset"));
    auto error = Error::upstream("fetch failed", cause);

    ASSERT_TRUE(error.cause() != nullptr);
    try {
        std::rethrow_exception(error.cause());
        FAIL() << "Expected the cause to be rethrown";
    } catch(std::runtime_error& rethrown) {
        EXPECT_STREQ(rethrown.what(), "connection reset");
    }
}

TEST(Error, ValidationIsAnUpstreamFailure) {
    Errors errors{{"title", "blank", "Title must not be blank"}};
    auto error = Error::validation(errors);

    EXPECT_EQ(error.category(), category::VALIDATION);
    EXPECT_EQ(error.parentCategory(), category::UPSTREAM);
    EXPECT_TRUE(error.isA(category::VALIDATION));
    EXPECT_TRUE(error.isA(category::UPSTREAM));
    EXPECT_TRUE(error.fieldErrors() == errors);
}

TEST(Error, TimeoutNamesTheDuration) {
    auto error = Error::timeout(250);

    EXPECT_EQ(error.category(), category::TIMEOUT);
    EXPECT_STREQ(error.what(), "No result produced within 250ms");
}

TEST(Error, CustomCategoryDefaultsToUpstreamParent) {
    Error error("payment", "card declined");

    EXPECT_TRUE(error.isA("payment"));
    EXPECT_TRUE(error.isA(category::UPSTREAM));
}

TEST(Error, CanBeThrownAndCaughtAsRuntimeError) {
    try {
        throw Error::emptyResult("no book");
    } catch(std::runtime_error& error) {
        EXPECT_STREQ(error.what(), "no book");
    }
}

TEST(AlreadyConsumed, IsALogicError) {
    AlreadyConsumed error;
    const std::logic_error& base = error;
    EXPECT_STREQ(base.what(), "Producer already consumed and cannot be subscribed again.");
}

TEST(Error, DefectHasNoParent) {
    auto error = Error::defect("bad any_cast");

    EXPECT_EQ(error.category(), category::DEFECT);
    EXPECT_TRUE(error.parentCategory().empty());
    EXPECT_FALSE(error.isA(category::UPSTREAM));
    EXPECT_STREQ(error.what(), "bad any_cast");
}

TEST(ErrorConversion, ForeignExceptionBecomesDefect) {
    std::optional<Error> converted;
    try {
        throw std::out_of_range("no such shelf");
    } catch(const std::exception& failure) {
        converted = ErrorConversion<Error>::convert(failure);
    }

    ASSERT_TRUE(converted.has_value());
    EXPECT_TRUE(converted->isA(category::DEFECT));
    EXPECT_STREQ(converted->what(), "no such shelf");
    ASSERT_TRUE(converted->cause() != nullptr);
    EXPECT_THROW(std::rethrow_exception(converted->cause()), std::out_of_range);
}

TEST(ErrorConversion, ErrorPassesThrough) {
    std::optional<Error> converted;
    try {
        throw Error::timeout(250);
    } catch(const std::exception& failure) {
        converted = ErrorConversion<Error>::convert(failure);
    }

    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(converted->category(), category::TIMEOUT);
}

TEST(ErrorConversion, MessageTypesAndOthers) {
    AlreadyConsumed consumed;

    auto message = ErrorConversion<std::string>::convert(consumed);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, "Producer already consumed and cannot be subscribed again.");

    EXPECT_FALSE(ErrorConversion<int>::convert(consumed).has_value());
}
