//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "courier/CompositeCancelable.hpp"

using courier::Cancelable;
using courier::CompositeCancelable;

namespace {

class CountingCancelable final : public Cancelable {
public:
    int cancels = 0;
    void cancel() override { cancels++; }
    void onCancel(const std::function<void()>&) override {}
    void onShutdown(const std::function<void()>&) override {}
};

} // namespace

TEST(CompositeCancelable, CancelsAllChildren) {
    auto composite = std::make_shared<CompositeCancelable>();
    auto first = std::make_shared<CountingCancelable>();
    auto second = std::make_shared<CountingCancelable>();

    composite->add(first);
    composite->add(second);
    composite->cancel();
    composite->cancel();

    EXPECT_TRUE(composite->isCanceled());
    EXPECT_EQ(first->cancels, 1);
    EXPECT_EQ(second->cancels, 1);
}

TEST(CompositeCancelable, CancelsChildAddedAfterCancel) {
    auto composite = std::make_shared<CompositeCancelable>();
    auto child = std::make_shared<CountingCancelable>();

    composite->cancel();
    composite->add(child);

    EXPECT_EQ(child->cancels, 1);
}

TEST(CompositeCancelable, ShutdownReleasesChildrenWithoutCanceling) {
    auto composite = std::make_shared<CompositeCancelable>();
    auto child = std::make_shared<CountingCancelable>();
    int shutdown_counter = 0;
    int cancel_counter = 0;

    composite->onShutdown([&shutdown_counter] { shutdown_counter++; });
    composite->onCancel([&cancel_counter] { cancel_counter++; });
    composite->add(child);

    composite->shutdown();
    composite->cancel();

    EXPECT_FALSE(composite->isCanceled());
    EXPECT_EQ(child->cancels, 0);
    EXPECT_EQ(child.use_count(), 1);
    EXPECT_EQ(shutdown_counter, 1);
    EXPECT_EQ(cancel_counter, 0);
}

TEST(CompositeCancelable, RunsCancelCallbackRegisteredAfterCancel) {
    auto composite = std::make_shared<CompositeCancelable>();
    int cancel_counter = 0;

    composite->cancel();
    composite->onCancel([&cancel_counter] { cancel_counter++; });

    EXPECT_EQ(cancel_counter, 1);
}
