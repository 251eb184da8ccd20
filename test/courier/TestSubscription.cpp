//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "gtest/trompeloeil.hpp"
#include "courier/Subscription.hpp"

using courier::Observer;
using courier::Subscription;
using courier::SubscriptionState;
using courier::Termination;
using trompeloeil::_;

class MockSubscriptionDownstreamObserver : public trompeloeil::mock_interface<Observer<int,std::string>> {
public:
    IMPLEMENT_MOCK1(onSuccess);
    IMPLEMENT_MOCK0(onEmpty);
    IMPLEMENT_MOCK1(onError);
};

class CountingCancelable final : public courier::Cancelable {
public:
    int cancels = 0;
    void cancel() override { cancels++; }
    void onCancel(const std::function<void()>&) override {}
    void onShutdown(const std::function<void()>&) override {}
};

TEST(Subscription, StartsPending) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);

    EXPECT_EQ(subscription->state(), SubscriptionState::Pending);
    EXPECT_FALSE(subscription->termination().has_value());
}

TEST(Subscription, DropsEventsWhilePending) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    FORBID_CALL(*downstream, onSuccess(_));

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->onSuccess(123);

    EXPECT_EQ(subscription->state(), SubscriptionState::Pending);
}

TEST(Subscription, DeliversSuccessOnce) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    REQUIRE_CALL(*downstream, onSuccess(123));

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->onSuccess(123);
    subscription->onSuccess(456);
    subscription->onEmpty();
    subscription->onError("late");

    EXPECT_EQ(subscription->state(), SubscriptionState::Terminated);
    ASSERT_TRUE(subscription->termination().has_value());
    EXPECT_EQ(*subscription->termination(), Termination::Value);
}

TEST(Subscription, DeliversEmptyOnce) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    REQUIRE_CALL(*downstream, onEmpty());

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->onEmpty();
    subscription->onEmpty();

    ASSERT_TRUE(subscription->termination().has_value());
    EXPECT_EQ(*subscription->termination(), Termination::Empty);
}

TEST(Subscription, DeliversErrorOnce) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    REQUIRE_CALL(*downstream, onError("broke"));

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->onError("broke");
    subscription->onSuccess(123);

    ASSERT_TRUE(subscription->termination().has_value());
    EXPECT_EQ(*subscription->termination(), Termination::Failure);
}

TEST(Subscription, DropsLateEventsAfterCancel) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    FORBID_CALL(*downstream, onSuccess(_));
    FORBID_CALL(*downstream, onEmpty());
    FORBID_CALL(*downstream, onError(_));

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->cancel();
    subscription->onSuccess(123);
    subscription->onEmpty();
    subscription->onError("late");

    EXPECT_EQ(subscription->state(), SubscriptionState::Canceled);
    EXPECT_FALSE(subscription->termination().has_value());
}

TEST(Subscription, CancelReachesUpstreamOnce) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    auto upstream = std::make_shared<CountingCancelable>();
    int cancel_counter = 0;

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->attach(upstream);
    subscription->onCancel([&cancel_counter] { cancel_counter++; });

    subscription->cancel();
    subscription->cancel();

    EXPECT_EQ(upstream->cancels, 1);
    EXPECT_EQ(cancel_counter, 1);
}

TEST(Subscription, CancelsHandleAttachedAfterCancel) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    auto upstream = std::make_shared<CountingCancelable>();

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->cancel();
    subscription->attach(upstream);

    EXPECT_EQ(upstream->cancels, 1);
}

TEST(Subscription, CancelAfterTerminationIsIgnored) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    REQUIRE_CALL(*downstream, onSuccess(123));

    auto upstream = std::make_shared<CountingCancelable>();
    int cancel_counter = 0;
    int shutdown_counter = 0;

    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->attach(upstream);
    subscription->onCancel([&cancel_counter] { cancel_counter++; });
    subscription->onShutdown([&shutdown_counter] { shutdown_counter++; });

    subscription->onSuccess(123);
    subscription->cancel();

    EXPECT_EQ(subscription->state(), SubscriptionState::Terminated);
    EXPECT_EQ(upstream->cancels, 0);
    EXPECT_EQ(cancel_counter, 0);
    EXPECT_EQ(shutdown_counter, 1);
}

TEST(Subscription, ShutdownCallbackRunsImmediatelyWhenTerminated) {
    auto downstream = std::make_shared<MockSubscriptionDownstreamObserver>();
    REQUIRE_CALL(*downstream, onEmpty());

    int shutdown_counter = 0;
    auto subscription = std::make_shared<Subscription<int,std::string>>(downstream);
    subscription->activate();
    subscription->onEmpty();
    subscription->onShutdown([&shutdown_counter] { shutdown_counter++; });

    EXPECT_EQ(shutdown_counter, 1);
}
