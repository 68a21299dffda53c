#include <gtest/gtest.h>

#include "events/EventChannel.hpp"

#include <stdexcept>

using sw::events::EventChannel;

TEST(EventChannelTest, DeliversToEverySubscriber) {
    EventChannel<int> channel("test");
    int a = 0, b = 0;
    channel.subscribe([&](const int v) { a += v; });
    channel.subscribe([&](const int v) { b += v * 2; });

    channel.publish(3);
    EXPECT_EQ(a, 3);
    EXPECT_EQ(b, 6);
    EXPECT_EQ(channel.subscriberCount(), 2u);
}

TEST(EventChannelTest, UnsubscribeStopsDelivery) {
    EventChannel<int> channel("test");
    int calls = 0;
    const auto token = channel.subscribe([&](int) { ++calls; });

    EXPECT_TRUE(channel.unsubscribe(token));
    EXPECT_FALSE(channel.unsubscribe(token));
    channel.publish(1);
    EXPECT_EQ(calls, 0);
}

TEST(EventChannelTest, ThrowingSubscriberDoesNotStopOthers) {
    EventChannel<int> channel("test");
    int calls = 0;
    channel.subscribe([](int) { throw std::runtime_error("boom"); });
    channel.subscribe([&](int) { ++calls; });

    EXPECT_NO_THROW(channel.publish(1));
    EXPECT_EQ(calls, 1);
}

TEST(EventChannelTest, HandlerMayUnsubscribeItself) {
    EventChannel<int> channel("test");
    int calls = 0;
    EventChannel<int>::Token token{};
    token = channel.subscribe([&](int) {
        ++calls;
        channel.unsubscribe(token);
    });

    channel.publish(1);
    channel.publish(2);
    EXPECT_EQ(calls, 1);
}
