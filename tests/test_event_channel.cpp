#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "event_channel.hpp"


TEST(EventChannel, DeliversToEverySubscriber) {
    EventChannel<int> channel;
    std::vector<int> a;
    std::vector<int> b;
    auto unsubscribe_a = channel.subscribe([&](const int& v) { a.push_back(v); });
    auto unsubscribe_b = channel.subscribe([&](const int& v) { b.push_back(v * 10); });

    channel.publish(1);
    channel.publish(2);

    EXPECT_EQ(a, (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(b, (std::vector<int>{ 10, 20 }));
    EXPECT_EQ(channel.subscriber_count(), 2u);
    unsubscribe_a();
    unsubscribe_b();
}

TEST(EventChannel, UnsubscribeStopsDeliveryAndIsIdempotent) {
    EventChannel<int> channel;
    int count = 0;
    auto unsubscribe = channel.subscribe([&](const int&) { count++; });

    channel.publish(1);
    unsubscribe();
    unsubscribe();
    channel.publish(2);

    EXPECT_EQ(count, 1);
    EXPECT_EQ(channel.subscriber_count(), 0u);
}

TEST(EventChannel, CallbackMayUnsubscribeItself) {
    EventChannel<int> channel;
    int count = 0;
    Unsubscribe unsubscribe;
    unsubscribe = channel.subscribe([&](const int&) {
        count++;
        unsubscribe();
    });

    channel.publish(1);
    channel.publish(2);
    EXPECT_EQ(count, 1);
}

TEST(EventChannel, UnsubscribeOutlivesTheChannel) {
    Unsubscribe unsubscribe;
    {
        EventChannel<int> channel;
        unsubscribe = channel.subscribe([](const int&) {});
    }
    unsubscribe(); // no-op, must not crash
    SUCCEED();
}
