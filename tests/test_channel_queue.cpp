// =============================================================================
// Unit tests for ChannelQueue (include/aircast/channel_queue.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "aircast/channel_queue.hpp"

#include <string>
#include <thread>

using namespace aircast;

TEST(ChannelQueueTest, FifoOrder) {
    ChannelQueue<int> q;
    for (int i = 0; i < 5; ++i) q.push(i);
    EXPECT_EQ(q.size(), 5u);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(q.pop(), i);
    EXPECT_EQ(q.size(), 0u);
}

TEST(ChannelQueueTest, TryPopOnEmpty) {
    ChannelQueue<std::string> q;
    EXPECT_FALSE(q.try_pop().has_value());
    q.push("x");
    auto v = q.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "x");
}

TEST(ChannelQueueTest, PopForTimesOut) {
    ChannelQueue<int> q;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop_for(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(ChannelQueueTest, PopWakesOnPushFromAnotherThread) {
    ChannelQueue<int> q;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.push(42);
    });
    EXPECT_EQ(q.pop(), 42);
    producer.join();
}
