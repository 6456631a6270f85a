#include <gtest/gtest.h>
#include "../core/BoundedChannel.hpp"
#include <atomic>
#include <thread>

using namespace datalogger;
using namespace std::chrono_literals;

TEST(BoundedChannelTest, PreservesOrder) {
    BoundedChannel<int> channel(4);
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    EXPECT_TRUE(channel.push(3));

    EXPECT_EQ(*channel.tryPop(), 1);
    EXPECT_EQ(*channel.pop(10ms), 2);
    EXPECT_EQ(*channel.tryPop(), 3);
    EXPECT_FALSE(channel.tryPop().has_value());
}

TEST(BoundedChannelTest, TryPushRefusedWhenFull) {
    BoundedChannel<int> channel(2);
    EXPECT_TRUE(channel.tryPush(1));
    EXPECT_TRUE(channel.tryPush(2));
    EXPECT_FALSE(channel.tryPush(3));
    EXPECT_EQ(channel.size(), 2u);
}

TEST(BoundedChannelTest, PushBlocksUntilSpace) {
    BoundedChannel<int> channel(1);
    channel.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        channel.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed);

    EXPECT_EQ(*channel.tryPop(), 1);
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(*channel.tryPop(), 2);
}

TEST(BoundedChannelTest, CloseReleasesBlockedProducer) {
    BoundedChannel<int> channel(1);
    channel.push(1);

    std::atomic<bool> result{true};
    std::thread producer([&] { result = channel.push(2); });

    std::this_thread::sleep_for(20ms);
    channel.close();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_TRUE(channel.closed());

    // Buffered items survive close and can be drained
    auto rest = channel.drain();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0], 1);
}

TEST(BoundedChannelTest, PopTimesOutWhenEmpty) {
    BoundedChannel<int> channel(1);
    EXPECT_FALSE(channel.pop(10ms).has_value());
}

TEST(BoundedChannelTest, ReopenAcceptsAgain) {
    BoundedChannel<int> channel(1);
    channel.close();
    EXPECT_FALSE(channel.push(1));

    channel.reopen();
    EXPECT_TRUE(channel.push(1));
}
