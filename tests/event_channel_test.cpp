#include <gtest/gtest.h>
#include "subscout/pipeline/event_channel.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace subscout;
using namespace subscout::pipeline;

namespace {

common::SearchEvent countEvent(size_t count) {
    common::SearchEvent event;
    event.stage = common::EventStage::CRT_SH_FOUND;
    event.count = count;
    return event;
}

}

TEST(EventChannelTest, DeliversInOrderThenEndsAfterClose) {
    EventChannel channel(8);
    channel.push(countEvent(1));
    channel.push(countEvent(2));
    channel.close();

    common::SearchEvent event;
    ASSERT_TRUE(channel.pop(event));
    EXPECT_EQ(event.count, 1u);
    ASSERT_TRUE(channel.pop(event));
    EXPECT_EQ(event.count, 2u);
    EXPECT_FALSE(channel.pop(event));
    EXPECT_TRUE(channel.isClosed());
}

TEST(EventChannelTest, ProducerBlocksWhileFull) {
    EventChannel channel(1);
    channel.push(countEvent(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        channel.push(countEvent(2));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    common::SearchEvent event;
    ASSERT_TRUE(channel.pop(event));
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(channel.size(), 1u);
}

TEST(EventChannelTest, AbandonReleasesProducerAndDropsEvents) {
    EventChannel channel(1);
    channel.push(countEvent(1));

    std::thread producer([&]() {
        for (size_t i = 0; i < 10; ++i) {
            channel.push(countEvent(i));
        }
    });

    channel.abandon();
    producer.join();

    EXPECT_TRUE(channel.isAbandoned());
    EXPECT_EQ(channel.size(), 0u);

    common::SearchEvent event;
    EXPECT_FALSE(channel.pop(event));
}

TEST(EventChannelTest, ConsumerWakesOnClose) {
    EventChannel channel(4);

    std::thread closer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
    });

    common::SearchEvent event;
    EXPECT_FALSE(channel.pop(event));
    closer.join();
}
