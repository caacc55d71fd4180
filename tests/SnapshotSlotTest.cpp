#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "core/SnapshotSlot.hpp"

using core::SnapshotSlot;

TEST(SnapshotSlotTest, TakeOnEmptySlotTimesOut) {
    SnapshotSlot<int> slot;
    EXPECT_FALSE(slot.take(std::chrono::milliseconds(1)).has_value());
}

TEST(SnapshotSlotTest, KeepsOnlyNewestValue) {
    SnapshotSlot<int> slot;
    EXPECT_FALSE(slot.publish(1));
    EXPECT_TRUE(slot.publish(2));
    EXPECT_TRUE(slot.publish(3));

    auto value = slot.take(std::chrono::milliseconds(0));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 3);
    EXPECT_FALSE(slot.hasValue());
    EXPECT_FALSE(slot.publish(4));
}

TEST(SnapshotSlotTest, WakesWaitingConsumer) {
    SnapshotSlot<int> slot;
    std::thread producer([&slot] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        slot.publish(42);
    });

    auto value = slot.take(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}
