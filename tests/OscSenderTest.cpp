#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "net/OscSender.hpp"

namespace {

core::FusedFrame frameWithContent(uint32_t index) {
    core::FusedFrame frame;
    frame.frameIndex = index;

    core::TrackedZone zone;
    zone.bodyPart = "left_wrist";
    zone.radius = 40.0f;
    frame.trackedZones.push_back(zone);

    core::CollisionEvent event;
    event.bodyPart = "left_wrist";
    event.targetId = "drum";
    event.timestampMs = 1234;
    frame.collisions.push_back(event);

    core::HandObservation hand;
    hand.handedness = core::Handedness{"Left", 0.9f};
    frame.hands.push_back(hand);
    return frame;
}

} // namespace

TEST(OscSenderTest, NewerFrameReplacesUnsentFrame) {
    net::OscSender sender("127.0.0.1", "57999");
    EXPECT_FALSE(sender.hasPending());
    for (uint32_t i = 0; i < 10; ++i) {
        sender.consume(frameWithContent(i));
    }

    EXPECT_TRUE(sender.hasPending());
    EXPECT_EQ(sender.droppedFrames(), 9u);
    EXPECT_EQ(sender.sentFrames(), 0u);
    EXPECT_FALSE(sender.isRunning());
}

TEST(OscSenderTest, StaleFrameIsDiscarded) {
    net::OscSender sender("127.0.0.1", "57999", std::chrono::milliseconds(1));
    sender.consume(frameWithContent(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    ASSERT_TRUE(sender.start());
    for (int i = 0; i < 200 && sender.hasPending(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sender.stop();

    EXPECT_EQ(sender.sentFrames(), 0u);
    EXPECT_EQ(sender.droppedFrames(), 1u);
}

TEST(OscSenderTest, SendsFramesOnceStarted) {
    net::OscSender sender("127.0.0.1", "57999", std::chrono::milliseconds(1000));
    ASSERT_TRUE(sender.start());
    EXPECT_TRUE(sender.isRunning());

    for (uint32_t i = 0; i < 5; ++i) {
        sender.consume(frameWithContent(i));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    for (int i = 0; i < 200 && sender.hasPending(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sender.stop();

    EXPECT_FALSE(sender.hasPending());
    EXPECT_EQ(sender.sentFrames() + sender.droppedFrames(), 5u);
    EXPECT_FALSE(sender.isRunning());
}
