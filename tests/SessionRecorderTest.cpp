#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "record/SessionRecorder.hpp"

using namespace record;

namespace {

DeviceInfo testDevice() {
    return DeviceInfo{"PoseFusion/test", "Linux x86_64", "C"};
}

core::FusedFrame poseFrame(double ts, size_t hands = 0) {
    core::FusedFrame frame;
    frame.timestampMs = ts;
    for (size_t i = 0; i < core::BODY_KEYPOINT_COUNT; ++i) {
        core::Keypoint2D kp;
        kp.name = core::BODY_KEYPOINT_NAMES[i];
        kp.x = static_cast<float>(i);
        kp.y = static_cast<float>(ts);
        kp.score = 0.8f;
        frame.rawKeypoints.push_back(kp);
    }
    for (size_t h = 0; h < hands; ++h) {
        core::HandObservation hand;
        hand.landmarks[0] = {0.25f, 0.5f, 0.0f};
        hand.handedness = core::Handedness{"Right", 0.95f};
        frame.hands.push_back(hand);
    }
    return frame;
}

class SessionRecorderTest : public ::testing::Test {
protected:
    SessionRecorder recorder{core::RecorderConfig{}, testDevice()};
};

} // namespace

TEST_F(SessionRecorderTest, StartRequiresActionLabel) {
    EXPECT_EQ(recorder.start("", true, 0.0), RecordingStatus::MissingAction);
    EXPECT_FALSE(recorder.isRecording());

    recorder.recordFrame(poseFrame(0.0));
    EXPECT_EQ(recorder.frameCount(), 0u);
    EXPECT_FALSE(recorder.tick(20000.0).has_value());
}

TEST_F(SessionRecorderTest, StartRequiresStreaming) {
    EXPECT_EQ(recorder.start("wave", false, 0.0), RecordingStatus::NotStreaming);
    EXPECT_FALSE(recorder.isRecording());
}

TEST_F(SessionRecorderTest, SecondStartIsRejected) {
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    EXPECT_EQ(recorder.start("jump", true, 10.0), RecordingStatus::AlreadyRecording);
    EXPECT_EQ(recorder.actionLabel(), "wave");
}

TEST_F(SessionRecorderTest, AutoStopsAtTenSecondsAtThirtyFps) {
    const double start = 1000.0;
    ASSERT_EQ(recorder.start("wave", true, start), RecordingStatus::Started);

    std::optional<SessionArtifacts> artifacts;
    for (int i = 0; i < 400 && !artifacts; ++i) {
        double now = start + i * 1000.0 / 30.0;
        artifacts = recorder.tick(now);
        if (!artifacts) {
            recorder.recordFrame(poseFrame(now));
        }
    }

    ASSERT_TRUE(artifacts.has_value());
    EXPECT_FALSE(recorder.isRecording());
    EXPECT_EQ(recorder.frameCount(), 0u);

    const auto& meta = artifacts->metadata;
    EXPECT_EQ(meta.frameCount, 300u);
    EXPECT_DOUBLE_EQ(meta.durationSec, 10.0);
    EXPECT_NEAR(meta.fps, 30.0, 1e-9);
    ASSERT_TRUE(meta.actionLabel.has_value());
    EXPECT_EQ(*meta.actionLabel, "wave");
    EXPECT_EQ(meta.schemaVersion, "1.0");
    EXPECT_EQ(meta.device.userAgent, "PoseFusion/test");
    EXPECT_EQ(meta.handCounts, std::vector<uint32_t>(300, 0));

    EXPECT_EQ(meta.sessionId.rfind("session_", 0), 0u);
    ASSERT_EQ(meta.timestampIso.size(), 24u);
    EXPECT_EQ(meta.timestampIso[10], 'T');
    EXPECT_EQ(meta.timestampIso.back(), 'Z');

    EXPECT_EQ(artifacts->data.size(), 4u + 300 * (8 + 4 + POSE_BYTES_PER_FRAME));
    auto frames = decodeSession(artifacts->data, meta.handCounts);
    ASSERT_EQ(frames.size(), 300u);
    for (uint32_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].frameIndex, i);
    }
    EXPECT_DOUBLE_EQ(frames[0].timestampMs, start);

    auto json = nlohmann::json::parse(artifacts->metadataJson);
    EXPECT_EQ(json["frameCount"], 300);
    EXPECT_EQ(json["action"], "wave");
}

TEST_F(SessionRecorderTest, ElapsedAdvancesInWholeTicks) {
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    EXPECT_FALSE(recorder.tick(99.0).has_value());
    EXPECT_DOUBLE_EQ(recorder.elapsedSec(), 0.0);

    // A late tick catches up on every interval it missed
    EXPECT_FALSE(recorder.tick(350.0).has_value());
    EXPECT_DOUBLE_EQ(recorder.elapsedSec(), 0.3);
}

TEST(SessionRecorderTickTest, UnevenTickRunsFullDuration) {
    core::RecorderConfig config;
    config.tickMs = 30.0;
    config.maxDurationSec = 10.0;
    SessionRecorder recorder(config, testDevice());
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    recorder.recordFrame(poseFrame(0.0));

    // 333 ticks is only 9.99 s
    EXPECT_FALSE(recorder.tick(9990.0).has_value());
    EXPECT_TRUE(recorder.isRecording());

    auto artifacts = recorder.tick(10020.0);
    ASSERT_TRUE(artifacts.has_value());
    EXPECT_FALSE(recorder.isRecording());
    EXPECT_GE(artifacts->metadata.durationSec, 10.0);
}

TEST(SessionRecorderTickTest, FractionalDurationDoesNotOvershoot) {
    core::RecorderConfig config;
    config.maxDurationSec = 0.3;
    SessionRecorder recorder(config, testDevice());
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    recorder.recordFrame(poseFrame(0.0));

    EXPECT_FALSE(recorder.tick(299.0).has_value());
    EXPECT_TRUE(recorder.tick(300.0).has_value());
}

TEST_F(SessionRecorderTest, ManualStopSerializesCapturedFrames) {
    ASSERT_EQ(recorder.start("clap", true, 0.0), RecordingStatus::Started);
    for (int i = 0; i <= 25; ++i) {
        double now = i * 100.0;
        ASSERT_FALSE(recorder.tick(now).has_value());
        recorder.recordFrame(poseFrame(now, i % 2));
    }

    auto artifacts = recorder.stop();
    ASSERT_TRUE(artifacts.has_value());
    EXPECT_EQ(artifacts->metadata.frameCount, 26u);
    EXPECT_DOUBLE_EQ(artifacts->metadata.durationSec, 2.5);
    EXPECT_NEAR(artifacts->metadata.fps, 26 / 2.5, 1e-9);
    EXPECT_EQ(artifacts->metadata.handCounts[0], 0u);
    EXPECT_EQ(artifacts->metadata.handCounts[1], 1u);

    auto frames = decodeSession(artifacts->data, artifacts->metadata.handCounts);
    ASSERT_EQ(frames.size(), 26u);
    ASSERT_EQ(frames[1].hands2d.size(), 1u);
    EXPECT_FLOAT_EQ(frames[1].hands2d[0][0].x, 0.25f);

    EXPECT_FALSE(recorder.stop().has_value());
}

TEST_F(SessionRecorderTest, EmptyStopIsNoOp) {
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    EXPECT_FALSE(recorder.stop().has_value());
    EXPECT_FALSE(recorder.isRecording());
}

TEST_F(SessionRecorderTest, ZeroDurationReportsZeroFps) {
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    recorder.recordFrame(poseFrame(0.0));
    recorder.recordFrame(poseFrame(16.0));

    auto artifacts = recorder.stop();
    ASSERT_TRUE(artifacts.has_value());
    EXPECT_EQ(artifacts->metadata.frameCount, 2u);
    EXPECT_DOUBLE_EQ(artifacts->metadata.durationSec, 0.0);
    EXPECT_DOUBLE_EQ(artifacts->metadata.fps, 0.0);
}

TEST(SessionRecorderSchemaTest, InlineHandCountWritesSchema11) {
    core::RecorderConfig config;
    config.inlineHandCount = true;
    config.schemaVersion = "1.1";
    SessionRecorder recorder(config, testDevice());

    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    recorder.recordFrame(poseFrame(0.0, 2));
    recorder.tick(100.0);

    auto artifacts = recorder.stop();
    ASSERT_TRUE(artifacts.has_value());
    EXPECT_EQ(artifacts->metadata.schemaVersion, "1.1");

    auto frames = decodeSession(artifacts->data, {}, true);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].hands2d.size(), 2u);
}

TEST(SessionRecorderSaveTest, WritesBothArtifacts) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(::testing::TempDir()) / "posefusion_recorder_save";
    fs::remove_all(dir);

    SessionRecorder recorder(core::RecorderConfig{}, testDevice());
    ASSERT_EQ(recorder.start("wave", true, 0.0), RecordingStatus::Started);
    recorder.recordFrame(poseFrame(0.0));
    recorder.tick(500.0);
    auto artifacts = recorder.stop();
    ASSERT_TRUE(artifacts.has_value());

    ASSERT_TRUE(SessionRecorder::save(*artifacts, dir.string()));

    fs::path dataPath = dir / (artifacts->metadata.sessionId + "_data.bin");
    fs::path metaPath = dir / (artifacts->metadata.sessionId + "_meta.json");
    ASSERT_TRUE(fs::exists(dataPath));
    ASSERT_TRUE(fs::exists(metaPath));
    EXPECT_EQ(fs::file_size(dataPath), artifacts->data.size());

    std::ifstream in(metaPath);
    auto json = nlohmann::json::parse(in);
    EXPECT_EQ(json["sessionId"], artifacts->metadata.sessionId);
    EXPECT_DOUBLE_EQ(json["duration"].get<double>(), 0.5);

    fs::remove_all(dir);
}

TEST(SessionRecorderSaveTest, ReportsUnwritableDirectory) {
    namespace fs = std::filesystem;
    fs::path blocker = fs::path(::testing::TempDir()) / "posefusion_not_a_dir";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    SessionArtifacts artifacts;
    artifacts.metadata.sessionId = "session_1";
    EXPECT_FALSE(SessionRecorder::save(artifacts, (blocker / "sub").string()));

    fs::remove(blocker);
}
