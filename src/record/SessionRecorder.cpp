#include "record/SessionRecorder.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace record {

namespace {

std::string isoTimestamp(int64_t unixMs) {
    std::time_t seconds = static_cast<std::time_t>(unixMs / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << (unixMs % 1000) << "Z";
    return ss.str();
}

int64_t unixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* toString(RecordingStatus status) {
    switch (status) {
        case RecordingStatus::Started:          return "started";
        case RecordingStatus::MissingAction:    return "no action selected";
        case RecordingStatus::NotStreaming:     return "camera not streaming";
        case RecordingStatus::AlreadyRecording: return "already recording";
    }
    return "unknown";
}

SessionRecorder::SessionRecorder(core::RecorderConfig config, DeviceInfo device)
    : config_(std::move(config)), device_(std::move(device)) {
}

RecordingStatus SessionRecorder::start(const std::string& actionLabel, bool streaming, double nowMs) {
    if (recording_) {
        core::Logger::warn("SessionRecorder: Start ignored, ", toString(RecordingStatus::AlreadyRecording));
        return RecordingStatus::AlreadyRecording;
    }
    if (actionLabel.empty()) {
        core::Logger::warn("SessionRecorder: Please select an action before recording");
        return RecordingStatus::MissingAction;
    }
    if (!streaming) {
        core::Logger::warn("SessionRecorder: Start the camera before recording");
        return RecordingStatus::NotStreaming;
    }

    frames_.clear();
    frames_.reserve(static_cast<size_t>(config_.maxDurationSec * 60.0));
    actionLabel_ = actionLabel;
    startMs_ = nowMs;
    ticks_ = 0;
    startUnixMs_ = unixMillis();
    recording_ = true;

    core::Logger::info("SessionRecorder: Recording '", actionLabel_, "' for ",
                       config_.maxDurationSec, "s");
    return RecordingStatus::Started;
}

void SessionRecorder::recordFrame(const core::FusedFrame& frame) {
    if (!recording_) return;

    FrameRecord record;
    record.timestampMs = frame.timestampMs;
    record.frameIndex = static_cast<uint32_t>(frames_.size());
    record.pose2d = frame.rawKeypoints;

    record.hands2d.reserve(frame.hands.size());
    record.hands3d.reserve(frame.hands.size());
    record.handedness.reserve(frame.hands.size());
    for (const auto& hand : frame.hands) {
        record.hands2d.emplace_back(hand.landmarks.begin(), hand.landmarks.end());
        record.hands3d.push_back(hand.worldLandmarks);
        record.handedness.push_back(hand.handedness);
    }

    frames_.push_back(std::move(record));
}

double SessionRecorder::elapsedSec() const {
    return static_cast<double>(ticks_) * config_.tickMs / 1000.0;
}

std::optional<SessionArtifacts> SessionRecorder::tick(double nowMs) {
    if (!recording_) return std::nullopt;

    // Never stop before the full duration when it is not a whole number of ticks
    const double exactTicks = config_.maxDurationSec * 1000.0 / config_.tickMs;
    const auto maxTicks = static_cast<uint64_t>(std::ceil(exactTicks - 1e-9));

    while (nowMs - startMs_ >= static_cast<double>(ticks_ + 1) * config_.tickMs) {
        ++ticks_;
        if (ticks_ >= maxTicks) {
            core::Logger::info("SessionRecorder: Reached ", elapsedSec(), "s, stopping");
            return stop();
        }
    }
    return std::nullopt;
}

std::optional<SessionArtifacts> SessionRecorder::stop() {
    if (!recording_) return std::nullopt;
    recording_ = false;

    std::optional<SessionArtifacts> artifacts;
    if (frames_.empty()) {
        core::Logger::info("SessionRecorder: Stopped with no frames, nothing to save");
    } else {
        artifacts = serialize();
    }

    frames_.clear();
    frames_.shrink_to_fit();
    return artifacts;
}

std::optional<SessionArtifacts> SessionRecorder::serialize() {
    SessionArtifacts artifacts;
    auto& meta = artifacts.metadata;

    meta.sessionId = "session_" + std::to_string(startUnixMs_);
    meta.timestampIso = isoTimestamp(startUnixMs_);
    meta.durationSec = elapsedSec();
    meta.frameCount = static_cast<uint32_t>(frames_.size());
    if (meta.durationSec > 0.0) {
        meta.fps = meta.frameCount / meta.durationSec;
    } else {
        // Stopped before the first tick, a rate is undefined
        core::Logger::warn("SessionRecorder: Zero duration, reporting fps as 0");
        meta.fps = 0.0;
    }
    meta.actionLabel = actionLabel_;
    meta.device = device_;
    meta.schemaVersion = config_.schemaVersion;

    meta.handCounts.reserve(frames_.size());
    for (const auto& frame : frames_) {
        meta.handCounts.push_back(encodedHandCount(frame));
    }

    try {
        EncodeOptions options;
        options.inlineHandCount = config_.inlineHandCount;
        artifacts.data = encodeSession(frames_, options);
        artifacts.metadataJson = toJson(meta).dump(2);
    } catch (const std::exception& e) {
        core::Logger::error("SessionRecorder: Failed to serialize ", meta.sessionId, ": ", e.what());
        return std::nullopt;
    }

    core::Logger::info("SessionRecorder: ", meta.sessionId, " ", meta.frameCount, " frames, ",
                       meta.durationSec, "s, ", meta.fps, " fps, ", artifacts.data.size(), " bytes");
    return artifacts;
}

bool SessionRecorder::save(const SessionArtifacts& artifacts, const std::string& directory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        core::Logger::error("SessionRecorder: Cannot create ", directory, ": ", ec.message());
        return false;
    }

    fs::path dataPath = fs::path(directory) / artifacts.dataFileName();
    fs::path metaPath = fs::path(directory) / artifacts.metadataFileName();

    std::ofstream data(dataPath, std::ios::binary | std::ios::trunc);
    data.write(reinterpret_cast<const char*>(artifacts.data.data()),
               static_cast<std::streamsize>(artifacts.data.size()));
    data.close();
    if (!data) {
        core::Logger::error("SessionRecorder: Failed to write ", dataPath.string());
        return false;
    }

    std::ofstream meta(metaPath, std::ios::trunc);
    meta << artifacts.metadataJson << '\n';
    meta.close();
    if (!meta) {
        core::Logger::error("SessionRecorder: Failed to write ", metaPath.string());
        return false;
    }

    core::Logger::info("SessionRecorder: Saved ", dataPath.string(), " and ", metaPath.string());
    return true;
}

} // namespace record
