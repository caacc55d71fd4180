#pragma once

#include "record/SessionCodec.hpp"
#include "core/Config.hpp"
#include "core/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace record {

enum class RecordingStatus {
    Started,
    MissingAction,     // No action label selected
    NotStreaming,      // Pipeline is not delivering frames
    AlreadyRecording
};

[[nodiscard]] const char* toString(RecordingStatus status);

/**
 * Serialized session, ready to be written out.
 */
struct SessionArtifacts {
    SessionMetadata metadata;
    std::vector<uint8_t> data;
    std::string metadataJson;

    [[nodiscard]] std::string dataFileName() const { return metadata.sessionId + "_data.bin"; }
    [[nodiscard]] std::string metadataFileName() const { return metadata.sessionId + "_meta.json"; }
};

/**
 * Fixed-duration capture of fused frames.
 *
 * The elapsed time advances in whole ticks (100 ms by default) driven by tick();
 * once it reaches the maximum duration the session stops itself and is serialized.
 * All calls come from the pipeline loop thread.
 */
class SessionRecorder {
public:
    explicit SessionRecorder(core::RecorderConfig config = core::RecorderConfig{},
                             DeviceInfo device = DeviceInfo::current());

    /**
     * Begin a session. Clears the frame buffer and starts the tick timer.
     * @param actionLabel Label of the performed action, must be non-empty
     * @param streaming Whether the pipeline is currently streaming
     * @param nowMs Monotonic time the timer starts from
     */
    RecordingStatus start(const std::string& actionLabel, bool streaming, double nowMs);

    /**
     * Append a fused frame. Ignored when not recording. Frames without hands are fine.
     */
    void recordFrame(const core::FusedFrame& frame);

    /**
     * Advance the timer to nowMs.
     * @return Artifacts if this tick reached the maximum duration and frames were captured
     */
    std::optional<SessionArtifacts> tick(double nowMs);

    /**
     * Stop and serialize. Returns nullopt if nothing was recorded, recording was not
     * active or serialization failed. The buffer is discarded in every case.
     */
    std::optional<SessionArtifacts> stop();

    /**
     * Write both artifacts into a directory. Returns false (and logs) on failure.
     */
    static bool save(const SessionArtifacts& artifacts, const std::string& directory);

    [[nodiscard]] bool isRecording() const { return recording_; }
    [[nodiscard]] double elapsedSec() const;
    [[nodiscard]] size_t frameCount() const { return frames_.size(); }
    [[nodiscard]] const std::string& actionLabel() const { return actionLabel_; }
    [[nodiscard]] const core::RecorderConfig& config() const { return config_; }

private:
    std::optional<SessionArtifacts> serialize();

    core::RecorderConfig config_;
    DeviceInfo device_;

    bool recording_ = false;
    std::string actionLabel_;
    double startMs_ = 0.0;
    uint64_t ticks_ = 0;
    int64_t startUnixMs_ = 0;

    std::vector<FrameRecord> frames_;
};

} // namespace record
