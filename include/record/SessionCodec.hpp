#pragma once

#include "core/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace record {

/**
 * One captured frame of a recording session.
 */
struct FrameRecord {
    double timestampMs = 0.0;
    uint32_t frameIndex = 0;

    // Pose backend output in source pixels (17 keypoints, backend order)
    std::vector<core::Keypoint2D> pose2d;

    // Per hand: normalized image landmarks and metric world landmarks (may be empty)
    std::vector<std::vector<core::Keypoint3D>> hands2d;
    std::vector<std::vector<core::Keypoint3D>> hands3d;

    std::vector<std::optional<core::Handedness>> handedness;
};

struct DeviceInfo {
    std::string userAgent;
    std::string platform;
    std::string language;

    /**
     * Describe the running host (build version, OS, locale).
     */
    static DeviceInfo current();
};

struct SessionMetadata {
    std::string sessionId;
    std::string timestampIso;
    double durationSec = 0.0;
    uint32_t frameCount = 0;
    double fps = 0.0;
    std::optional<std::string> actionLabel;
    DeviceInfo device;
    std::string schemaVersion = "1.0";

    // Hands written per frame, lets a reader delimit 1.0 frames
    std::vector<uint32_t> handCounts;
};

/**
 * Binary layout, little-endian:
 *   uint32 frameCount
 *   per frame:
 *     float64 timestampMs
 *     uint32  frameIndex
 *     [uint8  handCount]            schema 1.1 only
 *     17 x float32 (x, y, score)
 *     handCount x 21 x float32 (x, y, z)
 *
 * Schema 1.0 has no inline hand count; readers need the counts out-of-band
 * (SessionMetadata::handCounts).
 */
struct EncodeOptions {
    bool inlineHandCount = false;
};

constexpr size_t POSE_BYTES_PER_FRAME = core::BODY_KEYPOINT_COUNT * 3 * sizeof(float);
constexpr size_t HAND_BYTES = core::HAND_LANDMARK_COUNT * 3 * sizeof(float);

/**
 * Number of hands a frame contributes to the binary payload (at most MAX_HANDS).
 */
[[nodiscard]] uint32_t encodedHandCount(const FrameRecord& frame);

/**
 * Serialize frames. The buffer is sized with an upper bound first and
 * truncated to the bytes actually written.
 */
[[nodiscard]] std::vector<uint8_t> encodeSession(const std::vector<FrameRecord>& frames,
                                                 const EncodeOptions& options = {});

/**
 * Parse a binary payload.
 * @param handCounts Per-frame hand counts for schema 1.0. Empty means every
 *                   frame has zero hands; trailing bytes are then an error.
 * @throws std::runtime_error on truncated or inconsistent data
 */
[[nodiscard]] std::vector<FrameRecord> decodeSession(const std::vector<uint8_t>& data,
                                                     const std::vector<uint32_t>& handCounts = {},
                                                     bool inlineHandCount = false);

[[nodiscard]] nlohmann::json toJson(const SessionMetadata& metadata);
[[nodiscard]] SessionMetadata metadataFromJson(const nlohmann::json& json);

} // namespace record
