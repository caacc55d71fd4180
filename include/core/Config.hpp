#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace core {

/**
 * Tuning data for smoothing and collision detection.
 * Kept apart from the algorithms so it can be loaded from YAML.
 */
struct TrackingConfig {
    float minKeypointScore = MIN_KEYPOINT_SCORE;
    float smoothingAlpha = SMOOTHING_ALPHA;
    size_t collisionHistorySize = COLLISION_HISTORY_SIZE;
    double collisionRelevanceMs = COLLISION_RELEVANCE_MS;

    // Interaction radius per trackable body part (display pixels).
    // Parts missing here are never tracked as zones.
    std::map<std::string, float> zoneRadii = {
        {"left_wrist", 40.0f},    {"right_wrist", 40.0f},
        {"left_ankle", 35.0f},    {"right_ankle", 35.0f},
        {"nose", 30.0f},
        {"left_elbow", 25.0f},    {"right_elbow", 25.0f},
        {"left_knee", 25.0f},     {"right_knee", 25.0f},
        {"left_shoulder", 20.0f}, {"right_shoulder", 20.0f},
        {"left_hip", 20.0f},      {"right_hip", 20.0f}
    };

    std::vector<Target> targets;
};

struct RecorderConfig {
    double tickMs = 100.0;
    double maxDurationSec = 10.0;
    std::string outputDir = ".";
    std::string schemaVersion = "1.0";

    // Writes a uint8 hand count after each frameIndex (schema 1.1). Off by default,
    // the 1.0 layout leaves the per-frame hand count to the sidecar.
    bool inlineHandCount = false;
};

struct AppConfig {
    // Video source: camera index when videoPath is empty
    int cameraIndex = 0;
    std::string videoPath;
    int captureWidth = 1280;
    int captureHeight = 720;

    // Display viewport the keypoints are mapped into
    int viewportWidth = 1280;
    int viewportHeight = 720;

    float tickHz = TARGET_TICK_HZ;

    // Detector models
    std::string poseModelPath = "models/movenet_singlepose_thunder.onnx";
    int poseInputSize = 256;
    std::string handModelPath = "models/hand_landmark.onnx";
    int handInputSize = 224;
    float handPresenceThreshold = 0.5f;

    // OSC output
    bool oscEnabled = true;
    std::string oscHost = "127.0.0.1";
    std::string oscPort = "9000";

    // Recording starts automatically once streaming when set
    std::string recordAction;

    std::string logLevel = "info";

    TrackingConfig tracking;
    RecorderConfig recorder;
};

/**
 * Loads overrides from a YAML file on top of the compiled defaults.
 * Throws std::runtime_error when the file cannot be parsed.
 */
AppConfig loadConfig(const std::string& path);

/**
 * Applies the keys present in an already-loaded YAML document.
 */
void applyConfig(AppConfig& config, const std::string& yamlText);

} // namespace core
