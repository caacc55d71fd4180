#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

// ============================================================
// Tracking Defaults (overridable through TrackingConfig)
// ============================================================

// Keypoints at or below this score are treated as absent
constexpr float MIN_KEYPOINT_SCORE = 0.3f;

// EMA weight of the previous smoothed value (higher = smoother but laggier)
constexpr float SMOOTHING_ALPHA = 0.7f;

// Collision ring capacity and visual relevance window
constexpr size_t COLLISION_HISTORY_SIZE = 50;
constexpr double COLLISION_RELEVANCE_MS = 1000.0;

// Detection loop pacing (one frame per display refresh)
constexpr float TARGET_TICK_HZ = 60.0f;

// ============================================================
// Landmark Topology
// ============================================================

constexpr size_t BODY_KEYPOINT_COUNT = 17;
constexpr size_t HAND_LANDMARK_COUNT = 21;
constexpr size_t MAX_HANDS = 2;

// Pose backend output order (COCO 17)
constexpr std::array<const char*, BODY_KEYPOINT_COUNT> BODY_KEYPOINT_NAMES = {
    "nose",
    "left_eye", "right_eye",
    "left_ear", "right_ear",
    "left_shoulder", "right_shoulder",
    "left_elbow", "right_elbow",
    "left_wrist", "right_wrist",
    "left_hip", "right_hip",
    "left_knee", "right_knee",
    "left_ankle", "right_ankle"
};

// Hand landmark indices (wrist=0, thumb=1..4, index=5..8, middle=9..12, ring=13..16, pinky=17..20)
struct HandIndex {
    static constexpr int WRIST = 0;
    static constexpr int THUMB_TIP = 4;
    static constexpr int INDEX_TIP = 8;
    static constexpr int MIDDLE_TIP = 12;
    static constexpr int RING_TIP = 16;
    static constexpr int PINKY_TIP = 20;
};

constexpr std::array<int, 5> FINGERTIP_INDICES = {
    HandIndex::THUMB_TIP, HandIndex::INDEX_TIP, HandIndex::MIDDLE_TIP,
    HandIndex::RING_TIP, HandIndex::PINKY_TIP
};

// ============================================================
// Data Structures
// ============================================================

struct Point2D {
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * Named body keypoint. Source pixels when it leaves a pose backend,
 * display pixels after mapping.
 */
struct Keypoint2D {
    std::string name;
    float x = 0.0f;
    float y = 0.0f;
    float score = 0.0f;
};

/**
 * Hand landmark. x,y normalized to [0,1] of the source frame, z relative depth.
 */
struct Keypoint3D {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Handedness {
    std::string category; // "Left" or "Right"
    float score = 0.0f;
};

struct HandObservation {
    std::array<Keypoint3D, HAND_LANDMARK_COUNT> landmarks{};

    // Metric landmarks when the backend provides them, otherwise empty
    std::vector<Keypoint3D> worldLandmarks;

    std::optional<Handedness> handedness;
};

/**
 * Smoothed display-space position of a body part plus its interaction radius.
 */
struct TrackedZone {
    std::string bodyPart;
    float x = 0.0f;
    float y = 0.0f;
    float score = 0.0f;
    float radius = 0.0f;
    double lastUpdateMs = 0.0;
};

struct Target {
    std::string id;
    Point2D position;
    float radius = 0.0f;
};

struct CollisionEvent {
    std::string bodyPart;
    std::string targetId;
    int64_t timestampMs = 0;
    Point2D position;
};

/**
 * Current source → display affine mapping.
 */
struct RenderState {
    float scale = 1.0f;
    float offsetX = 0.0f;
    float offsetY = 0.0f;
    int sourceWidth = 0;
    int sourceHeight = 0;
};

/**
 * Consumer-facing per-frame result of the fusion pipeline.
 * Handed to sinks by const reference; sinks copy what they keep.
 */
// A collision still inside the relevance window
struct ActiveCollision {
    CollisionEvent event;
    float alpha = 0.0f; // 1 at impact, fading linearly to 0 at the end of the window
};

struct FusedFrame {
    uint32_t frameIndex = 0;
    double timestampMs = 0.0;

    RenderState renderState;

    // Pose backend output in source pixels, fixed backend order
    std::vector<Keypoint2D> rawKeypoints;
    // Same keypoints mapped into display pixels
    std::vector<Keypoint2D> keypoints;

    // Hand backend output (normalized) and the same hands in display pixels
    std::vector<HandObservation> hands;
    std::vector<HandObservation> displayHands;

    std::vector<TrackedZone> trackedZones;

    // Collisions emitted this frame
    std::vector<CollisionEvent> collisions;
    // Recent collisions with their fade, as of timestampMs
    std::vector<ActiveCollision> activeCollisions;

    // Status summary
    int wristCount = 0;
    bool handModelActive = false;
};

} // namespace core
