#pragma once

#include "core/Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace inference {

/**
 * Raised by a backend when a detection call fails.
 * The pipeline catches it per frame and keeps running.
 */
class DetectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PoseResult {
    // Source pixels, fixed backend order (BODY_KEYPOINT_NAMES)
    std::vector<core::Keypoint2D> keypoints;
    float score = 0.0f;
};

/**
 * Full-body pose estimator.
 */
class PoseBackend {
public:
    virtual ~PoseBackend() = default;

    /**
     * Load the model. Returns false if the backend is unusable.
     */
    virtual bool init() = 0;

    /**
     * Detect a single pose.
     * @return nullopt when nobody is in the frame
     * @throws DetectorError on inference failure
     */
    virtual std::optional<PoseResult> detect(const cv::Mat& frame, double timestampMs) = 0;

    virtual void close() {}

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * Multi-hand landmark estimator.
 * Timestamps passed to detect() must be strictly increasing.
 */
class HandBackend {
public:
    virtual ~HandBackend() = default;

    virtual bool init() = 0;

    /**
     * Detect hands. Landmarks are normalized to the source frame.
     * @return zero, one or two hands
     * @throws DetectorError on inference failure or a non-increasing timestamp
     */
    virtual std::vector<core::HandObservation> detect(const cv::Mat& frame, double timestampMs) = 0;

    virtual void close() {}

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace inference
