/**
 * Hand Landmark Implementation
 *
 * MediaPipe Hand Landmark model inference on OpenCV DNN.
 * Full-frame mode: the whole frame is letterboxed into the 224x224 input.
 */

#include "inference/HandLandmark.hpp"
#include "inference/Letterbox.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace inference {

namespace {

float sigmoid(float v) {
    return 1.0f / (1.0f + std::exp(-v));
}

} // namespace

HandLandmark::HandLandmark(Config config)
    : config_(std::move(config)) {
}

HandLandmark::~HandLandmark() {
    close();
}

bool HandLandmark::init() {
    try {
        net_ = cv::dnn::readNet(config_.modelPath);
    } catch (const cv::Exception& e) {
        core::Logger::error("HandLandmark: Failed to load ", config_.modelPath, ": ", e.what());
        return false;
    }

    if (net_.empty()) {
        core::Logger::error("HandLandmark: Empty network from ", config_.modelPath);
        return false;
    }

    outputNames_ = net_.getUnconnectedOutLayersNames();
    lastTimestampMs_ = -1.0;

    initialized_ = true;
    core::Logger::info("HandLandmark initialized");
    core::Logger::info("  Input: ", config_.inputSize, "x", config_.inputSize);
    core::Logger::info("  Outputs: ", outputNames_.size());
    return true;
}

void HandLandmark::close() {
    if (!initialized_) return;
    net_ = cv::dnn::Net();
    outputNames_.clear();
    initialized_ = false;
    core::Logger::info("HandLandmark released");
}

std::vector<core::HandObservation> HandLandmark::detect(const cv::Mat& frame, double timestampMs) {
    if (!initialized_) {
        throw DetectorError("HandLandmark not initialized");
    }
    if (timestampMs <= lastTimestampMs_) {
        throw DetectorError("HandLandmark: timestamp " + std::to_string(timestampMs) +
                            " not greater than previous " + std::to_string(lastTimestampMs_));
    }
    lastTimestampMs_ = timestampMs;

    std::vector<core::HandObservation> hands;
    if (frame.empty()) return hands;

    LetterboxState state;
    cv::Mat input = letterbox(frame, config_.inputSize, state);

    std::vector<cv::Mat> outputs;
    try {
        cv::Mat blob = cv::dnn::blobFromImage(input, 1.0 / 255.0,
                                              cv::Size(config_.inputSize, config_.inputSize),
                                              cv::Scalar(), true, false);
        net_.setInput(blob);
        net_.forward(outputs, outputNames_);
    } catch (const cv::Exception& e) {
        throw DetectorError(std::string("HandLandmark inference failed: ") + e.what());
    }

    RawOutput raw = collect(outputs);
    if (!raw.landmarks) {
        throw DetectorError("HandLandmark: no 63-float landmark output");
    }

    auto hand = decode(raw, state, config_.inputSize, config_.presenceThreshold);
    if (hand) {
        hands.push_back(std::move(*hand));
    }
    return hands;
}

HandLandmark::RawOutput HandLandmark::collect(const std::vector<cv::Mat>& outputs) const {
    RawOutput raw;
    std::vector<float> scalars;

    for (const auto& out : outputs) {
        if (out.type() != CV_32F) continue;
        const auto* data = out.ptr<float>();
        size_t n = out.total();

        if (n >= 65 && outputs.size() == 1) {
            // Single fused tensor: 63 landmarks, handedness, presence
            raw.landmarks = data;
            raw.handedness = data[63];
            raw.presence = data[64];
            return raw;
        }
        if (n == 63) {
            // Screen landmarks first, world landmarks second
            if (!raw.landmarks) raw.landmarks = data;
            else raw.world = data;
        } else if (n == 1) {
            scalars.push_back(data[0]);
        }
    }

    // Model output order: presence flag, then handedness
    if (!scalars.empty()) raw.presence = scalars[0];
    if (scalars.size() > 1) raw.handedness = scalars[1];
    return raw;
}

std::optional<core::HandObservation> HandLandmark::decode(const RawOutput& raw,
                                                           const LetterboxState& letterboxState,
                                                           int inputSize,
                                                           float presenceThreshold) {
    // Some exports keep the raw logit, others already apply the sigmoid
    float presence = (raw.presence < 0.0f || raw.presence > 1.0f) ? sigmoid(raw.presence) : raw.presence;
    if (presence < presenceThreshold) {
        return std::nullopt;
    }

    float sw = static_cast<float>(letterboxState.sourceWidth);
    float sh = static_cast<float>(letterboxState.sourceHeight);
    if (sw <= 0.0f || sh <= 0.0f) {
        return std::nullopt;
    }

    core::HandObservation hand;
    for (size_t i = 0; i < core::HAND_LANDMARK_COUNT; ++i) {
        auto p = unletterbox(raw.landmarks[i * 3 + 0], raw.landmarks[i * 3 + 1], letterboxState);

        hand.landmarks[i].x = std::clamp(p.x / sw, 0.0f, 1.0f);
        hand.landmarks[i].y = std::clamp(p.y / sh, 0.0f, 1.0f);
        hand.landmarks[i].z = raw.landmarks[i * 3 + 2] / static_cast<float>(inputSize);
    }

    if (raw.world) {
        hand.worldLandmarks.reserve(core::HAND_LANDMARK_COUNT);
        for (size_t i = 0; i < core::HAND_LANDMARK_COUNT; ++i) {
            hand.worldLandmarks.push_back({raw.world[i * 3 + 0], raw.world[i * 3 + 1], raw.world[i * 3 + 2]});
        }
    }

    float right = std::clamp(raw.handedness, 0.0f, 1.0f);
    hand.handedness = right >= 0.5f ? core::Handedness{"Right", right}
                                    : core::Handedness{"Left", 1.0f - right};
    return hand;
}

} // namespace inference
