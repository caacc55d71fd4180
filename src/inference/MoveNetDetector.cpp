/**
 * MoveNet single-pose estimation on OpenCV DNN.
 *
 * The frame is letterboxed into the square model input; keypoints come back
 * normalized to that input and are mapped back into source pixels.
 */

#include "inference/MoveNetDetector.hpp"
#include "inference/Letterbox.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace inference {

MoveNetDetector::MoveNetDetector(Config config)
    : config_(std::move(config)) {
}

MoveNetDetector::~MoveNetDetector() {
    close();
}

bool MoveNetDetector::init() {
    try {
        net_ = cv::dnn::readNet(config_.modelPath);
    } catch (const cv::Exception& e) {
        core::Logger::error("MoveNetDetector: Failed to load ", config_.modelPath, ": ", e.what());
        return false;
    }

    if (net_.empty()) {
        core::Logger::error("MoveNetDetector: Empty network from ", config_.modelPath);
        return false;
    }

    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

    initialized_ = true;
    core::Logger::info("MoveNetDetector initialized");
    core::Logger::info("  Model: ", config_.modelPath);
    core::Logger::info("  Input: ", config_.inputSize, "x", config_.inputSize,
                       config_.nhwcInput ? " (NHWC)" : " (NCHW)");
    return true;
}

void MoveNetDetector::close() {
    if (!initialized_) return;
    net_ = cv::dnn::Net();
    initialized_ = false;
    core::Logger::info("MoveNetDetector released");
}

cv::Mat MoveNetDetector::makeBlob(const cv::Mat& frame) const {
    if (!config_.nhwcInput) {
        return cv::dnn::blobFromImage(frame, 1.0, cv::Size(config_.inputSize, config_.inputSize),
                                      cv::Scalar(), true, false);
    }

    // [1, H, W, 3] RGB float, raw 0..255 range
    cv::Mat rgb;
    cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);
    cv::Mat rgbF;
    rgb.convertTo(rgbF, CV_32F);
    const int shape[] = {1, config_.inputSize, config_.inputSize, 3};
    return cv::Mat(4, shape, CV_32F, rgbF.data).clone();
}

std::optional<PoseResult> MoveNetDetector::detect(const cv::Mat& frame, double) {
    if (!initialized_) {
        throw DetectorError("MoveNetDetector not initialized");
    }
    if (frame.empty()) {
        return std::nullopt;
    }

    LetterboxState state;
    cv::Mat input = letterbox(frame, config_.inputSize, state);

    cv::Mat output;
    try {
        net_.setInput(makeBlob(input));
        output = net_.forward();
    } catch (const cv::Exception& e) {
        throw DetectorError(std::string("MoveNet inference failed: ") + e.what());
    }

    if (output.total() < core::BODY_KEYPOINT_COUNT * 3 || output.type() != CV_32F) {
        throw DetectorError("MoveNet output has unexpected size " + std::to_string(output.total()));
    }

    PoseResult result = decode(output.ptr<float>(), state, config_.inputSize);
    if (result.score < config_.minPoseScore) {
        return std::nullopt;
    }
    return result;
}

PoseResult MoveNetDetector::decode(const float* output,
                                   const LetterboxState& letterboxState,
                                   int inputSize) {
    PoseResult result;
    result.keypoints.reserve(core::BODY_KEYPOINT_COUNT);

    float scoreSum = 0.0f;
    for (size_t i = 0; i < core::BODY_KEYPOINT_COUNT; ++i) {
        float ny = output[i * 3 + 0];
        float nx = output[i * 3 + 1];
        float score = std::clamp(output[i * 3 + 2], 0.0f, 1.0f);

        auto p = unletterbox(nx * inputSize, ny * inputSize, letterboxState);

        core::Keypoint2D kp;
        kp.name = core::BODY_KEYPOINT_NAMES[i];
        kp.x = p.x;
        kp.y = p.y;
        kp.score = score;
        result.keypoints.push_back(std::move(kp));
        scoreSum += score;
    }

    result.score = scoreSum / static_cast<float>(core::BODY_KEYPOINT_COUNT);
    return result;
}

} // namespace inference
