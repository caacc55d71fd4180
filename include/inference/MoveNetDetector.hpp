#pragma once

#include "inference/Detector.hpp"
#include "inference/Letterbox.hpp"

#include <opencv2/dnn.hpp>

namespace inference {

/**
 * MoveNet single-pose estimator on OpenCV DNN.
 *
 * Input: frame letterboxed into a square model input
 * Output: [1,1,17,3] (y, x, score), normalized to the model input
 */
class MoveNetDetector : public PoseBackend {
public:
    struct Config {
        std::string modelPath = "models/movenet_singlepose_thunder.onnx";
        int inputSize = 256;    // Thunder: 256, Lightning: 192
        bool nhwcInput = true;  // TF-exported models take [1,H,W,3]
        float minPoseScore = 0.0f;
    };

    explicit MoveNetDetector(Config config);
    ~MoveNetDetector() override;

    bool init() override;
    std::optional<PoseResult> detect(const cv::Mat& frame, double timestampMs) override;
    void close() override;

    [[nodiscard]] std::string name() const override { return "MoveNet"; }
    [[nodiscard]] bool isInitialized() const { return initialized_; }

    /**
     * Decode raw model output into source-pixel keypoints.
     * @param output 17 * 3 floats (y, x, score) normalized to the model input
     * @param letterbox Placement of the source frame inside the model input
     * @param inputSize Model input side length in pixels
     */
    [[nodiscard]] static PoseResult decode(const float* output,
                                           const LetterboxState& letterbox,
                                           int inputSize);

private:
    cv::Mat makeBlob(const cv::Mat& input) const;

    Config config_;
    bool initialized_ = false;
    cv::dnn::Net net_;
};

} // namespace inference
