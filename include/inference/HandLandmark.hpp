#pragma once

#include "inference/Detector.hpp"
#include "inference/Letterbox.hpp"

#include <opencv2/dnn.hpp>
#include <array>

namespace inference {

/**
 * MediaPipe Hand Landmark model on OpenCV DNN.
 *
 * Runs on the full letterboxed frame (no palm ROI), so it reports at most one
 * hand per frame.
 * Output: 21 landmarks (input pixels) + presence + handedness [+ 21 world landmarks]
 */
class HandLandmark : public HandBackend {
public:
    struct Config {
        std::string modelPath = "models/hand_landmark.onnx";
        int inputSize = 224;            // MediaPipe uses 224x224
        float presenceThreshold = 0.5f;
    };

    /**
     * Raw tensors of one inference, already separated per output.
     */
    struct RawOutput {
        const float* landmarks = nullptr;  // 63 floats, input pixels
        const float* world = nullptr;      // 63 floats, metres (optional)
        float presence = 0.0f;             // raw logit or probability
        float handedness = 0.0f;           // probability of a right hand
    };

    explicit HandLandmark(Config config);
    ~HandLandmark() override;

    bool init() override;
    std::vector<core::HandObservation> detect(const cv::Mat& frame, double timestampMs) override;
    void close() override;

    [[nodiscard]] std::string name() const override { return "HandLandmark"; }
    [[nodiscard]] bool isInitialized() const { return initialized_; }

    /**
     * Convert raw outputs into a normalized observation.
     * @return nullopt if presence is below the threshold
     */
    [[nodiscard]] static std::optional<core::HandObservation> decode(const RawOutput& raw,
                                                                      const LetterboxState& letterbox,
                                                                      int inputSize,
                                                                      float presenceThreshold);

private:
    RawOutput collect(const std::vector<cv::Mat>& outputs) const;

    Config config_;
    bool initialized_ = false;
    cv::dnn::Net net_;
    std::vector<std::string> outputNames_;

    // Last accepted timestamp, detect() requires strictly increasing values
    double lastTimestampMs_ = -1.0;
};

} // namespace inference
