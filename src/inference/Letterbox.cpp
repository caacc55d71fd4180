#include "inference/Letterbox.hpp"
#include "math/CoordinateMapper.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace inference {

LetterboxState letterboxFor(int srcWidth, int srcHeight, int inputSize) {
    LetterboxState state;
    state.sourceWidth = srcWidth;
    state.sourceHeight = srcHeight;
    if (srcWidth <= 0 || srcHeight <= 0 || inputSize <= 0) return state;

    auto fit = math::CoordinateMapper::compute(srcWidth, srcHeight, inputSize, inputSize,
                                               math::FitMode::Contain);

    int newW = std::clamp(static_cast<int>(std::round(srcWidth * fit.scale)), 1, inputSize);
    int newH = std::clamp(static_cast<int>(std::round(srcHeight * fit.scale)), 1, inputSize);

    state.scaleX = static_cast<float>(newW) / static_cast<float>(srcWidth);
    state.scaleY = static_cast<float>(newH) / static_cast<float>(srcHeight);
    state.padX = (inputSize - newW) / 2;
    state.padY = (inputSize - newH) / 2;
    return state;
}

cv::Mat letterbox(const cv::Mat& frame, int inputSize, LetterboxState& state,
                  const cv::Scalar& padValue) {
    state = letterboxFor(frame.cols, frame.rows, inputSize);

    int newW = static_cast<int>(std::round(frame.cols * state.scaleX));
    int newH = static_cast<int>(std::round(frame.rows * state.scaleY));

    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(newW, newH));

    cv::Mat input(inputSize, inputSize, frame.type(), padValue);
    resized.copyTo(input(cv::Rect(state.padX, state.padY, newW, newH)));

    return input;
}

core::Point2D unletterbox(float x, float y, const LetterboxState& state) {
    if (state.scaleX == 0.0f || state.scaleY == 0.0f) return {x, y};
    return {(x - static_cast<float>(state.padX)) / state.scaleX,
            (y - static_cast<float>(state.padY)) / state.scaleY};
}

} // namespace inference
