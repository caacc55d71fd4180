#pragma once

#include "core/Types.hpp"

#include <opencv2/core.hpp>

namespace inference {

/**
 * Placement of a source frame inside a square model input, in whole pixels.
 * Scales are the ones the resized image really has on each axis.
 */
struct LetterboxState {
    float scaleX = 1.0f;
    float scaleY = 1.0f;
    int padX = 0;
    int padY = 0;
    int sourceWidth = 0;
    int sourceHeight = 0;
};

/**
 * Contain-fit placement of a srcWidth x srcHeight frame in an inputSize square.
 */
LetterboxState letterboxFor(int srcWidth, int srcHeight, int inputSize);

/**
 * Resize a frame into a square model input, preserving aspect ratio.
 * The uncovered border is filled with padValue.
 * @param state Receives the placement used (source px -> input px)
 */
cv::Mat letterbox(const cv::Mat& frame, int inputSize, LetterboxState& state,
                  const cv::Scalar& padValue = cv::Scalar(0, 0, 0));

/**
 * Map a point in model-input pixels back to source pixels.
 */
core::Point2D unletterbox(float x, float y, const LetterboxState& state);

} // namespace inference
