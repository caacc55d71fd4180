#include "math/CoordinateMapper.hpp"

#include <algorithm>

namespace math {

CoordinateMapper::CoordinateMapper(FitMode mode)
    : mode_(mode) {
}

core::RenderState CoordinateMapper::compute(int sourceWidth, int sourceHeight,
                                            int destWidth, int destHeight,
                                            FitMode mode) {
    core::RenderState state;
    state.sourceWidth = sourceWidth;
    state.sourceHeight = sourceHeight;

    // Identity until both rectangles are known (avoids division by zero)
    if (sourceWidth <= 0 || sourceHeight <= 0 || destWidth <= 0 || destHeight <= 0) {
        return state;
    }

    float sx = static_cast<float>(destWidth) / static_cast<float>(sourceWidth);
    float sy = static_cast<float>(destHeight) / static_cast<float>(sourceHeight);
    state.scale = (mode == FitMode::Cover) ? std::max(sx, sy) : std::min(sx, sy);

    state.offsetX = (static_cast<float>(destWidth) - sourceWidth * state.scale) / 2.0f;
    state.offsetY = (static_cast<float>(destHeight) - sourceHeight * state.scale) / 2.0f;
    return state;
}

bool CoordinateMapper::setViewport(int width, int height) {
    destWidth_ = width;
    destHeight_ = height;
    return recompute();
}

bool CoordinateMapper::setSource(int width, int height) {
    sourceWidth_ = width;
    sourceHeight_ = height;
    return recompute();
}

bool CoordinateMapper::recompute() {
    core::RenderState next = compute(sourceWidth_, sourceHeight_, destWidth_, destHeight_, mode_);
    bool changed = next.scale != state_.scale ||
                   next.offsetX != state_.offsetX ||
                   next.offsetY != state_.offsetY ||
                   next.sourceWidth != state_.sourceWidth ||
                   next.sourceHeight != state_.sourceHeight;
    state_ = next;
    return changed;
}

core::Point2D CoordinateMapper::map(float x, float y) const {
    return {x * state_.scale + state_.offsetX,
            y * state_.scale + state_.offsetY};
}

core::Point2D CoordinateMapper::mapNormalized(float nx, float ny) const {
    return map(nx * static_cast<float>(state_.sourceWidth),
               ny * static_cast<float>(state_.sourceHeight));
}

core::Point2D CoordinateMapper::unmap(float x, float y) const {
    if (state_.scale == 0.0f) return {x, y};
    return {(x - state_.offsetX) / state_.scale,
            (y - state_.offsetY) / state_.scale};
}

} // namespace math
