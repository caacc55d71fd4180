#pragma once

#include "core/Types.hpp"

namespace math {

enum class FitMode {
    Cover,   // scale = max(dw/sw, dh/sh): fills the destination, may crop
    Contain  // scale = min(dw/sw, dh/sh): letterboxes, never crops
};

/**
 * Uniform scale + offset mapping from source pixels into a destination rectangle.
 *
 * The mapping is recomputed from scratch whenever the source resolution or the
 * destination size changes. Degenerate (zero) dimensions yield the identity mapping.
 */
class CoordinateMapper {
public:
    explicit CoordinateMapper(FitMode mode = FitMode::Cover);

    /**
     * Compute the render state for the given source and destination sizes.
     */
    [[nodiscard]] static core::RenderState compute(int sourceWidth, int sourceHeight,
                                                   int destWidth, int destHeight,
                                                   FitMode mode = FitMode::Cover);

    /**
     * Set destination size and recompute. Returns true if the mapping changed.
     */
    bool setViewport(int width, int height);

    /**
     * Set source resolution and recompute. Returns true if the mapping changed.
     */
    bool setSource(int width, int height);

    /**
     * Map a source-pixel point into destination pixels.
     */
    [[nodiscard]] core::Point2D map(float x, float y) const;

    /**
     * Map a point normalized to [0,1] of the source frame into destination pixels.
     */
    [[nodiscard]] core::Point2D mapNormalized(float nx, float ny) const;

    /**
     * Inverse of map(): destination pixels back to source pixels.
     */
    [[nodiscard]] core::Point2D unmap(float x, float y) const;

    [[nodiscard]] const core::RenderState& state() const { return state_; }
    [[nodiscard]] bool hasSource() const { return state_.sourceWidth > 0 && state_.sourceHeight > 0; }
    [[nodiscard]] int viewportWidth() const { return destWidth_; }
    [[nodiscard]] int viewportHeight() const { return destHeight_; }
    [[nodiscard]] FitMode mode() const { return mode_; }

private:
    bool recompute();

    FitMode mode_;
    int destWidth_ = 0;
    int destHeight_ = 0;
    int sourceWidth_ = 0;
    int sourceHeight_ = 0;
    core::RenderState state_;
};

} // namespace math
