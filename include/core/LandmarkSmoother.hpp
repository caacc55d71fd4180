#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "math/Filters.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

/**
 * Per body-part EMA smoothing of display-space keypoints.
 *
 * Only parts listed in the zone radius table carry state. A part is emitted as a
 * TrackedZone only in frames where it is confidently observed; while it is absent
 * its smoothed state is kept as is (no decay) and resumes from there when the
 * part reappears.
 */
class LandmarkSmoother {
public:
    explicit LandmarkSmoother(const TrackingConfig& config = TrackingConfig{});

    /**
     * Feed one frame of mapped keypoints.
     * @param keypoints Display-space keypoints from the pose backend
     * @param timestampMs Monotonic frame timestamp, becomes lastUpdateMs
     * @return Zones for the confidently observed, trackable parts of this frame
     */
    std::vector<TrackedZone> update(const std::vector<Keypoint2D>& keypoints, double timestampMs);

    /**
     * Last smoothed position of a part, if it was ever observed.
     */
    [[nodiscard]] std::optional<Point2D> smoothed(const std::string& bodyPart) const;

    /**
     * Number of body parts holding smoothing state.
     */
    [[nodiscard]] size_t stateSize() const { return filters_.size(); }

    [[nodiscard]] bool isTrackable(const std::string& bodyPart) const;

    void reset();

private:
    float minScore_;
    float alpha_;
    std::map<std::string, float> radii_;
    std::map<std::string, math::ExponentialFilter2D> filters_;
};

} // namespace core
