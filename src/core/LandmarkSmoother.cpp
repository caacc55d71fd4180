#include "core/LandmarkSmoother.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <set>

namespace core {

LandmarkSmoother::LandmarkSmoother(const TrackingConfig& config)
    : minScore_(config.minKeypointScore),
      alpha_(config.smoothingAlpha),
      radii_(config.zoneRadii) {
}

std::vector<TrackedZone> LandmarkSmoother::update(const std::vector<Keypoint2D>& keypoints,
                                                  double timestampMs) {
    std::vector<TrackedZone> zones;
    zones.reserve(radii_.size());

    std::set<std::string> seen;

    for (const auto& kp : keypoints) {
        auto radius = radii_.find(kp.name);
        if (radius == radii_.end()) continue;   // Not a trackable part
        if (kp.score <= minScore_) continue;    // Unreliable, keep previous state
        if (!seen.insert(kp.name).second) continue;

        auto it = filters_.find(kp.name);
        if (it == filters_.end()) {
            it = filters_.emplace(kp.name, math::ExponentialFilter2D(alpha_)).first;
            Logger::debug("LandmarkSmoother: seeding ", kp.name);
        }

        auto smoothed = it->second.update(kp.x, kp.y);

        TrackedZone zone;
        zone.bodyPart = kp.name;
        zone.x = smoothed.x;
        zone.y = smoothed.y;
        zone.score = std::clamp(kp.score, 0.0f, 1.0f);
        zone.radius = radius->second;
        zone.lastUpdateMs = timestampMs;
        zones.push_back(std::move(zone));
    }

    return zones;
}

std::optional<Point2D> LandmarkSmoother::smoothed(const std::string& bodyPart) const {
    auto it = filters_.find(bodyPart);
    if (it == filters_.end() || !it->second.initialized()) {
        return std::nullopt;
    }
    auto v = it->second.value();
    return Point2D{v.x, v.y};
}

bool LandmarkSmoother::isTrackable(const std::string& bodyPart) const {
    return radii_.count(bodyPart) > 0;
}

void LandmarkSmoother::reset() {
    filters_.clear();
}

} // namespace core
