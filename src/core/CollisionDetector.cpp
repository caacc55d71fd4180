#include "core/CollisionDetector.hpp"

#include <cmath>

namespace core {

bool CollisionDetector::intersects(const Point2D& a, float radiusA,
                                   const Point2D& b, float radiusB) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    float distance = std::sqrt(dx * dx + dy * dy);
    return distance < radiusA + radiusB; // Tangency is not a collision
}

std::vector<CollisionEvent> CollisionDetector::detect(const std::vector<TrackedZone>& zones,
                                                      const std::vector<Target>& targets,
                                                      int64_t timestampMs) {
    std::vector<CollisionEvent> events;
    if (zones.empty() || targets.empty()) return events;

    for (const auto& target : targets) {
        for (const auto& zone : zones) {
            Point2D center{zone.x, zone.y};
            if (!intersects(center, zone.radius, target.position, target.radius)) continue;

            CollisionEvent event;
            event.bodyPart = zone.bodyPart;
            event.targetId = target.id;
            event.timestampMs = timestampMs;
            event.position = center;
            events.push_back(std::move(event));
        }
    }
    return events;
}

CollisionHistory::CollisionHistory(size_t capacity, double relevanceMs)
    : capacity_(capacity == 0 ? 1 : capacity), relevanceMs_(relevanceMs) {
}

void CollisionHistory::push(const CollisionEvent& event) {
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

void CollisionHistory::append(const std::vector<CollisionEvent>& events) {
    for (const auto& e : events) {
        push(e);
    }
}

std::vector<CollisionHistory::ActiveEvent> CollisionHistory::active(int64_t nowMs) const {
    std::vector<ActiveEvent> result;
    for (const auto& e : events_) {
        double age = static_cast<double>(nowMs - e.timestampMs);
        if (age < 0.0 || age >= relevanceMs_) continue;
        result.push_back({e, static_cast<float>(1.0 - age / relevanceMs_)});
    }
    return result;
}

} // namespace core
