#pragma once

#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace core {

/**
 * Circle-circle proximity test between tracked zones and targets.
 *
 * A pair collides when the centre distance is strictly below the sum of radii.
 * Every qualifying pair is reported; contact that lasts N frames yields N events.
 */
class CollisionDetector {
public:
    [[nodiscard]] static std::vector<CollisionEvent> detect(const std::vector<TrackedZone>& zones,
                                                            const std::vector<Target>& targets,
                                                            int64_t timestampMs);

    [[nodiscard]] static bool intersects(const Point2D& a, float radiusA,
                                         const Point2D& b, float radiusB);
};

/**
 * Bounded, arrival-ordered ring of recent collision events.
 * When full, the oldest event is evicted first.
 */
class CollisionHistory {
public:
    explicit CollisionHistory(size_t capacity = COLLISION_HISTORY_SIZE,
                              double relevanceMs = COLLISION_RELEVANCE_MS);

    void push(const CollisionEvent& event);
    void append(const std::vector<CollisionEvent>& events);

    using ActiveEvent = ActiveCollision;

    /**
     * Events still inside the relevance window at nowMs, oldest first.
     */
    [[nodiscard]] std::vector<ActiveEvent> active(int64_t nowMs) const;

    [[nodiscard]] const std::deque<CollisionEvent>& events() const { return events_; }
    [[nodiscard]] size_t size() const { return events_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }

    void clear() { events_.clear(); }

private:
    size_t capacity_;
    double relevanceMs_;
    std::deque<CollisionEvent> events_;
};

} // namespace core
