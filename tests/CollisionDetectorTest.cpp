#include <gtest/gtest.h>

#include "core/CollisionDetector.hpp"

using namespace core;

namespace {

TrackedZone zone(const std::string& part, float x, float y, float radius) {
    TrackedZone z;
    z.bodyPart = part;
    z.x = x;
    z.y = y;
    z.score = 0.9f;
    z.radius = radius;
    return z;
}

Target target(const std::string& id, float x, float y, float radius) {
    Target t;
    t.id = id;
    t.position = {x, y};
    t.radius = radius;
    return t;
}

CollisionEvent event(const std::string& target, int64_t ts) {
    CollisionEvent e;
    e.bodyPart = "left_wrist";
    e.targetId = target;
    e.timestampMs = ts;
    return e;
}

} // namespace

TEST(CollisionDetectorTest, DistanceMustBeBelowRadiusSum) {
    std::vector<TrackedZone> zones = {zone("left_wrist", 0.0f, 0.0f, 10.0f)};

    EXPECT_TRUE(CollisionDetector::detect(zones, {target("far", 15.0f, 0.0f, 4.0f)}, 0).empty());

    auto hits = CollisionDetector::detect(zones, {target("near", 13.0f, 0.0f, 4.0f)}, 42);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].bodyPart, "left_wrist");
    EXPECT_EQ(hits[0].targetId, "near");
    EXPECT_EQ(hits[0].timestampMs, 42);
    EXPECT_FLOAT_EQ(hits[0].position.x, 0.0f);
}

TEST(CollisionDetectorTest, TangentCirclesDoNotCollide) {
    EXPECT_FALSE(CollisionDetector::intersects({0.0f, 0.0f}, 10.0f, {14.0f, 0.0f}, 4.0f));
    EXPECT_TRUE(CollisionDetector::intersects({0.0f, 0.0f}, 10.0f, {13.99f, 0.0f}, 4.0f));
}

TEST(CollisionDetectorTest, ReportsEveryQualifyingPair) {
    std::vector<TrackedZone> zones = {zone("left_wrist", 0.0f, 0.0f, 10.0f),
                                      zone("right_wrist", 100.0f, 0.0f, 10.0f),
                                      zone("nose", 50.0f, 0.0f, 5.0f)};
    std::vector<Target> targets = {target("a", 5.0f, 0.0f, 1.0f),
                                   target("b", 95.0f, 0.0f, 1.0f),
                                   target("wide", 50.0f, 0.0f, 100.0f)};

    auto hits = CollisionDetector::detect(zones, targets, 7);
    ASSERT_EQ(hits.size(), 5u);
    EXPECT_EQ(hits[0].targetId, "a");
    EXPECT_EQ(hits[1].targetId, "b");
    EXPECT_EQ(hits[1].bodyPart, "right_wrist");
    for (size_t i = 2; i < 5; ++i) {
        EXPECT_EQ(hits[i].targetId, "wide");
    }
}

TEST(CollisionDetectorTest, EmptyInputs) {
    EXPECT_TRUE(CollisionDetector::detect({}, {target("a", 0.0f, 0.0f, 5.0f)}, 0).empty());
    EXPECT_TRUE(CollisionDetector::detect({zone("nose", 0.0f, 0.0f, 5.0f)}, {}, 0).empty());
}

TEST(CollisionHistoryTest, KeepsMostRecentInOrder) {
    CollisionHistory history;
    for (int i = 0; i < 60; ++i) {
        history.push(event("t" + std::to_string(i), i));
    }

    ASSERT_EQ(history.size(), 50u);
    EXPECT_EQ(history.capacity(), 50u);
    for (size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(history.events()[i].targetId, "t" + std::to_string(i + 10));
    }
}

TEST(CollisionHistoryTest, RepeatedContactIsNotDeduplicated) {
    CollisionHistory history(5);
    std::vector<TrackedZone> zones = {zone("left_wrist", 0.0f, 0.0f, 10.0f)};
    std::vector<Target> targets = {target("drum", 1.0f, 0.0f, 5.0f)};

    for (int frame = 0; frame < 3; ++frame) {
        history.append(CollisionDetector::detect(zones, targets, frame * 16));
    }
    EXPECT_EQ(history.size(), 3u);

    history.clear();
    EXPECT_EQ(history.size(), 0u);
}

TEST(CollisionHistoryTest, ActiveEventsFadeOverRelevanceWindow) {
    CollisionHistory history;
    history.push(event("old", 0));
    history.push(event("mid", 500));
    history.push(event("new", 1000));

    auto active = history.active(1000);
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].event.targetId, "mid");
    EXPECT_FLOAT_EQ(active[0].alpha, 0.5f);
    EXPECT_EQ(active[1].event.targetId, "new");
    EXPECT_FLOAT_EQ(active[1].alpha, 1.0f);

    EXPECT_TRUE(history.active(2500).empty());
}
