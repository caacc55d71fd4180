#include <gtest/gtest.h>

#include <cmath>

#include "core/LandmarkSmoother.hpp"
#include "math/Filters.hpp"

using namespace core;

namespace {

Keypoint2D kp(const std::string& name, float x, float y, float score) {
    Keypoint2D k;
    k.name = name;
    k.x = x;
    k.y = y;
    k.score = score;
    return k;
}

const TrackedZone* findZone(const std::vector<TrackedZone>& zones, const std::string& part) {
    for (const auto& z : zones) {
        if (z.bodyPart == part) return &z;
    }
    return nullptr;
}

} // namespace

TEST(ExponentialFilterTest, FirstSampleSeedsState) {
    math::ExponentialFilter2D filter(0.7f);
    EXPECT_FALSE(filter.initialized());

    auto p = filter.update(10.0f, -4.0f);
    EXPECT_TRUE(filter.initialized());
    EXPECT_FLOAT_EQ(p.x, 10.0f);
    EXPECT_FLOAT_EQ(p.y, -4.0f);

    p = filter.update(20.0f, 6.0f);
    EXPECT_FLOAT_EQ(p.x, 10.0f * 0.7f + 20.0f * 0.3f);
    EXPECT_FLOAT_EQ(p.y, -4.0f * 0.7f + 6.0f * 0.3f);

    filter.reset();
    EXPECT_FALSE(filter.initialized());
}

TEST(LandmarkSmootherTest, ConvergesGeometrically) {
    LandmarkSmoother smoother;

    smoother.update({kp("nose", 0.0f, 0.0f, 0.9f)}, 0.0);

    // Constant input at 100: error after n updates is 100 * 0.7^n
    for (int n = 1; n <= 20; ++n) {
        auto zones = smoother.update({kp("nose", 100.0f, 50.0f, 0.9f)}, n * 16.0);
        ASSERT_EQ(zones.size(), 1u);
        float expectedError = 100.0f * static_cast<float>(std::pow(0.7, n));
        EXPECT_NEAR(100.0f - zones[0].x, expectedError, 1e-3f) << "n=" << n;
        EXPECT_NEAR(50.0f - zones[0].y, expectedError / 2.0f, 1e-3f) << "n=" << n;
    }
}

TEST(LandmarkSmootherTest, LowConfidenceFramesAreSkippedWithoutDecay) {
    LandmarkSmoother smoother;
    const float scores[] = {0.9f, 0.1f, 0.9f, 0.9f, 0.1f};
    const float xs[] = {100.0f, 500.0f, 200.0f, 300.0f, 900.0f};
    const bool present[] = {true, false, true, true, false};

    Point2D lastSmoothed{};
    for (int f = 0; f < 5; ++f) {
        auto zones = smoother.update({kp("left_wrist", xs[f], 40.0f, scores[f])}, f * 33.0);
        const TrackedZone* zone = findZone(zones, "left_wrist");

        SCOPED_TRACE(testing::Message() << "frame " << (f + 1));
        EXPECT_EQ(zone != nullptr, present[f]);

        auto state = smoother.smoothed("left_wrist");
        ASSERT_TRUE(state.has_value());
        if (present[f]) {
            EXPECT_FLOAT_EQ(zone->x, state->x);
            EXPECT_FLOAT_EQ(zone->radius, 40.0f);
            EXPECT_DOUBLE_EQ(zone->lastUpdateMs, f * 33.0);
        } else {
            // Omission leaves the filter untouched
            EXPECT_FLOAT_EQ(state->x, lastSmoothed.x);
            EXPECT_FLOAT_EQ(state->y, lastSmoothed.y);
        }
        lastSmoothed = *state;
    }

    // Frame 3 continued from frame 1 as if frame 2 never happened
    LandmarkSmoother reference;
    reference.update({kp("left_wrist", 100.0f, 40.0f, 0.9f)}, 0.0);
    reference.update({kp("left_wrist", 200.0f, 40.0f, 0.9f)}, 66.0);
    auto expected = reference.update({kp("left_wrist", 300.0f, 40.0f, 0.9f)}, 99.0);
    EXPECT_FLOAT_EQ(lastSmoothed.x, expected[0].x);
}

TEST(LandmarkSmootherTest, ThresholdIsExclusive) {
    LandmarkSmoother smoother;
    EXPECT_TRUE(smoother.update({kp("nose", 1.0f, 1.0f, 0.3f)}, 0.0).empty());
    EXPECT_EQ(smoother.update({kp("nose", 1.0f, 1.0f, 0.31f)}, 1.0).size(), 1u);
}

TEST(LandmarkSmootherTest, OnlyTrackablePartsCarryState) {
    LandmarkSmoother smoother;
    auto zones = smoother.update({kp("left_eye", 5.0f, 5.0f, 0.99f),
                                  kp("right_ankle", 7.0f, 9.0f, 0.8f),
                                  kp("right_ankle", 70.0f, 90.0f, 0.8f)}, 0.0);

    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].bodyPart, "right_ankle");
    EXPECT_FLOAT_EQ(zones[0].x, 7.0f);
    EXPECT_FLOAT_EQ(zones[0].radius, 35.0f);
    EXPECT_EQ(smoother.stateSize(), 1u);
    EXPECT_FALSE(smoother.isTrackable("left_eye"));
    EXPECT_FALSE(smoother.smoothed("left_eye").has_value());

    smoother.reset();
    EXPECT_EQ(smoother.stateSize(), 0u);
}

TEST(LandmarkSmootherTest, UsesConfiguredRadiiAndAlpha) {
    TrackingConfig config;
    config.smoothingAlpha = 0.5f;
    config.zoneRadii = {{"nose", 12.0f}};

    LandmarkSmoother smoother(config);
    smoother.update({kp("nose", 0.0f, 0.0f, 0.9f)}, 0.0);
    auto zones = smoother.update({kp("nose", 10.0f, 0.0f, 0.9f),
                                  kp("left_wrist", 1.0f, 1.0f, 0.9f)}, 1.0);

    ASSERT_EQ(zones.size(), 1u);
    EXPECT_FLOAT_EQ(zones[0].x, 5.0f);
    EXPECT_FLOAT_EQ(zones[0].radius, 12.0f);
}
