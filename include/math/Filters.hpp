#pragma once

namespace math {

/**
 * Exponential moving average over a 2D point.
 *
 * smoothed = previous * alpha + raw * (1 - alpha)
 *
 * The first sample seeds the state unfiltered.
 */
class ExponentialFilter2D {
public:
    explicit ExponentialFilter2D(float alpha = 0.7f);

    struct Point2f { float x, y; };

    Point2f update(float x, float y);
    void reset();

    [[nodiscard]] bool initialized() const { return _x.initialized; }
    [[nodiscard]] Point2f value() const { return {_x.y, _y.y}; }
    [[nodiscard]] float alpha() const { return _alpha; }

private:
    struct AxisFilter {
        float y = 0.0f;
        bool initialized = false;

        float filter(float value, float alpha) {
            if (!initialized) {
                y = value;
                initialized = true;
                return value;
            }
            y = y * alpha + value * (1.0f - alpha);
            return y;
        }

        void reset() {
            y = 0.0f;
            initialized = false;
        }
    };

    float _alpha;
    AxisFilter _x;
    AxisFilter _y;
};

} // namespace math
