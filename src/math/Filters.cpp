#include "math/Filters.hpp"

namespace math {

ExponentialFilter2D::ExponentialFilter2D(float alpha)
    : _alpha(alpha) {
    reset();
}

ExponentialFilter2D::Point2f ExponentialFilter2D::update(float x, float y) {
    return {
        _x.filter(x, _alpha),
        _y.filter(y, _alpha)
    };
}

void ExponentialFilter2D::reset() {
    _x.reset();
    _y.reset();
}

} // namespace math
