#include "math/Filters.hpp"

namespace math {

EwmaFilter::EwmaFilter(float alpha)
    : _alpha(alpha) {
}

float EwmaFilter::filter(float value) {
    if (!_initialized) {
        _value = value;
        _initialized = true;
        return _value;
    }
    _value += _alpha * (value - _value);
    return _value;
}

void EwmaFilter::reset() {
    _value = 0.0f;
    _initialized = false;
}

void EwmaFilter::reset(float seed) {
    _value = seed;
    _initialized = true;
}

KalmanFilter::KalmanFilter(float processNoise, float measurementNoise)
    : q_(processNoise), r_(measurementNoise) {
    reset();
}

KalmanFilter::AxisFilter KalmanFilter::makeAxis() const {
    AxisFilter axis;
    axis.q = q_;
    axis.r = r_;
    return axis;
}

KalmanFilter::Point3f KalmanFilter::update(float x, float y, float z) {
    if (!initialized_) {
        fx.x = x; fy.x = y; fz.x = z;
        initialized_ = true;
        return {x, y, z};
    }
    return {
        fx.update(x),
        fy.update(y),
        fz.update(z)
    };
}

void KalmanFilter::reset() {
    fx = makeAxis();
    fy = makeAxis();
    fz = makeAxis();
    initialized_ = false;
}

} // namespace math
