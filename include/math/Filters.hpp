#pragma once

namespace math {

/**
 * Exponentially weighted moving average.
 * y += alpha * (x - y); the first sample seeds the average.
 */
class EwmaFilter {
public:
    explicit EwmaFilter(float alpha = 0.2f);

    float filter(float value);
    void reset();
    void reset(float seed);

    bool initialized() const { return _initialized; }

private:
    float _alpha;
    float _value = 0.0f;
    bool _initialized = false;
};

/**
 * Independent scalar Kalman filter per axis (random-walk model).
 * Used for controller positions, which jitter a few mm per frame.
 */
class KalmanFilter {
public:
    struct Point3f { float x, y, z; };

    KalmanFilter(float processNoise = 0.01f, float measurementNoise = 0.1f);

    Point3f update(float x, float y, float z);
    void reset();

    bool initialized() const { return initialized_; }
    Point3f estimate() const { return {fx.x, fy.x, fz.x}; }

private:
    struct AxisFilter {
        float x = 0.0f; // State estimate
        float p = 1.0f; // Estimation error covariance
        float q = 0.01f; // Process noise covariance
        float r = 0.1f; // Measurement noise covariance
        float k = 0.0f; // Kalman gain

        void predict() {
            p = p + q;
        }

        float update(float measurement) {
            predict();
            k = p / (p + r);
            x = x + k * (measurement - x);
            p = (1 - k) * p;

            return x;
        }
    };

    AxisFilter makeAxis() const;

    float q_;
    float r_;
    AxisFilter fx, fy, fz;
    bool initialized_ = false;
};

} // namespace math
