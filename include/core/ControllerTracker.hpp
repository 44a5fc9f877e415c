#pragma once

#include "PostureConfig.hpp"
#include "math/Filters.hpp"

namespace core {

/**
 * ControllerTracker: smoothed controller positions and forward reach
 *
 * Forward movement is the displacement of each controller along the
 * configured forward axis since the last calibration (negative clamped to 0).
 * Movement counts as detected once the mean of both reaches the threshold.
 */
class ControllerTracker {
public:
    explicit ControllerTracker(const ClassifierConfig& config);

    /**
     * Feed one pair of controller positions. Non-finite input is ignored.
     * @return false if the sample was rejected
     */
    bool update(const Point3D& left, const Point3D& right);

    /**
     * Use the current smoothed positions as the zero-movement reference.
     * No-op until the first accepted sample.
     */
    void captureReference();

    /**
     * Drop filters and reference.
     */
    void reset();

    [[nodiscard]] const ControllerMetrics& metrics() const { return metrics_; }
    [[nodiscard]] bool hasReference() const { return hasReference_; }

private:
    [[nodiscard]] float forwardOf(const Point3D& p, const Point3D& ref) const;

    math::KalmanFilter leftFilter_;
    math::KalmanFilter rightFilter_;

    Point3D forward_;
    float threshold_;

    Point3D leftRef_;
    Point3D rightRef_;
    bool hasReference_ = false;

    ControllerMetrics metrics_;
};

} // namespace core
