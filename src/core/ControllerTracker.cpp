#include "core/ControllerTracker.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace core {

namespace {

bool isFinite(const Point3D& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

Point3D toPoint(const math::KalmanFilter::Point3f& p) {
    return {p.x, p.y, p.z};
}

} // namespace

ControllerTracker::ControllerTracker(const ClassifierConfig& config)
    : threshold_(config.controllerMovementThreshold) {
    const Point3D& axis = config.forwardAxis;
    const float len = std::sqrt(axis.x * axis.x + axis.y * axis.y + axis.z * axis.z);
    forward_ = {axis.x / len, axis.y / len, axis.z / len};
}

bool ControllerTracker::update(const Point3D& left, const Point3D& right) {
    if (!isFinite(left) || !isFinite(right)) {
        return false;
    }

    metrics_.leftPosition = toPoint(leftFilter_.update(left.x, left.y, left.z));
    metrics_.rightPosition = toPoint(rightFilter_.update(right.x, right.y, right.z));
    metrics_.handHeightDiff = std::abs(metrics_.leftPosition.y - metrics_.rightPosition.y);

    if (hasReference_) {
        metrics_.leftForwardMovement = forwardOf(metrics_.leftPosition, leftRef_);
        metrics_.rightForwardMovement = forwardOf(metrics_.rightPosition, rightRef_);
        metrics_.combinedMovement = 0.5f * (metrics_.leftForwardMovement + metrics_.rightForwardMovement);
        metrics_.movementDetected = metrics_.combinedMovement >= threshold_;
    }
    return true;
}

void ControllerTracker::captureReference() {
    if (!leftFilter_.initialized() || !rightFilter_.initialized()) {
        return;
    }
    leftRef_ = toPoint(leftFilter_.estimate());
    rightRef_ = toPoint(rightFilter_.estimate());
    hasReference_ = true;

    metrics_.leftForwardMovement = 0.0f;
    metrics_.rightForwardMovement = 0.0f;
    metrics_.combinedMovement = 0.0f;
    metrics_.movementDetected = false;

    Logger::debug("ControllerTracker: reference L=(", leftRef_.x, ", ", leftRef_.y, ", ", leftRef_.z,
                  ") R=(", rightRef_.x, ", ", rightRef_.y, ", ", rightRef_.z, ")");
}

void ControllerTracker::reset() {
    leftFilter_.reset();
    rightFilter_.reset();
    hasReference_ = false;
    metrics_ = ControllerMetrics{};
}

float ControllerTracker::forwardOf(const Point3D& p, const Point3D& ref) const {
    const float dx = p.x - ref.x;
    const float dy = p.y - ref.y;
    const float dz = p.z - ref.z;
    return std::max(0.0f, dx * forward_.x + dy * forward_.y + dz * forward_.z);
}

} // namespace core
