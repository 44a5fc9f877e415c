#pragma once

#include "Types.hpp"
#include "PostureConfig.hpp"
#include "SquatQuality.hpp"
#include "ControllerTracker.hpp"
#include "math/Filters.hpp"
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace core {

/**
 * PostureClassifier: squat depth classification and dodge state machine
 *
 * Phases: Idle → InBottomDwell → Dodging → Cooldown → Idle
 *
 * Features:
 * - Baseline calibration with plausibility range (rejects tracking glitches)
 * - Bottom detection with hysteresis (enter at threshold, exit below it)
 * - EWMA head velocity, dwell timer, 50/25/25 quality composite
 * - Edge-triggered events delivered synchronously to subscribers
 *
 * A dodge always runs its full duration. The machine re-arms only after
 * the user is back above the bottom band in Idle, so holding a squat
 * through the cooldown never yields a second dodge.
 *
 * Not thread-safe: one instance per session, driven from one thread.
 */
class PostureClassifier {
public:
    using EventCallback = std::function<void(const PostureEvent& event)>;
    using SubscriptionId = uint32_t;

    /**
     * @throws ConfigurationError if config fails validation
     */
    explicit PostureClassifier(const ClassifierConfig& config = ClassifierConfig{});

    /**
     * Set the standing baseline from the current head height (m).
     * Non-finite or out-of-range values are rejected and the previous
     * baseline is kept.
     * @return PostureError::None or PostureError::CalibrationError
     */
    [[nodiscard]] PostureError calibrateStandingHeight(float headHeight);

    /**
     * Average head height over the next `sampleSeconds` of accepted ticks,
     * then calibrate to the mean. Classification keeps using the old
     * baseline while collecting.
     */
    [[nodiscard]] PostureError beginRecalibration(float sampleSeconds);

    [[nodiscard]] bool isRecalibrating() const { return recalibrating_; }

    /**
     * Advance one frame.
     * deltaTime <= 0 is a no-op. A non-finite head position, or a
     * non-finite controller position on a sample that carries controllers,
     * records PostureError::InputError and leaves the state untouched.
     * @return Current state (unchanged on rejected input)
     */
    const PostureState& tick(const PoseSample& sample, float deltaTime);

    /**
     * Back to Idle with cleared timers, dwell and velocity. Baseline kept.
     * Emits DodgeEnded or CooldownEnded when interrupting that phase.
     */
    void reset();

    [[nodiscard]] const PostureState& state() const { return state_; }
    [[nodiscard]] const BaselineCalibration& baseline() const { return baseline_; }
    [[nodiscard]] bool isCalibrated() const { return baseline_.calibrated; }
    [[nodiscard]] PostureError lastError() const { return lastError_; }
    [[nodiscard]] const ClassifierConfig& config() const { return config_; }
    [[nodiscard]] uint64_t rejectedSamples() const { return rejectedSamples_; }

    /**
     * Subscribe to posture events. Callbacks run inside tick() in the
     * order events occur. Exceptions they throw are logged and dropped.
     */
    SubscriptionId addEventCallback(EventCallback callback);
    bool removeEventCallback(SubscriptionId id);

    [[nodiscard]] static const char* phaseName(PosturePhase phase);
    [[nodiscard]] static const char* eventName(PostureEventType type);
    [[nodiscard]] static const char* errorName(PostureError error);

private:
    ClassifierConfig config_;
    SquatQuality quality_;
    ControllerTracker controllers_;
    math::EwmaFilter velocityFilter_;

    BaselineCalibration baseline_;
    PostureState state_;
    PostureError lastError_ = PostureError::None;
    uint64_t rejectedSamples_ = 0;
    double now_ = 0.0;

    float previousHeight_ = 0.0f;
    bool hasPreviousHeight_ = false;

    // State machine
    bool armed_ = true;
    float dodgeElapsed_ = 0.0f;
    float cooldownElapsed_ = 0.0f;

    // Descent / bottom visit bookkeeping
    bool descending_ = false;
    float descentElapsed_ = 0.0f;
    float descentTime_ = 0.0f;
    bool perfectReported_ = false;
    float peakDepthNorm_ = 0.0f;
    float peakQuality_ = 0.0f;
    float lastReportedDepth_ = 0.0f;

    // Sampled recalibration
    bool recalibrating_ = false;
    float recalWindow_ = 0.0f;
    float recalElapsed_ = 0.0f;
    double recalSum_ = 0.0;
    int recalCount_ = 0;

    std::vector<std::pair<SubscriptionId, EventCallback>> callbacks_;
    SubscriptionId nextSubscriptionId_ = 1;

    void rejectSample(const char* reason);
    void updateBottom(float depth, float previousDepth, float deltaTime);
    void updateQuality();
    void updateBodyEstimate(const PoseSample& sample);
    void advancePhase(float deltaTime);
    void advanceRecalibration(float headHeight, float deltaTime);

    void transitionTo(PosturePhase newPhase);
    void emit(PostureEventType type, float value = 0.0f, float quality = 0.0f);
};

} // namespace core
