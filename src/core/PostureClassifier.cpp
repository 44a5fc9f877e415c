#include "core/PostureClassifier.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

namespace core {

namespace {

// Float accumulation of per-frame dt must not miss a timer by one frame
constexpr float TIMER_EPSILON = 1e-5f;
constexpr float RAD_TO_DEG = 57.29577951f;
constexpr uint64_t REJECT_LOG_INTERVAL = 100;

bool isFinite(const Point3D& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

const ClassifierConfig& validated(const ClassifierConfig& config) {
    config.validate();
    return config;
}

} // namespace

PostureClassifier::PostureClassifier(const ClassifierConfig& config)
    : config_(validated(config)),
      quality_(config_),
      controllers_(config_),
      velocityFilter_(config_.smoothingFactor) {
    baseline_.standingHeight = config_.standingHeight;
    baseline_.calibrated = false;
    reset();
}

void PostureClassifier::reset() {
    // A running dodge or cooldown is closed so subscribers see the end event
    if (state_.phase == PosturePhase::Dodging) {
        Logger::info("PostureClassifier: reset ends dodge early");
        emit(PostureEventType::DodgeEnded);
    } else if (state_.phase == PosturePhase::Cooldown) {
        emit(PostureEventType::CooldownEnded);
    }

    const ControllerMetrics controllers = state_.controllers;
    state_ = PostureState{};
    state_.baselineHeight = baseline_.standingHeight;
    state_.controllers = controllers;

    lastError_ = PostureError::None;
    hasPreviousHeight_ = false;
    velocityFilter_.reset(0.0f);

    armed_ = true;
    dodgeElapsed_ = 0.0f;
    cooldownElapsed_ = 0.0f;

    descending_ = false;
    descentElapsed_ = 0.0f;
    descentTime_ = 0.0f;
    perfectReported_ = false;
    peakDepthNorm_ = 0.0f;
    peakQuality_ = 0.0f;
    lastReportedDepth_ = 0.0f;

    recalibrating_ = false;
}

const char* PostureClassifier::phaseName(PosturePhase phase) {
    switch (phase) {
        case PosturePhase::Idle:          return "IDLE";
        case PosturePhase::InBottomDwell: return "IN_BOTTOM_DWELL";
        case PosturePhase::Dodging:       return "DODGING";
        case PosturePhase::Cooldown:      return "COOLDOWN";
        default: return "unknown";
    }
}

const char* PostureClassifier::eventName(PostureEventType type) {
    switch (type) {
        case PostureEventType::DodgeStarted:         return "DODGE_STARTED";
        case PostureEventType::DodgeEnded:           return "DODGE_ENDED";
        case PostureEventType::CooldownStarted:      return "COOLDOWN_STARTED";
        case PostureEventType::CooldownEnded:        return "COOLDOWN_ENDED";
        case PostureEventType::SquatDepthChanged:    return "SQUAT_DEPTH_CHANGED";
        case PostureEventType::PerfectSquatDetected: return "PERFECT_SQUAT";
        case PostureEventType::ValidSquatCompleted:  return "VALID_SQUAT";
        case PostureEventType::Calibrated:           return "CALIBRATED";
        default: return "unknown";
    }
}

const char* PostureClassifier::errorName(PostureError error) {
    switch (error) {
        case PostureError::None:             return "none";
        case PostureError::InputError:       return "input_error";
        case PostureError::CalibrationError: return "calibration_error";
        default: return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Calibration
// ═══════════════════════════════════════════════════════════════════════════

PostureError PostureClassifier::calibrateStandingHeight(float headHeight) {
    if (!std::isfinite(headHeight) ||
        headHeight < config_.minCalibrationHeight ||
        headHeight > config_.maxCalibrationHeight) {
        Logger::warn("PostureClassifier: rejected standing height ", headHeight,
                     "m (plausible ", config_.minCalibrationHeight, "-", config_.maxCalibrationHeight,
                     "m), keeping ", baseline_.standingHeight, "m");
        lastError_ = PostureError::CalibrationError;
        return lastError_;
    }

    baseline_.standingHeight = headHeight;
    baseline_.calibrated = true;
    state_.baselineHeight = headHeight;

    // Velocity restarts from rest at the new baseline
    previousHeight_ = headHeight;
    hasPreviousHeight_ = true;
    velocityFilter_.reset(0.0f);

    controllers_.captureReference();
    state_.controllers = controllers_.metrics();

    lastError_ = PostureError::None;
    Logger::info("PostureClassifier: standing height calibrated to ", headHeight, "m");
    emit(PostureEventType::Calibrated, headHeight);
    return lastError_;
}

PostureError PostureClassifier::beginRecalibration(float sampleSeconds) {
    if (!std::isfinite(sampleSeconds) || sampleSeconds <= 0.0f) {
        Logger::warn("PostureClassifier: invalid recalibration window ", sampleSeconds, "s");
        lastError_ = PostureError::CalibrationError;
        return lastError_;
    }

    recalibrating_ = true;
    recalWindow_ = sampleSeconds;
    recalElapsed_ = 0.0f;
    recalSum_ = 0.0;
    recalCount_ = 0;
    Logger::info("PostureClassifier: recalibrating over ", sampleSeconds, "s");
    return PostureError::None;
}

void PostureClassifier::advanceRecalibration(float headHeight, float deltaTime) {
    if (!recalibrating_) return;

    recalSum_ += headHeight;
    recalCount_++;
    recalElapsed_ += deltaTime;

    if (recalElapsed_ + TIMER_EPSILON < recalWindow_) return;

    recalibrating_ = false;
    const float mean = static_cast<float>(recalSum_ / recalCount_);
    if (calibrateStandingHeight(mean) != PostureError::None) {
        Logger::warn("PostureClassifier: recalibration over ", recalCount_, " samples failed");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Per-frame update
// ═══════════════════════════════════════════════════════════════════════════

const PostureState& PostureClassifier::tick(const PoseSample& sample, float deltaTime) {
    if (!std::isfinite(deltaTime) || deltaTime <= 0.0f) {
        return state_;
    }
    if (!isFinite(sample.head)) {
        rejectSample("non-finite head position");
        return state_;
    }
    if (sample.hasControllers && (!isFinite(sample.leftController) || !isFinite(sample.rightController))) {
        rejectSample("non-finite controller position");
        return state_;
    }

    lastError_ = PostureError::None;
    now_ = sample.timestamp;

    const float headHeight = sample.headHeight();
    const float previousDepth = state_.currentDepth;

    // 1. Depth
    const float depth = std::max(0.0f, baseline_.standingHeight - headHeight);
    state_.currentDepth = depth;
    state_.currentDepthNorm = std::clamp(depth / config_.maxDepthReference, 0.0f, 1.0f);

    // 2. Velocity (EWMA of the per-frame derivative)
    // No previous height after construction or reset: the first derivative is zero
    const float prevHeight = hasPreviousHeight_ ? previousHeight_ : headHeight;
    state_.velocity = velocityFilter_.filter((headHeight - prevHeight) / deltaTime);
    previousHeight_ = headHeight;
    hasPreviousHeight_ = true;

    state_.headPosition = sample.head;
    state_.baselineHeight = baseline_.standingHeight;
    state_.tickCount++;
    state_.lastTimestamp = sample.timestamp;

    if (sample.hasControllers && controllers_.update(sample.leftController, sample.rightController)) {
        state_.controllers = controllers_.metrics();
    }

    // 3. Bottom band, dwell, quality
    updateBottom(depth, previousDepth, deltaTime);
    updateQuality();
    updateBodyEstimate(sample);

    const float epsilon = config_.depthChangeEpsilon;
    if (depth != lastReportedDepth_ && std::abs(depth - lastReportedDepth_) >= epsilon) {
        lastReportedDepth_ = depth;
        emit(PostureEventType::SquatDepthChanged, depth);
    }

    // 4. State machine
    advancePhase(deltaTime);

    // Baseline changes apply from the next tick on
    advanceRecalibration(headHeight, deltaTime);

    return state_;
}

void PostureClassifier::rejectSample(const char* reason) {
    lastError_ = PostureError::InputError;
    rejectedSamples_++;
    if (rejectedSamples_ % REJECT_LOG_INTERVAL == 1) {
        Logger::warn("PostureClassifier: rejected sample (", reason, "), total rejected=", rejectedSamples_);
    }
}

void PostureClassifier::updateBottom(float depth, float previousDepth, float deltaTime) {
    const bool wasInBottom = state_.isInBottom;

    // Hysteresis: enter at the threshold, leave only below threshold - gap
    const bool inBottom = wasInBottom
        ? depth >= config_.squatThreshold - config_.bottomExitHysteresis
        : depth >= config_.squatThreshold;

    if (inBottom && !wasInBottom) {
        // Bottom entry: freeze the descent time for the tempo score
        if (descending_) {
            descentTime_ = descentElapsed_ + deltaTime;
        } else if (previousDepth <= config_.descentStartDepth) {
            descentTime_ = deltaTime;   // Standing to bottom within one frame
        } else {
            descentTime_ = 0.0f;        // Re-dip without standing up first
        }
        descending_ = false;
        descentElapsed_ = 0.0f;

        state_.dwellTime = 0.0f;
        perfectReported_ = false;
        peakDepthNorm_ = 0.0f;
        peakQuality_ = 0.0f;
        Logger::debug("PostureClassifier: bottom entered, descent=", descentTime_, "s");
    } else if (inBottom) {
        state_.dwellTime += deltaTime;
    } else {
        if (wasInBottom) {
            const float dwell = state_.dwellTime;
            if (dwell >= config_.dwellMin && dwell <= config_.dwellMax &&
                quality_.isValid(peakQuality_)) {
                emit(PostureEventType::ValidSquatCompleted, peakDepthNorm_, peakQuality_);
            }
            Logger::debug("PostureClassifier: bottom left after ", dwell, "s, peak quality=", peakQuality_);
        }
        state_.dwellTime = 0.0f;

        // Descent timer starts on the upward crossing of the start depth
        if (depth <= config_.descentStartDepth) {
            descending_ = false;
            descentElapsed_ = 0.0f;
        } else if (!descending_ && previousDepth <= config_.descentStartDepth) {
            descending_ = true;
            descentElapsed_ = 0.0f;
        } else if (descending_) {
            descentElapsed_ += deltaTime;
        }
    }

    state_.isInBottom = inBottom;
}

void PostureClassifier::updateQuality() {
    const SquatQuality::Scores scores = quality_.evaluate(
        state_.currentDepthNorm, descentTime_, state_.velocity, state_.isInBottom);

    state_.depthScore = scores.depth;
    state_.tempoScore = scores.tempo;
    state_.stabilityScore = scores.stability;
    state_.qualityScore = scores.composite;
    state_.isValidSquatForm = state_.isInBottom && quality_.isValid(scores.composite);

    if (!state_.isInBottom) return;

    peakDepthNorm_ = std::max(peakDepthNorm_, state_.currentDepthNorm);
    peakQuality_ = std::max(peakQuality_, scores.composite);

    if (!perfectReported_ && quality_.isPerfect(scores.composite)) {
        perfectReported_ = true;
        Logger::info("PostureClassifier: perfect squat (quality=", scores.composite,
                     " depth=", scores.depth, " tempo=", scores.tempo,
                     " stability=", scores.stability, ")");
        emit(PostureEventType::PerfectSquatDetected, state_.currentDepthNorm, scores.composite);
    }
}

void PostureClassifier::updateBodyEstimate(const PoseSample& sample) {
    // Two equal leg segments: hip-to-ankle = legLength * sin(knee / 2)
    const float standingHip = baseline_.standingHeight * HIP_HEIGHT_RATIO;
    const float ratio = std::clamp((standingHip - state_.currentDepth) / standingHip, 0.0f, 1.0f);
    state_.estimatedKneeAngle = 2.0f * std::asin(ratio) * RAD_TO_DEG;

    state_.estimatedHipPosition = sample.head;
    state_.estimatedHipPosition.y = sample.head.y - (baseline_.standingHeight - standingHip);
}

void PostureClassifier::advancePhase(float deltaTime) {
    if (state_.phase == PosturePhase::Dodging) {
        dodgeElapsed_ += deltaTime;
        if (dodgeElapsed_ + TIMER_EPSILON >= config_.dodgeDuration) {
            transitionTo(PosturePhase::Cooldown);
        }
    } else if (state_.phase == PosturePhase::Cooldown) {
        cooldownElapsed_ += deltaTime;
        if (cooldownElapsed_ + TIMER_EPSILON >= config_.cooldownDuration) {
            transitionTo(PosturePhase::Idle);
        }
    }

    if (state_.phase != PosturePhase::Idle && state_.phase != PosturePhase::InBottomDwell) {
        return;
    }

    if (!state_.isInBottom) {
        if (state_.phase == PosturePhase::InBottomDwell) {
            transitionTo(PosturePhase::Idle);
        }
        armed_ = true;
        return;
    }

    if (!armed_) return;

    if (state_.phase == PosturePhase::Idle) {
        transitionTo(PosturePhase::InBottomDwell);
    }
    if (state_.dwellTime + TIMER_EPSILON >= config_.dodgeTriggerDwell) {
        transitionTo(PosturePhase::Dodging);
    }
}

void PostureClassifier::transitionTo(PosturePhase newPhase) {
    const PosturePhase oldPhase = state_.phase;
    state_.phase = newPhase;
    state_.isDodging = newPhase == PosturePhase::Dodging;
    state_.isOnCooldown = newPhase == PosturePhase::Cooldown;

    Logger::info("PostureClassifier: ", phaseName(oldPhase), " → ", phaseName(newPhase),
                 " (depth=", state_.currentDepth, "m)");

    switch (newPhase) {
        case PosturePhase::Dodging:
            armed_ = false;
            dodgeElapsed_ = 0.0f;
            emit(PostureEventType::DodgeStarted, state_.currentDepth);
            break;
        case PosturePhase::Cooldown:
            cooldownElapsed_ = 0.0f;
            emit(PostureEventType::DodgeEnded);
            emit(PostureEventType::CooldownStarted);
            break;
        case PosturePhase::Idle:
            if (oldPhase == PosturePhase::Cooldown) {
                emit(PostureEventType::CooldownEnded);
            }
            break;
        case PosturePhase::InBottomDwell:
            break;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Subscriptions
// ═══════════════════════════════════════════════════════════════════════════

PostureClassifier::SubscriptionId PostureClassifier::addEventCallback(EventCallback callback) {
    const SubscriptionId id = nextSubscriptionId_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

bool PostureClassifier::removeEventCallback(SubscriptionId id) {
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == callbacks_.end()) return false;
    callbacks_.erase(it);
    return true;
}

void PostureClassifier::emit(PostureEventType type, float value, float quality) {
    PostureEvent event;
    event.type = type;
    event.value = value;
    event.quality = quality;
    event.timestamp = now_;

    // Snapshot: a callback may unsubscribe while we dispatch
    const auto callbacks = callbacks_;
    for (const auto& [id, callback] : callbacks) {
        if (!callback) continue;
        try {
            callback(event);
        } catch (const std::exception& e) {
            Logger::error("PostureClassifier: subscriber ", id, " threw on ", eventName(type), ": ", e.what());
        }
    }
}

} // namespace core
