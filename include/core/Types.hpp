#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <vector>
#include "SpscQueue.hpp"

namespace core {

// ============================================================
// Posture Defaults - Squat Dodge Configuration
// ============================================================

// Calibration
constexpr float DEFAULT_STANDING_HEIGHT = 1.7f;    // m, used until first calibration
constexpr float MIN_CALIBRATION_HEIGHT = 0.5f;     // m, below = tracking glitch
constexpr float MAX_CALIBRATION_HEIGHT = 2.5f;     // m

// Squat detection
constexpr float DEFAULT_SQUAT_THRESHOLD = 0.30f;   // m below baseline
constexpr float DEFAULT_BOTTOM_EXIT_HYSTERESIS = 0.05f; // m - exit is deeper-minus-gap
constexpr float DEFAULT_MAX_DEPTH_REFERENCE = 0.50f;    // m = depthNorm 1.0
constexpr float DEFAULT_SMOOTHING_FACTOR = 0.2f;   // velocity EWMA alpha
constexpr float DEFAULT_DEPTH_CHANGE_EPSILON = 0.005f;  // m

// Dodge timing
constexpr float DEFAULT_DODGE_DURATION = 0.5f;     // s
constexpr float DEFAULT_COOLDOWN_DURATION = 0.2f;  // s
constexpr float DEFAULT_DODGE_TRIGGER_DWELL = 0.0f; // s, 0 = trigger on bottom entry

// Quality assessment (depth 50%, tempo 25%, stability 25%)
constexpr float QUALITY_WEIGHT_DEPTH = 0.50f;
constexpr float QUALITY_WEIGHT_TEMPO = 0.25f;
constexpr float QUALITY_WEIGHT_STABILITY = 0.25f;
constexpr float DEFAULT_PERFECT_SQUAT_THRESHOLD = 0.85f;
constexpr float DEFAULT_VALID_SQUAT_THRESHOLD = 0.60f;
constexpr float DEFAULT_TEMPO_WINDOW_MIN = 0.4f;   // s of descent
constexpr float DEFAULT_TEMPO_WINDOW_MAX = 1.5f;   // s of descent
constexpr float DEFAULT_DESCENT_START_DEPTH = 0.05f; // m
constexpr float DEFAULT_STABILITY_VELOCITY_LIMIT = 0.5f; // m/s = stability 0
constexpr float DEFAULT_DWELL_MIN = 0.3f;          // s, completed rep window
constexpr float DEFAULT_DWELL_MAX = 1.2f;          // s

// Controllers
constexpr float DEFAULT_CONTROLLER_MOVEMENT_THRESHOLD = 0.15f; // m

// Body pose estimate
constexpr float HIP_HEIGHT_RATIO = 0.53f;          // standing hip height / standing head height

// Service
constexpr int INPUT_QUEUE_SIZE = 256;
constexpr int OUTPUT_QUEUE_SIZE = 256;
constexpr float NOMINAL_RATE_HZ = 72.0f;           // Quest-class headset refresh
constexpr int MAX_STATE_LATENCY_MS = 50;

// ============================================================
// Data Structures
// ============================================================

struct Point3D {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * One tracking snapshot from the engine.
 * y is up; heights are meters above the tracking floor.
 */
struct PoseSample {
    Point3D head;
    Point3D leftController;
    Point3D rightController;
    double timestamp = 0.0;       // seconds, host clock
    bool hasControllers = true;

    float headHeight() const { return head.y; }
};

enum class PosturePhase {
    Idle = 0,
    InBottomDwell = 1,
    Dodging = 2,
    Cooldown = 3
};

enum class PostureError {
    None = 0,
    InputError,        // Non-finite pose sample
    CalibrationError   // Implausible standing height
};

enum class PostureEventType {
    DodgeStarted = 0,
    DodgeEnded = 1,
    CooldownStarted = 2,
    CooldownEnded = 3,
    SquatDepthChanged = 4,    // value = depth (m)
    PerfectSquatDetected = 5, // quality = composite score
    ValidSquatCompleted = 6,  // value = peak depthNorm, quality = peak score
    Calibrated = 7            // value = standing height (m)
};

struct PostureEvent {
    PostureEventType type = PostureEventType::SquatDepthChanged;
    float value = 0.0f;
    float quality = 0.0f;
    double timestamp = 0.0;
};

struct BaselineCalibration {
    float standingHeight = DEFAULT_STANDING_HEIGHT;
    bool calibrated = false;
};

struct ControllerMetrics {
    Point3D leftPosition;
    Point3D rightPosition;
    float leftForwardMovement = 0.0f;
    float rightForwardMovement = 0.0f;
    float combinedMovement = 0.0f;
    float handHeightDiff = 0.0f;
    bool movementDetected = false;
};

struct PostureState {
    PosturePhase phase = PosturePhase::Idle;

    float currentDepth = 0.0f;      // m, >= 0
    float currentDepthNorm = 0.0f;  // 0..1
    float velocity = 0.0f;          // m/s, negative = descending

    bool isInBottom = false;
    float dwellTime = 0.0f;         // s

    bool isDodging = false;
    bool isOnCooldown = false;

    // Quality gate
    bool isValidSquatForm = false;
    float qualityScore = 0.0f;
    float depthScore = 0.0f;
    float tempoScore = 0.0f;
    float stabilityScore = 0.0f;

    // Diagnostics
    Point3D headPosition;
    float baselineHeight = DEFAULT_STANDING_HEIGHT;
    float estimatedKneeAngle = 180.0f;  // degrees, 180 = straight legs
    Point3D estimatedHipPosition;
    ControllerMetrics controllers;

    uint64_t tickCount = 0;
    double lastTimestamp = 0.0;
};

// ============================================================
// Service Messages
// ============================================================

struct InputMessage {
    enum class Kind {
        Sample,
        Calibrate,       // value = height, or last head height if !hasValue
        Recalibrate,     // value = sample window seconds
        Reset
    };

    Kind kind = Kind::Sample;
    PoseSample sample;
    float value = 0.0f;
    bool hasValue = false;
};

struct PostureUpdate {
    PostureState state;
    std::vector<PostureEvent> events;
    std::chrono::steady_clock::time_point timestamp;
};

// Type Aliases
using InputQueue = SpscQueue<InputMessage, INPUT_QUEUE_SIZE>;
using OutputQueue = SpscQueue<PostureUpdate, OUTPUT_QUEUE_SIZE>;

} // namespace core
