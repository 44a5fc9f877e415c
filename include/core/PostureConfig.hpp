#pragma once

#include <stdexcept>
#include <string>
#include "Types.hpp"

namespace core {

/**
 * Thrown for out-of-range configuration or an unreadable config file.
 * Indicates an integration mistake, not a runtime condition.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Tunables for PostureClassifier. Lengths in meters, times in seconds.
 */
struct ClassifierConfig {
    float standingHeight = DEFAULT_STANDING_HEIGHT;
    float squatThreshold = DEFAULT_SQUAT_THRESHOLD;
    float bottomExitHysteresis = DEFAULT_BOTTOM_EXIT_HYSTERESIS;
    float maxDepthReference = DEFAULT_MAX_DEPTH_REFERENCE;
    float smoothingFactor = DEFAULT_SMOOTHING_FACTOR;
    float depthChangeEpsilon = DEFAULT_DEPTH_CHANGE_EPSILON;

    float dodgeDuration = DEFAULT_DODGE_DURATION;
    float cooldownDuration = DEFAULT_COOLDOWN_DURATION;
    float dodgeTriggerDwell = DEFAULT_DODGE_TRIGGER_DWELL;

    float perfectSquatThreshold = DEFAULT_PERFECT_SQUAT_THRESHOLD;
    float validSquatThreshold = DEFAULT_VALID_SQUAT_THRESHOLD;
    float tempoWindowMin = DEFAULT_TEMPO_WINDOW_MIN;
    float tempoWindowMax = DEFAULT_TEMPO_WINDOW_MAX;
    float descentStartDepth = DEFAULT_DESCENT_START_DEPTH;
    float stabilityVelocityLimit = DEFAULT_STABILITY_VELOCITY_LIMIT;
    float dwellMin = DEFAULT_DWELL_MIN;
    float dwellMax = DEFAULT_DWELL_MAX;

    float minCalibrationHeight = MIN_CALIBRATION_HEIGHT;
    float maxCalibrationHeight = MAX_CALIBRATION_HEIGHT;

    float controllerMovementThreshold = DEFAULT_CONTROLLER_MOVEMENT_THRESHOLD;
    Point3D forwardAxis{0.0f, 0.0f, 1.0f};

    /**
     * Throws ConfigurationError naming the first offending field.
     */
    void validate() const;
};

struct ServiceConfig {
    std::string listenPort = "9001";
    std::string targetHost = "127.0.0.1";
    std::string targetPort = "9000";
    std::string logLevel = "info";
    float nominalRateHz = NOMINAL_RATE_HZ;
    int maxLatencyMs = MAX_STATE_LATENCY_MS;
    float statsIntervalS = 5.0f;

    void validate() const;
};

struct AppConfig {
    ClassifierConfig classifier;
    ServiceConfig service;
};

/**
 * Load a YAML or JSON config file (format chosen by OpenCV from the
 * extension). Missing keys keep their defaults; the result is validated.
 * @throws ConfigurationError
 */
AppConfig loadConfig(const std::string& path);

/**
 * Same as loadConfig, reading the document from memory.
 */
AppConfig loadConfigFromString(const std::string& content);

} // namespace core
