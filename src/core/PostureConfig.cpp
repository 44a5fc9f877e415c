#include "core/PostureConfig.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <utility>
#include <opencv2/core/persistence.hpp>

namespace core {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

void requireFinite(float value, const char* name) {
    require(std::isfinite(value), std::string(name) + " must be finite");
}

// ───────────────────────────────────────────────────────────
// FileNode readers: absent keys leave `out` untouched
// ───────────────────────────────────────────────────────────

void readFloat(const cv::FileNode& parent, const char* key, float& out) {
    cv::FileNode node = parent[key];
    if (node.empty() || node.isNone()) return;
    require(node.isReal() || node.isInt(), std::string("'") + key + "' must be a number");
    out = static_cast<float>(node.real());
}

void readInt(const cv::FileNode& parent, const char* key, int& out) {
    cv::FileNode node = parent[key];
    if (node.empty() || node.isNone()) return;
    require(node.isInt(), std::string("'") + key + "' must be an integer");
    out = static_cast<int>(node);
}

void readString(const cv::FileNode& parent, const char* key, std::string& out) {
    cv::FileNode node = parent[key];
    if (node.empty() || node.isNone()) return;
    if (node.isInt()) {
        // Ports are commonly written unquoted
        out = std::to_string(static_cast<int>(node));
        return;
    }
    require(node.isString(), std::string("'") + key + "' must be a string");
    out = node.string();
}

void readPoint(const cv::FileNode& parent, const char* key, Point3D& out) {
    cv::FileNode node = parent[key];
    if (node.empty() || node.isNone()) return;
    require(node.isSeq() && node.size() == 3, std::string("'") + key + "' must be a list of 3 numbers");
    for (int i = 0; i < 3; ++i) {
        require(node[i].isReal() || node[i].isInt(), std::string("'") + key + "' must be a list of 3 numbers");
    }
    out.x = static_cast<float>(node[0].real());
    out.y = static_cast<float>(node[1].real());
    out.z = static_cast<float>(node[2].real());
}

void readClassifier(const cv::FileNode& node, ClassifierConfig& c) {
    readFloat(node, "standing_height", c.standingHeight);
    readFloat(node, "squat_threshold", c.squatThreshold);
    readFloat(node, "bottom_exit_hysteresis", c.bottomExitHysteresis);
    readFloat(node, "max_depth_reference", c.maxDepthReference);
    readFloat(node, "smoothing_factor", c.smoothingFactor);
    readFloat(node, "depth_change_epsilon", c.depthChangeEpsilon);
    readFloat(node, "dodge_duration", c.dodgeDuration);
    readFloat(node, "cooldown_duration", c.cooldownDuration);
    readFloat(node, "dodge_trigger_dwell", c.dodgeTriggerDwell);
    readFloat(node, "perfect_squat_threshold", c.perfectSquatThreshold);
    readFloat(node, "valid_squat_threshold", c.validSquatThreshold);
    readFloat(node, "tempo_window_min", c.tempoWindowMin);
    readFloat(node, "tempo_window_max", c.tempoWindowMax);
    readFloat(node, "descent_start_depth", c.descentStartDepth);
    readFloat(node, "stability_velocity_limit", c.stabilityVelocityLimit);
    readFloat(node, "dwell_min", c.dwellMin);
    readFloat(node, "dwell_max", c.dwellMax);
    readFloat(node, "min_calibration_height", c.minCalibrationHeight);
    readFloat(node, "max_calibration_height", c.maxCalibrationHeight);
    readFloat(node, "controller_movement_threshold", c.controllerMovementThreshold);
    readPoint(node, "forward_axis", c.forwardAxis);
}

void readService(const cv::FileNode& node, ServiceConfig& s) {
    readString(node, "listen_port", s.listenPort);
    readString(node, "target_host", s.targetHost);
    readString(node, "target_port", s.targetPort);
    readString(node, "log_level", s.logLevel);
    readFloat(node, "nominal_rate_hz", s.nominalRateHz);
    readInt(node, "max_latency_ms", s.maxLatencyMs);
    readFloat(node, "stats_interval_s", s.statsIntervalS);
}

AppConfig readDocument(cv::FileStorage& fs) {
    AppConfig config;

    cv::FileNode classifier = fs["classifier"];
    if (!classifier.empty()) {
        require(classifier.isMap(), "'classifier' must be a map");
        readClassifier(classifier, config.classifier);
    }

    cv::FileNode service = fs["service"];
    if (!service.empty()) {
        require(service.isMap(), "'service' must be a map");
        readService(service, config.service);
    }

    config.classifier.validate();
    config.service.validate();
    return config;
}

AppConfig openAndRead(const std::string& source, int flags, const std::string& label) {
    try {
        cv::FileStorage fs(source, flags);
        require(fs.isOpened(), "Cannot open config " + label);
        return readDocument(fs);
    } catch (const cv::Exception& e) {
        throw ConfigurationError("Malformed config " + label + ": " + e.what());
    }
}

} // namespace

void ClassifierConfig::validate() const {
    const std::pair<float, const char*> fields[] = {
        {standingHeight, "standingHeight"},
        {squatThreshold, "squatThreshold"},
        {bottomExitHysteresis, "bottomExitHysteresis"},
        {maxDepthReference, "maxDepthReference"},
        {smoothingFactor, "smoothingFactor"},
        {depthChangeEpsilon, "depthChangeEpsilon"},
        {dodgeDuration, "dodgeDuration"},
        {cooldownDuration, "cooldownDuration"},
        {dodgeTriggerDwell, "dodgeTriggerDwell"},
        {perfectSquatThreshold, "perfectSquatThreshold"},
        {validSquatThreshold, "validSquatThreshold"},
        {tempoWindowMin, "tempoWindowMin"},
        {tempoWindowMax, "tempoWindowMax"},
        {descentStartDepth, "descentStartDepth"},
        {stabilityVelocityLimit, "stabilityVelocityLimit"},
        {dwellMin, "dwellMin"},
        {dwellMax, "dwellMax"},
        {minCalibrationHeight, "minCalibrationHeight"},
        {maxCalibrationHeight, "maxCalibrationHeight"},
        {controllerMovementThreshold, "controllerMovementThreshold"},
        {forwardAxis.x, "forwardAxis.x"},
        {forwardAxis.y, "forwardAxis.y"},
        {forwardAxis.z, "forwardAxis.z"},
    };
    for (const auto& [value, name] : fields) {
        requireFinite(value, name);
    }

    require(squatThreshold > 0.0f, "squatThreshold must be > 0");
    require(bottomExitHysteresis >= 0.0f && bottomExitHysteresis < squatThreshold,
            "bottomExitHysteresis must be in [0, squatThreshold)");
    require(maxDepthReference > 0.0f, "maxDepthReference must be > 0");
    require(smoothingFactor > 0.0f && smoothingFactor < 1.0f, "smoothingFactor must be in (0, 1)");
    require(depthChangeEpsilon >= 0.0f, "depthChangeEpsilon must be >= 0");

    require(dodgeDuration > 0.0f, "dodgeDuration must be > 0");
    require(cooldownDuration >= 0.0f, "cooldownDuration must be >= 0");
    require(dodgeTriggerDwell >= 0.0f, "dodgeTriggerDwell must be >= 0");

    require(perfectSquatThreshold > 0.0f && perfectSquatThreshold <= 1.0f,
            "perfectSquatThreshold must be in (0, 1]");
    require(validSquatThreshold >= 0.0f && validSquatThreshold <= perfectSquatThreshold,
            "validSquatThreshold must be in [0, perfectSquatThreshold]");
    require(tempoWindowMin > 0.0f && tempoWindowMin <= tempoWindowMax,
            "tempo window must satisfy 0 < min <= max");
    require(descentStartDepth >= 0.0f && descentStartDepth < squatThreshold,
            "descentStartDepth must be in [0, squatThreshold)");
    require(stabilityVelocityLimit > 0.0f, "stabilityVelocityLimit must be > 0");
    require(dwellMin >= 0.0f && dwellMin <= dwellMax, "dwell window must satisfy 0 <= min <= max");

    require(minCalibrationHeight > 0.0f && minCalibrationHeight < maxCalibrationHeight,
            "calibration range must satisfy 0 < min < max");
    require(standingHeight >= minCalibrationHeight && standingHeight <= maxCalibrationHeight,
            "standingHeight must lie inside the calibration range");

    require(controllerMovementThreshold > 0.0f, "controllerMovementThreshold must be > 0");
    const float axisLength = std::sqrt(forwardAxis.x * forwardAxis.x +
                                       forwardAxis.y * forwardAxis.y +
                                       forwardAxis.z * forwardAxis.z);
    require(axisLength > 1e-3f, "forwardAxis must be non-zero");
}

void ServiceConfig::validate() const {
    require(!listenPort.empty(), "listen_port must not be empty");
    require(!targetHost.empty(), "target_host must not be empty");
    require(!targetPort.empty(), "target_port must not be empty");

    LogLevel level;
    require(Logger::parseLevel(logLevel, level), "log_level must be one of debug/info/warn/error");

    require(std::isfinite(nominalRateHz) && nominalRateHz > 0.0f, "nominal_rate_hz must be > 0");
    require(maxLatencyMs > 0, "max_latency_ms must be > 0");
    require(std::isfinite(statsIntervalS) && statsIntervalS > 0.0f, "stats_interval_s must be > 0");
}

AppConfig loadConfig(const std::string& path) {
    AppConfig config = openAndRead(path, cv::FileStorage::READ, "'" + path + "'");
    Logger::info("Config loaded from ", path);
    return config;
}

AppConfig loadConfigFromString(const std::string& content) {
    return openAndRead(content, cv::FileStorage::READ | cv::FileStorage::MEMORY, "<memory>");
}

} // namespace core
