// Unit tests for configuration validation and YAML / JSON loading
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include "core/PostureConfig.hpp"

using Catch::Approx;
namespace fs = std::filesystem;

// Helper: write a temporary config file and return its path.
// The file is deleted when the returned guard goes out of scope.
struct TmpFile {
    fs::path path;
    TmpFile(const std::string& content, const std::string& extension) {
        path = fs::temp_directory_path() /
               ("posture_test_" + std::to_string(reinterpret_cast<uintptr_t>(this)) + extension);
        std::ofstream out(path);
        out << content;
    }
    ~TmpFile() { std::error_code ec; fs::remove(path, ec); }
    TmpFile(const TmpFile&) = delete;
    TmpFile& operator=(const TmpFile&) = delete;
};

// ---- Validation ----

TEST_CASE("Default configuration is valid", "[config]") {
    core::ClassifierConfig c;
    CHECK_NOTHROW(c.validate());
    CHECK(c.squatThreshold == Approx(0.30f));
    CHECK(c.dodgeDuration == Approx(0.5f));
    CHECK(c.cooldownDuration == Approx(0.2f));
    CHECK(c.smoothingFactor == Approx(0.2f));

    core::ServiceConfig s;
    CHECK_NOTHROW(s.validate());
    CHECK(s.listenPort == "9001");
    CHECK(s.targetPort == "9000");
}

TEST_CASE("Out-of-range classifier parameters are rejected", "[config]") {
    core::ClassifierConfig c;

    SECTION("negative dodge duration") { c.dodgeDuration = -0.5f; }
    SECTION("zero dodge duration") { c.dodgeDuration = 0.0f; }
    SECTION("negative cooldown") { c.cooldownDuration = -0.1f; }
    SECTION("smoothing factor of 1") { c.smoothingFactor = 1.0f; }
    SECTION("smoothing factor of 0") { c.smoothingFactor = 0.0f; }
    SECTION("non-positive squat threshold") { c.squatThreshold = 0.0f; }
    SECTION("hysteresis wider than the threshold") { c.bottomExitHysteresis = 0.4f; }
    SECTION("valid threshold above perfect") { c.validSquatThreshold = 0.9f; }
    SECTION("inverted tempo window") { c.tempoWindowMin = 2.0f; }
    SECTION("inverted dwell window") { c.dwellMin = 2.0f; }
    SECTION("standing height outside calibration range") { c.standingHeight = 3.0f; }
    SECTION("zero forward axis") { c.forwardAxis = {0.0f, 0.0f, 0.0f}; }
    SECTION("NaN parameter") { c.maxDepthReference = std::numeric_limits<float>::quiet_NaN(); }

    CHECK_THROWS_AS(c.validate(), core::ConfigurationError);
}

TEST_CASE("Out-of-range service parameters are rejected", "[config]") {
    core::ServiceConfig s;

    SECTION("unknown log level") { s.logLevel = "verbose"; }
    SECTION("empty listen port") { s.listenPort.clear(); }
    SECTION("zero rate") { s.nominalRateHz = 0.0f; }
    SECTION("zero latency budget") { s.maxLatencyMs = 0; }

    CHECK_THROWS_AS(s.validate(), core::ConfigurationError);
}

// ---- Loading ----

TEST_CASE("YAML partial load keeps defaults", "[config][yaml]") {
    auto config = core::loadConfigFromString(R"(%YAML:1.0
---
classifier:
  squat_threshold: 0.25
  dodge_duration: 0.75
  forward_axis: [ 0, 0, -1 ]
service:
  listen_port: 9100
  log_level: debug
)");

    CHECK(config.classifier.squatThreshold == Approx(0.25f));
    CHECK(config.classifier.dodgeDuration == Approx(0.75f));
    CHECK(config.classifier.forwardAxis.z == Approx(-1.0f));
    CHECK(config.classifier.cooldownDuration == Approx(0.2f));

    // Unquoted port numbers are accepted
    CHECK(config.service.listenPort == "9100");
    CHECK(config.service.logLevel == "debug");
    CHECK(config.service.targetHost == "127.0.0.1");
}

TEST_CASE("JSON load", "[config][json]") {
    auto config = core::loadConfigFromString(R"({
    "classifier": { "cooldown_duration": 0.4, "perfect_squat_threshold": 0.9 },
    "service": { "target_host": "10.0.0.5", "max_latency_ms": 80 }
})");

    CHECK(config.classifier.cooldownDuration == Approx(0.4f));
    CHECK(config.classifier.perfectSquatThreshold == Approx(0.9f));
    CHECK(config.service.targetHost == "10.0.0.5");
    CHECK(config.service.maxLatencyMs == 80);
}

TEST_CASE("Loaded values are validated", "[config][yaml]") {
    CHECK_THROWS_AS(core::loadConfigFromString(R"(%YAML:1.0
---
classifier:
  dodge_duration: -1.0
)"), core::ConfigurationError);

    CHECK_THROWS_AS(core::loadConfigFromString(R"(%YAML:1.0
---
classifier:
  squat_threshold: deep
)"), core::ConfigurationError);

    CHECK_THROWS_AS(core::loadConfigFromString(R"(%YAML:1.0
---
classifier:
  forward_axis: [ 0, 1 ]
)"), core::ConfigurationError);
}

TEST_CASE("Config file on disk", "[config][yaml]") {
    SECTION("YAML file") {
        TmpFile tmp(R"(%YAML:1.0
---
classifier:
  standing_height: 1.80
service:
  target_port: "9500"
)", ".yaml");
        auto config = core::loadConfig(tmp.path.string());
        CHECK(config.classifier.standingHeight == Approx(1.80f));
        CHECK(config.service.targetPort == "9500");
    }

    SECTION("JSON file") {
        TmpFile tmp(R"({ "classifier": { "dwell_max": 2.0 } })", ".json");
        auto config = core::loadConfig(tmp.path.string());
        CHECK(config.classifier.dwellMax == Approx(2.0f));
    }

    SECTION("missing file") {
        CHECK_THROWS_AS(core::loadConfig("/nonexistent/posture.yaml"), core::ConfigurationError);
    }
}
