// Unit tests for controller forward-reach tracking
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

#include "core/ControllerTracker.hpp"

using Catch::Approx;

namespace {

void feed(core::ControllerTracker& t, const core::Point3D& left, const core::Point3D& right, int frames) {
    for (int i = 0; i < frames; ++i) {
        t.update(left, right);
    }
}

} // namespace

TEST_CASE("No movement is reported before a reference exists", "[controllers]") {
    core::ControllerTracker t{core::ClassifierConfig{}};
    feed(t, {-0.2f, 1.0f, 0.5f}, {0.2f, 1.0f, 0.5f}, 10);

    CHECK_FALSE(t.hasReference());
    CHECK(t.metrics().combinedMovement == Approx(0.0f));
    CHECK_FALSE(t.metrics().movementDetected);
}

TEST_CASE("captureReference before any sample is a no-op", "[controllers]") {
    core::ControllerTracker t{core::ClassifierConfig{}};
    t.captureReference();
    CHECK_FALSE(t.hasReference());
}

TEST_CASE("Forward reach along the configured axis", "[controllers]") {
    core::ControllerTracker t{core::ClassifierConfig{}};
    feed(t, {-0.2f, 1.0f, 0.0f}, {0.2f, 1.0f, 0.0f}, 5);
    t.captureReference();
    REQUIRE(t.hasReference());

    SECTION("pushing both hands forward is detected") {
        feed(t, {-0.2f, 1.0f, 0.4f}, {0.2f, 1.0f, 0.4f}, 300);
        const auto& m = t.metrics();
        CHECK(m.leftForwardMovement == Approx(0.4f).margin(0.01));
        CHECK(m.rightForwardMovement == Approx(0.4f).margin(0.01));
        CHECK(m.combinedMovement == Approx(0.4f).margin(0.01));
        CHECK(m.movementDetected);
    }

    SECTION("pulling back is clamped to zero") {
        feed(t, {-0.2f, 1.0f, -0.4f}, {0.2f, 1.0f, -0.4f}, 300);
        CHECK(t.metrics().combinedMovement == Approx(0.0f));
        CHECK_FALSE(t.metrics().movementDetected);
    }

    SECTION("one hand alone below threshold") {
        feed(t, {-0.2f, 1.0f, 0.2f}, {0.2f, 1.0f, 0.0f}, 300);
        CHECK(t.metrics().combinedMovement == Approx(0.1f).margin(0.01));
        CHECK_FALSE(t.metrics().movementDetected);
    }
}

TEST_CASE("Hand height difference and invalid input", "[controllers]") {
    core::ControllerTracker t{core::ClassifierConfig{}};
    CHECK(t.update({0.0f, 1.2f, 0.0f}, {0.0f, 0.9f, 0.0f}));
    CHECK(t.metrics().handHeightDiff == Approx(0.3f));

    const float nan = std::numeric_limits<float>::quiet_NaN();
    CHECK_FALSE(t.update({nan, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}));
    CHECK(t.metrics().handHeightDiff == Approx(0.3f));

    t.reset();
    CHECK_FALSE(t.hasReference());
    CHECK(t.metrics().handHeightDiff == Approx(0.0f));
}
