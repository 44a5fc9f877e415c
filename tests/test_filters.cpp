// Unit tests for the EWMA and Kalman filters
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "math/Filters.hpp"

using Catch::Approx;

TEST_CASE("EwmaFilter seeds from the first sample", "[filters][ewma]") {
    math::EwmaFilter f(0.2f);
    CHECK_FALSE(f.initialized());

    CHECK(f.filter(5.0f) == Approx(5.0f));
    CHECK(f.initialized());

    // 5 + 0.2 * (10 - 5)
    CHECK(f.filter(10.0f) == Approx(6.0f));
}

TEST_CASE("EwmaFilter reset", "[filters][ewma]") {
    math::EwmaFilter f(0.5f);
    f.filter(4.0f);

    SECTION("reset() forgets the average") {
        f.reset();
        CHECK_FALSE(f.initialized());
        CHECK(f.filter(-2.0f) == Approx(-2.0f));
    }

    SECTION("reset(seed) starts from the seed") {
        f.reset(0.0f);
        CHECK(f.initialized());
        CHECK(f.filter(2.0f) == Approx(1.0f));
    }
}

TEST_CASE("KalmanFilter converges towards a constant measurement", "[filters][kalman]") {
    math::KalmanFilter k;
    auto first = k.update(1.0f, 2.0f, 3.0f);
    CHECK(first.x == Approx(1.0f));
    CHECK(first.y == Approx(2.0f));
    CHECK(first.z == Approx(3.0f));

    math::KalmanFilter::Point3f est{};
    for (int i = 0; i < 200; ++i) {
        est = k.update(2.0f, 2.0f, 3.0f);
    }
    CHECK(est.x == Approx(2.0f).margin(0.01));
    CHECK(est.y == Approx(2.0f).margin(0.01));

    // One noisy spike moves the estimate only part of the way
    est = k.update(3.0f, 2.0f, 3.0f);
    CHECK(est.x > 2.0f);
    CHECK(est.x < 3.0f);

    k.reset();
    CHECK_FALSE(k.initialized());
}
