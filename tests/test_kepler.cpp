/// @file test_kepler.cpp
/// @brief Unit tests for the Kepler solver and orbit geometry helpers.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "orbit/kepler.hpp"

#include <cmath>

using namespace orrery;
using namespace orrery::orbit;

static constexpr f64 kTol = 1e-12;

// =================================================================
// normalize_angle
// =================================================================

TEST_CASE("normalize_angle maps into [0, 2pi)")
{
    CHECK(normalize_angle(0.0) == doctest::Approx(0.0));
    CHECK(normalize_angle(math_constants::kTwoPi + 1.0) == doctest::Approx(1.0).epsilon(kTol));
    CHECK(normalize_angle(-1.0) == doctest::Approx(math_constants::kTwoPi - 1.0).epsilon(kTol));
    CHECK(normalize_angle(-5.0 * math_constants::kTwoPi - 0.5)
          == doctest::Approx(math_constants::kTwoPi - 0.5).epsilon(1e-9));

    const f64 wrapped = normalize_angle(math_constants::kTwoPi);
    CHECK(wrapped >= 0.0);
    CHECK(wrapped < math_constants::kTwoPi);
}

// =================================================================
// solve_kepler / true_anomaly
// =================================================================

TEST_CASE("Circular orbit: E and nu equal M")
{
    for (f64 m = 0.0; m < math_constants::kTwoPi; m += 0.37)
    {
        const f64 E = solve_kepler(m, 0.0);
        CHECK(E == doctest::Approx(m).epsilon(kTol));
        CHECK(normalize_angle(true_anomaly(E, 0.0)) == doctest::Approx(m).epsilon(1e-9));
    }
}

TEST_CASE("solve_kepler is deterministic")
{
    CHECK(solve_kepler(1.234, 0.2) == solve_kepler(1.234, 0.2));
    CHECK(solve_kepler(5.0, 0.9) == solve_kepler(5.0, 0.9));
}

TEST_CASE("solve_kepler approximately satisfies Kepler's equation for small e")
{
    const f64 e = 0.1;
    const f64 m = 2.0;
    const f64 E = solve_kepler(m, e);
    CHECK(E - e * std::sin(E) == doctest::Approx(m).epsilon(1e-5));
}

TEST_CASE("Apsides: nu is 0 at M = 0 and pi at M = pi")
{
    CHECK(true_anomaly(solve_kepler(0.0, 0.5), 0.5) == doctest::Approx(0.0));
    CHECK(std::abs(true_anomaly(solve_kepler(math_constants::kPi, 0.5), 0.5))
          == doctest::Approx(math_constants::kPi).epsilon(1e-9));
}

// =================================================================
// orbital_radius / orbit_offset
// =================================================================

TEST_CASE("Orbital radius stays within periapsis and apoapsis")
{
    const f64 a = 120.0;
    for (f64 e : {0.0, 0.05, 0.3, 0.7, 0.95})
    {
        const f64 one_minus_e2 = 1.0 - e * e;
        for (f64 m = 0.0; m < math_constants::kTwoPi; m += 0.1)
        {
            const f64 nu = true_anomaly(solve_kepler(m, e), e);
            const f64 r = orbital_radius(a, one_minus_e2, e, nu);
            CHECK(r >= a * (1.0 - e) - 1e-9);
            CHECK(r <= a * (1.0 + e) + 1e-9);
        }
    }
}

TEST_CASE("orbit_offset is polar to cartesian")
{
    const Vec2d right = orbit_offset(10.0, 0.0);
    CHECK(right.x == doctest::Approx(10.0));
    CHECK(right.y == doctest::Approx(0.0));

    const Vec2d down = orbit_offset(4.0, math_constants::kHalfPi);
    CHECK(down.x == doctest::Approx(0.0).epsilon(kTol));
    CHECK(down.y == doctest::Approx(4.0));
}
