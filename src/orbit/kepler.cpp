/// @file kepler.cpp
/// @brief Kepler solve and conic helpers.

#include "orbit/kepler.hpp"

#include <cmath>

namespace orrery::orbit
{

f64 normalize_angle(f64 theta)
{
    f64 wrapped = std::fmod(theta, math_constants::kTwoPi);
    if (wrapped < 0.0)
    {
        wrapped += math_constants::kTwoPi;
    }
    // fmod of a tiny negative value plus 2π can round up to exactly 2π
    if (wrapped >= math_constants::kTwoPi)
    {
        wrapped = 0.0;
    }
    return wrapped;
}

f64 solve_kepler(f64 mean_anomaly, f64 eccentricity)
{
    f64 E = mean_anomaly;
    for (int i = 0; i < kKeplerIterations; ++i)
    {
        E = mean_anomaly + eccentricity * std::sin(E);
    }
    return E;
}

f64 true_anomaly(f64 eccentric_anomaly, f64 eccentricity)
{
    const f64 half_E = eccentric_anomaly * 0.5;
    return 2.0 * std::atan2(std::sqrt(1.0 + eccentricity) * std::sin(half_E),
                            std::sqrt(1.0 - eccentricity) * std::cos(half_E));
}

f64 orbital_radius(f64 semi_major_axis, f64 one_minus_e2, f64 eccentricity, f64 true_anomaly)
{
    return semi_major_axis * one_minus_e2 / (1.0 + eccentricity * std::cos(true_anomaly));
}

Vec2d orbit_offset(f64 radius, f64 true_anomaly)
{
    return Vec2d{radius * std::cos(true_anomaly), radius * std::sin(true_anomaly)};
}

} // namespace orrery::orbit
