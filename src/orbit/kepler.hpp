#pragma once

/// @file kepler.hpp
/// @brief Planar two-body orbit helpers: Kepler's equation, true anomaly, radius.

#include "core/types.hpp"

namespace orrery::orbit
{
    /// @brief Number of fixed-point refinements applied by solve_kepler().
    inline constexpr int kKeplerIterations = 5;

    /// @brief Wrap an angle into [0, 2π). Negative input wraps from above.
    [[nodiscard]] f64 normalize_angle(f64 theta);

    /// @brief Approximate the eccentric anomaly E for M = E − e·sin(E).
    ///
    /// Starts from E = M and applies E ← M + e·sin(E) exactly
    /// kKeplerIterations times. There is no convergence test, so the result
    /// is a pure function of (M, e). Good for the moderate eccentricities of
    /// the solar system; accuracy drops off as e approaches 1.
    [[nodiscard]] f64 solve_kepler(f64 mean_anomaly, f64 eccentricity);

    /// @brief True anomaly ν from eccentric anomaly E.
    ///
    /// ν = 2·atan2(√(1+e)·sin(E/2), √(1−e)·cos(E/2))
    [[nodiscard]] f64 true_anomaly(f64 eccentric_anomaly, f64 eccentricity);

    /// @brief Orbital radius r = a(1−e²) / (1 + e·cos ν).
    [[nodiscard]] f64 orbital_radius(f64 semi_major_axis, f64 one_minus_e2,
                                     f64 eccentricity, f64 true_anomaly);

    /// @brief Parent-relative offset for a body at true anomaly ν and radius r.
    [[nodiscard]] Vec2d orbit_offset(f64 radius, f64 true_anomaly);

} // namespace orrery::orbit
