#pragma once

/// @file body_record.hpp
/// @brief Physical description of a body as catalogs supply it, before scaling.

#include "core/types.hpp"
#include "scene/celestial_body.hpp"

#include <string>
#include <vector>

namespace orrery::catalog
{
    /// @brief One catalog entry in physical units.
    ///
    /// A record tree mirrors the scene tree: the root record is the star,
    /// its children are planets and theirs are moons. A negative orbital
    /// period marks a retrograde orbit.
    struct BodyRecord
    {
        std::string name;
        f64 mass_kg = 0.0;
        f64 radius_km = 0.0;
        f64 orbit_radius_km = 0.0;         ///< Semi-major axis around the parent
        f64 orbital_period_days = 0.0;
        f64 eccentricity = 0.0;
        Color color = colors::kMoon;
        scene::Facts facts;
        std::vector<BodyRecord> children;
    };

} // namespace orrery::catalog
