/// @file scene_builder.cpp
/// @brief Catalog to scene conversion.

#include "catalog/scene_builder.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace orrery::catalog
{

namespace
{
    f64 log_radius(f64 radius_km, f64 base, f64 gain, f64 min_radius)
    {
        if (!(radius_km > 0.0))
        {
            return min_radius;
        }
        return std::max(min_radius, base + gain * std::log10(radius_km / 1000.0));
    }
}

SceneBuilder::SceneBuilder(SceneScale scale)
    : m_scale(scale)
{
}

// -----------------------------------------------------------------
// Unit conversion
// -----------------------------------------------------------------

f64 SceneBuilder::pixel_distance(f64 km) const
{
    return km * m_scale.distance_scale;
}

f64 SceneBuilder::planet_radius(f64 radius_km) const
{
    return log_radius(radius_km, m_scale.planet_radius_base, m_scale.planet_radius_gain,
                      m_scale.planet_min_radius);
}

f64 SceneBuilder::moon_radius(f64 radius_km) const
{
    return log_radius(radius_km, m_scale.moon_radius_base, m_scale.moon_radius_gain,
                      m_scale.moon_min_radius);
}

f64 SceneBuilder::base_speed() const
{
    return math_constants::kTwoPi / m_scale.ticks_per_year;
}

f64 SceneBuilder::planet_angular_speed(f64 period_days) const
{
    if (period_days <= m_scale.min_period_days)
    {
        return 0.0;
    }
    return base_speed() * m_scale.reference_period_days / period_days;
}

f64 SceneBuilder::moon_angular_speed(f64 period_days) const
{
    const f64 magnitude = std::abs(period_days);
    if (magnitude <= m_scale.min_period_days)
    {
        return 0.0;
    }

    const f64 speed = base_speed() * m_scale.reference_period_days / magnitude;
    return period_days < 0.0 ? -speed : speed;
}

bool SceneBuilder::has_valid_orbit(const BodyRecord& record)
{
    return std::isfinite(record.orbit_radius_km) && record.orbit_radius_km > 0.0
        && record.eccentricity >= 0.0 && record.eccentricity < 1.0;
}

// -----------------------------------------------------------------
// build
// -----------------------------------------------------------------

std::size_t SceneBuilder::build(scene::SceneGraph& scene, const BodyRecord& root, Vec2d center) const
{
    const auto star = scene.add_star(center, m_scale.star_radius, root.color, root.name,
                                     root.mass_kg, root.facts);
    if (!star.has_value())
    {
        return 0;
    }

    std::size_t added = 1;

    for (const auto& record : root.children)
    {
        if (!has_valid_orbit(record))
        {
            ORR_CORE_WARN("SceneBuilder: Skipping '{}' (a = {} km, e = {})",
                          record.name, record.orbit_radius_km, record.eccentricity);
            continue;
        }

        const scene::OrbitSpec orbit{
            .semi_major_axis = pixel_distance(record.orbit_radius_km),
            .eccentricity = record.eccentricity,
            .angular_speed = planet_angular_speed(record.orbital_period_days),
            .radius = planet_radius(record.radius_km),
            .mass = record.mass_kg,
        };

        const auto planet = scene.add_planet(*star, orbit, record.color, record.name, record.facts);
        if (!planet.has_value())
        {
            continue;
        }

        added += 1 + add_moons(scene, *planet, record);
    }

    ORR_CORE_INFO("SceneBuilder: Built '{}' system: {} planets, {} moons",
                  root.name, scene.planet_count(), scene.moon_count());
    return added;
}

std::size_t SceneBuilder::add_moons(scene::SceneGraph& scene, scene::BodyId parent,
                                    const BodyRecord& record) const
{
    std::size_t added = 0;

    for (const auto& child : record.children)
    {
        if (!has_valid_orbit(child))
        {
            ORR_CORE_WARN("SceneBuilder: Skipping moon '{}' of '{}' (a = {} km, e = {})",
                          child.name, record.name, child.orbit_radius_km, child.eccentricity);
            continue;
        }

        const scene::OrbitSpec orbit{
            .semi_major_axis = pixel_distance(child.orbit_radius_km),
            .eccentricity = child.eccentricity,
            .angular_speed = moon_angular_speed(child.orbital_period_days),
            .radius = moon_radius(child.radius_km),
            .mass = child.mass_kg,
        };

        const auto moon = scene.add_moon(parent, orbit, child.name, child.facts);
        if (!moon.has_value())
        {
            continue;
        }

        added += 1 + add_moons(scene, *moon, child);
    }

    return added;
}

} // namespace orrery::catalog
