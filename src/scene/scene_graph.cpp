/// @file scene_graph.cpp
/// @brief SceneGraph implementation: body construction, validation and queries.

#include "scene/scene_graph.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace orrery::scene
{

SceneGraph::SceneGraph(u64 seed)
    : m_rng(seed)
{
}

// -----------------------------------------------------------------
// add_star
// -----------------------------------------------------------------

std::optional<BodyId> SceneGraph::add_star(Vec2d position, f64 radius, Color color,
                                           std::string name, f64 mass, Facts facts)
{
    if (root().has_value())
    {
        ORR_CORE_ERROR("SceneGraph: Rejected second root star '{}'", name);
        return std::nullopt;
    }

    const auto id = static_cast<BodyId>(m_bodies.size());

    CelestialBody star;
    star.id       = id;
    star.kind     = BodyKind::Star;
    star.name     = std::move(name);
    star.radius   = radius;
    star.color    = color;
    star.mass     = mass;
    star.position = position;
    star.facts    = std::move(facts);

    m_bodies.push_back(std::move(star));
    ++m_star_count;

    ORR_CORE_TRACE("SceneGraph: Added star '{}' at ({:.1f}, {:.1f})",
                   m_bodies.back().name, position.x, position.y);
    return id;
}

// -----------------------------------------------------------------
// add_planet / add_moon
// -----------------------------------------------------------------

std::optional<BodyId> SceneGraph::add_planet(BodyId parent, const OrbitSpec& orbit, Color color,
                                             std::string name, Facts facts)
{
    return add_orbiter(BodyKind::Planet, parent, orbit.semi_major_axis, orbit, color,
                       std::move(name), std::move(facts));
}

std::optional<BodyId> SceneGraph::add_moon(BodyId parent, const OrbitSpec& orbit,
                                           std::string name, Facts facts)
{
    if (!contains(parent))
    {
        ORR_CORE_ERROR("SceneGraph: Moon '{}' references unknown parent {}", name, parent);
        return std::nullopt;
    }

    // Keep the moon outside its planet's drawn disk
    f64 semi_major_axis = orbit.semi_major_axis;
    const CelestialBody& host = m_bodies[parent];
    if (!host.is_root())
    {
        semi_major_axis = std::max(semi_major_axis, 2.0 * host.radius);
    }

    return add_orbiter(BodyKind::Moon, parent, semi_major_axis, orbit, colors::kMoon,
                       std::move(name), std::move(facts));
}

std::optional<BodyId> SceneGraph::add_orbiter(BodyKind kind, BodyId parent, f64 semi_major_axis,
                                              const OrbitSpec& orbit, Color color,
                                              std::string name, Facts facts)
{
    if (!contains(parent))
    {
        ORR_CORE_ERROR("SceneGraph: Body '{}' references unknown parent {}", name, parent);
        return std::nullopt;
    }

    if (!validate(orbit, semi_major_axis, name))
    {
        return std::nullopt;
    }

    const auto id = static_cast<BodyId>(m_bodies.size());
    const f64 e = orbit.eccentricity;

    CelestialBody body;
    body.id     = id;
    body.kind   = kind;
    body.name   = std::move(name);
    body.radius = orbit.radius;
    body.color  = color;
    body.mass   = orbit.mass;
    body.elements = OrbitalElements{
        .semi_major_axis = semi_major_axis,
        .eccentricity    = e,
        .mean_anomaly    = m_rng.next_in_range(0.0, math_constants::kTwoPi),
        .one_minus_e2    = 1.0 - e * e,
    };
    body.base_angular_speed = orbit.angular_speed;
    body.parent   = parent;
    body.position = m_bodies[parent].position;
    body.facts    = std::move(facts);

    m_bodies.push_back(std::move(body));
    m_bodies[parent].children.push_back(id);

    if (kind == BodyKind::Moon)
    {
        ++m_moon_count;
    }
    else
    {
        ++m_planet_count;
    }

    return id;
}

bool SceneGraph::validate(const OrbitSpec& orbit, f64 semi_major_axis, std::string_view name)
{
    if (!std::isfinite(semi_major_axis) || semi_major_axis <= 0.0)
    {
        ORR_CORE_ERROR("SceneGraph: Body '{}' has invalid semi-major axis {}", name, semi_major_axis);
        return false;
    }

    if (!std::isfinite(orbit.eccentricity) || orbit.eccentricity < 0.0 || orbit.eccentricity >= 1.0)
    {
        ORR_CORE_ERROR("SceneGraph: Body '{}' has eccentricity {} outside [0, 1)",
                       name, orbit.eccentricity);
        return false;
    }

    if (!std::isfinite(orbit.angular_speed))
    {
        ORR_CORE_ERROR("SceneGraph: Body '{}' has non-finite angular speed", name);
        return false;
    }

    return true;
}

// -----------------------------------------------------------------
// clear
// -----------------------------------------------------------------

void SceneGraph::clear()
{
    m_bodies.clear();
    m_star_count = 0;
    m_planet_count = 0;
    m_moon_count = 0;
}

// -----------------------------------------------------------------
// Queries
// -----------------------------------------------------------------

std::optional<BodyId> SceneGraph::root() const
{
    if (m_bodies.empty() || !m_bodies.front().is_root())
    {
        return std::nullopt;
    }
    return m_bodies.front().id;
}

std::span<const BodyId> SceneGraph::children(BodyId id) const
{
    return m_bodies[id].children;
}

std::optional<BodyId> SceneGraph::find_by_name(std::string_view name) const
{
    for (const auto& body : m_bodies)
    {
        if (body.name.size() != name.size())
        {
            continue;
        }

        const bool match = std::equal(body.name.begin(), body.name.end(), name.begin(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a))
                    == std::tolower(static_cast<unsigned char>(b));
            });

        if (match)
        {
            return body.id;
        }
    }
    return std::nullopt;
}

bool SceneGraph::is_star_child(BodyId id) const
{
    const auto& parent = m_bodies[id].parent;
    return parent.has_value() && m_bodies[*parent].is_root();
}

} // namespace orrery::scene
