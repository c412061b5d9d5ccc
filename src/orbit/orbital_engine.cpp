/// @file orbital_engine.cpp
/// @brief Orbital engine tick.

#include "orbit/orbital_engine.hpp"

#include "orbit/kepler.hpp"

namespace orrery::orbit
{

std::size_t OrbitalEngine::step(scene::SceneGraph& scene, const SimulationContext& context)
{
    if (context.paused())
    {
        return 0;
    }

    const f64 time_factor = context.time_factor();
    std::size_t advanced = 0;

    for (auto& body : scene.bodies())
    {
        if (body.is_root())
        {
            continue;
        }

        auto& elements = body.elements;
        elements.mean_anomaly =
            normalize_angle(elements.mean_anomaly + body.base_angular_speed * time_factor);

        place(scene, body.id);
        ++advanced;
    }

    return advanced;
}

void OrbitalEngine::place(scene::SceneGraph& scene, scene::BodyId id)
{
    auto& body = scene.body(id);
    if (body.is_root())
    {
        return;
    }

    const auto& elements = body.elements;
    const f64 e = elements.eccentricity;

    const f64 E = solve_kepler(elements.mean_anomaly, e);
    const f64 nu = true_anomaly(E, e);
    const f64 r = orbital_radius(elements.semi_major_axis, elements.one_minus_e2, e, nu);

    body.position = scene.body(*body.parent).position + orbit_offset(r, nu);
}

} // namespace orrery::orbit
