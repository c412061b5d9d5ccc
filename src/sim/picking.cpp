/// @file picking.cpp
/// @brief Hit testing and selection toggling.

#include "sim/picking.hpp"

#include <algorithm>

namespace orrery::sim
{

std::optional<scene::BodyId> pick(const scene::SceneGraph& scene, const rendering::Camera& camera,
                                  Vec2d screen_point)
{
    for (const auto& body : scene.bodies())
    {
        const Vec2d screen = camera.world_to_screen(body.position);
        const f64 reach = std::max(camera.scale_length(body.radius), kMinPickRadius);

        if (glm::distance(screen_point, screen) <= reach)
        {
            return body.id;
        }
    }
    return std::nullopt;
}

std::optional<scene::BodyId> toggle_selection(std::optional<scene::BodyId> current,
                                              std::optional<scene::BodyId> picked)
{
    if (picked.has_value() && current == picked)
    {
        return std::nullopt;
    }
    return picked;
}

} // namespace orrery::sim
