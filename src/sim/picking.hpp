#pragma once

/// @file picking.hpp
/// @brief Screen-space hit testing against scene bodies.

#include "core/types.hpp"
#include "rendering/camera.hpp"
#include "scene/scene_graph.hpp"

#include <optional>

namespace orrery::sim
{
    /// @brief Smallest pick radius in pixels, so tiny bodies stay clickable.
    inline constexpr f64 kMinPickRadius = 10.0;

    /// @brief First body, in insertion order, whose projected center lies
    ///        within max(projected radius, kMinPickRadius) of @p screen_point.
    [[nodiscard]] std::optional<scene::BodyId> pick(const scene::SceneGraph& scene,
                                                    const rendering::Camera& camera,
                                                    Vec2d screen_point);

    /// @brief Selection after a click that hit @p picked.
    ///
    /// Clicking the selected body again deselects it; a miss deselects.
    [[nodiscard]] std::optional<scene::BodyId> toggle_selection(std::optional<scene::BodyId> current,
                                                                std::optional<scene::BodyId> picked);

} // namespace orrery::sim
