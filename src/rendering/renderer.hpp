#pragma once

/// @file renderer.hpp
/// @brief Drawing capability consumed by the scene renderer.

#include "core/types.hpp"
#include "rendering/surface.hpp"

#include <span>
#include <string_view>

namespace orrery::rendering
{
    /// @brief Immediate-mode 2D drawing target (screen pixels, y down).
    ///
    /// Implemented by the Vulkan canvas in the application and by a
    /// recording fake in the tests.
    class Renderer
    {
    public:
        virtual ~Renderer() = default;

        virtual void draw_circle(Vec2d center, f64 radius, Color color) = 0;

        virtual void draw_polyline(std::span<const Vec2d> points, bool closed,
                                   Color color, f64 width) = 0;

        /// @brief Replay @p surface with its origin at (dest.x, dest.y),
        ///        clipped to dest.
        virtual void blit(const Surface& surface, Rect dest) = 0;

        /// @brief Lay out a single line of text into a new surface sized to fit it.
        [[nodiscard]] virtual Surface text_to_surface(std::string_view text, Color color) = 0;
    };

} // namespace orrery::rendering
