#pragma once

/// @file surface.hpp
/// @brief Retained 2D drawing: a pixel-sized list of primitives replayed by a Renderer.

#include "core/types.hpp"

#include <span>
#include <variant>
#include <vector>

namespace orrery::rendering
{
    struct LinePrimitive
    {
        Vec2d from{0.0, 0.0};
        Vec2d to{0.0, 0.0};
        Color color;
        f64 width = 1.0;
    };

    struct PolylinePrimitive
    {
        std::vector<Vec2d> points;
        bool closed = false;
        Color color;
        f64 width = 1.0;
    };

    struct RectPrimitive
    {
        Rect rect;
        Color color;
    };

    struct CirclePrimitive
    {
        Vec2d center{0.0, 0.0};
        f64 radius = 1.0;
        Color color;
    };

    using Primitive = std::variant<LinePrimitive, PolylinePrimitive, RectPrimitive, CirclePrimitive>;

    /// @brief An off-screen drawing in local pixel coordinates.
    ///
    /// Coordinates run from (0, 0) at the top-left corner to (width, height).
    /// Nothing is rasterized here; the Renderer replays the primitives when
    /// the surface is blitted, clipped to the surface's own extent.
    class Surface
    {
    public:
        Surface() = default;
        Surface(i32 width, i32 height);

        void draw_line(Vec2d from, Vec2d to, Color color, f64 width = 1.0);
        void draw_polyline(std::span<const Vec2d> points, bool closed, Color color, f64 width = 1.0);
        void fill_rect(Rect rect, Color color);
        void fill_circle(Vec2d center, f64 radius, Color color);

        /// @brief Embed @p other with its top-left corner at @p offset.
        ///
        /// The primitives are copied and translated, so @p other may be
        /// discarded afterwards.
        void draw_surface(const Surface& other, Vec2d offset);

        [[nodiscard]] i32 width() const { return m_width; }
        [[nodiscard]] i32 height() const { return m_height; }
        [[nodiscard]] Vec2i size() const { return Vec2i{m_width, m_height}; }

        [[nodiscard]] bool empty() const { return m_primitives.empty(); }
        [[nodiscard]] const std::vector<Primitive>& primitives() const { return m_primitives; }

    private:
        i32 m_width = 0;
        i32 m_height = 0;
        std::vector<Primitive> m_primitives;
    };

} // namespace orrery::rendering
