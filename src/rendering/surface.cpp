/// @file surface.cpp
/// @brief Surface primitive recording.

#include "rendering/surface.hpp"

#include <cmath>
#include <type_traits>

namespace orrery::rendering
{

Surface::Surface(i32 width, i32 height)
    : m_width(width)
    , m_height(height)
{
}

void Surface::draw_line(Vec2d from, Vec2d to, Color color, f64 width)
{
    m_primitives.emplace_back(LinePrimitive{from, to, color, width});
}

void Surface::draw_polyline(std::span<const Vec2d> points, bool closed, Color color, f64 width)
{
    if (points.size() < 2)
    {
        return;
    }
    m_primitives.emplace_back(PolylinePrimitive{
        std::vector<Vec2d>(points.begin(), points.end()), closed, color, width});
}

void Surface::fill_rect(Rect rect, Color color)
{
    m_primitives.emplace_back(RectPrimitive{rect, color});
}

void Surface::fill_circle(Vec2d center, f64 radius, Color color)
{
    m_primitives.emplace_back(CirclePrimitive{center, radius, color});
}

void Surface::draw_surface(const Surface& other, Vec2d offset)
{
    m_primitives.reserve(m_primitives.size() + other.m_primitives.size());

    for (const auto& primitive : other.m_primitives)
    {
        std::visit([&](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            T moved = p;

            if constexpr (std::is_same_v<T, LinePrimitive>)
            {
                moved.from += offset;
                moved.to += offset;
            }
            else if constexpr (std::is_same_v<T, PolylinePrimitive>)
            {
                for (auto& point : moved.points)
                {
                    point += offset;
                }
            }
            else if constexpr (std::is_same_v<T, RectPrimitive>)
            {
                moved.rect.x += static_cast<i32>(std::lround(offset.x));
                moved.rect.y += static_cast<i32>(std::lround(offset.y));
            }
            else
            {
                moved.center += offset;
            }

            m_primitives.emplace_back(std::move(moved));
        }, primitive);
    }
}

} // namespace orrery::rendering
