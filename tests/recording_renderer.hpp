#pragma once

/// @file recording_renderer.hpp
/// @brief Renderer that records draw calls instead of rasterizing them.

#include "rendering/renderer.hpp"
#include "rendering/stroke_font.hpp"
#include "rendering/surface.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::testing
{
    struct RecordedCircle
    {
        Vec2d center;
        f64 radius;
        Color color;
    };

    struct RecordedPolyline
    {
        std::vector<Vec2d> points;
        bool closed;
        Color color;
        f64 width;
    };

    struct RecordedBlit
    {
        rendering::Surface surface;
        Rect dest;
    };

    class RecordingRenderer final : public rendering::Renderer
    {
    public:
        void draw_circle(Vec2d center, f64 radius, Color color) override
        {
            circles.push_back({center, radius, color});
        }

        void draw_polyline(std::span<const Vec2d> points, bool closed, Color color, f64 width) override
        {
            polylines.push_back({std::vector<Vec2d>(points.begin(), points.end()), closed, color, width});
        }

        void blit(const rendering::Surface& surface, Rect dest) override
        {
            blits.push_back({surface, dest});
        }

        rendering::Surface text_to_surface(std::string_view text, Color color) override
        {
            texts.emplace_back(text);
            return font.render(text, color);
        }

        void clear()
        {
            circles.clear();
            polylines.clear();
            blits.clear();
            texts.clear();
        }

        rendering::StrokeFont font;
        std::vector<RecordedCircle> circles;
        std::vector<RecordedPolyline> polylines;
        std::vector<RecordedBlit> blits;
        std::vector<std::string> texts;
    };

} // namespace orrery::testing
