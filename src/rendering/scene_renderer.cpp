/// @file scene_renderer.cpp
/// @brief Scene renderer implementation.

#include "rendering/scene_renderer.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace orrery::rendering
{

namespace
{
    constexpr i32 kHudOrigin = 10;
    constexpr i32 kHudPadding = 10;
    constexpr i32 kHudLinePitch = 22;
    constexpr f64 kOverlayGap = 20.0;
    constexpr f64 kLabelGapAbove = 15.0;
    constexpr f64 kLabelGapBelow = 5.0;

    constexpr std::array kControlHelp = {
        "Controls:",
        "Space - Pause/Resume",
        "+/- - Adjust speed",
        "I/O - Zoom",
        "Drag - Pan",
        "Click - Show facts",
        "R - Reset simulation",
        "ESC - Exit",
    };

    Vec2d truncate(Vec2d p)
    {
        return Vec2d{static_cast<f64>(static_cast<i32>(p.x)), static_cast<f64>(static_cast<i32>(p.y))};
    }
}

// -----------------------------------------------------------------
// Layout helpers
// -----------------------------------------------------------------

bool is_culled(Vec2d screen, const Camera& camera)
{
    const f64 w = camera.width();
    const f64 h = camera.height();
    const f64 margin = 0.5 * std::max(w, h);

    return screen.x < -margin || screen.x > w + margin
        || screen.y < -margin || screen.y > h + margin;
}

Vec2i overlay_position(Vec2d pointer, Vec2i size, Vec2i viewport)
{
    f64 x = pointer.x + kOverlayGap;
    f64 y = pointer.y + kOverlayGap;

    if (x + size.x > viewport.x)
    {
        x = pointer.x - size.x - kOverlayGap;
    }
    if (y + size.y > viewport.y)
    {
        y = pointer.y - size.y - kOverlayGap;
    }

    return Vec2i{static_cast<i32>(x), static_cast<i32>(y)};
}

f64 label_offset(f64 screen_y, f64 scaled_radius, i32 viewport_height)
{
    if (screen_y < static_cast<f64>(viewport_height / 2))
    {
        return -scaled_radius - kLabelGapAbove;
    }
    return scaled_radius + kLabelGapBelow;
}

// -----------------------------------------------------------------
// Frame
// -----------------------------------------------------------------

void SceneRenderer::render(Renderer& renderer, const scene::SceneGraph& scene, const Camera& camera,
                           RenderCacheSet& caches, const FrameView& view)
{
    caches.resize(scene.size());

    for (const auto& body : scene.bodies())
    {
        draw_body(renderer, scene, body, camera, caches[body.id]);
    }

    if (view.selected.has_value() && scene.contains(*view.selected))
    {
        const auto& body = scene.body(*view.selected);
        draw_facts(renderer, body, camera, caches[body.id], view.pointer);
    }

    draw_hud(renderer, view.hud);
}

void SceneRenderer::draw_body(Renderer& renderer, const scene::SceneGraph& scene,
                              const scene::CelestialBody& body, const Camera& camera,
                              BodyRenderCache& cache)
{
    const Vec2d screen = camera.world_to_screen(body.position);
    if (is_culled(screen, camera))
    {
        return;
    }

    if (!body.is_root())
    {
        draw_orbit(renderer, scene, body, camera, cache);
    }

    const f64 scaled_radius = camera.scale_length(body.radius);
    const f64 disk_radius = std::max(1, static_cast<i32>(scaled_radius));
    renderer.draw_circle(truncate(screen), disk_radius, body.color);

    if (scaled_radius <= 1.0)
    {
        return;
    }

    if (const Surface* label = cache.name_label(body, renderer))
    {
        const f64 offset = label_offset(screen.y, scaled_radius, camera.height());
        const Rect dest{
            static_cast<i32>(screen.x - static_cast<f64>(label->width() / 2)),
            static_cast<i32>(screen.y + offset),
            label->width(),
            label->height(),
        };
        renderer.blit(*label, dest);
    }
}

void SceneRenderer::draw_orbit(Renderer& renderer, const scene::SceneGraph& scene,
                               const scene::CelestialBody& body, const Camera& camera,
                               BodyRenderCache& cache)
{
    const Vec2d parent_position = scene.body(*body.parent).position;

    if (scene.is_star_child(body.id))
    {
        cache.orbit.validate(body.elements, parent_position, camera);
        if (cache.orbit.surface().has_value())
        {
            renderer.blit(*cache.orbit.surface(), cache.orbit.rect());
        }
        return;
    }

    // Deeper bodies follow a moving parent; draw the ring fresh each frame
    OrbitSamples points = sample_orbit(body.elements, parent_position);
    for (auto& point : points)
    {
        point = truncate(camera.world_to_screen(point));
    }
    renderer.draw_polyline(points, true, colors::kOrbit, 1.0);
}

void SceneRenderer::draw_facts(Renderer& renderer, const scene::CelestialBody& body,
                               const Camera& camera, BodyRenderCache& cache, Vec2d pointer)
{
    const Surface* overlay = cache.facts_overlay(body, renderer);
    if (overlay == nullptr)
    {
        return;
    }

    const Vec2i origin = overlay_position(pointer, overlay->size(), camera.viewport());
    renderer.blit(*overlay, Rect{origin.x, origin.y, overlay->width(), overlay->height()});
}

// -----------------------------------------------------------------
// HUD
// -----------------------------------------------------------------

void SceneRenderer::draw_hud(Renderer& renderer, const HudInfo& info)
{
    if (!m_hud.has_value() || info != m_hud_info)
    {
        m_hud = build_hud(renderer, info);
        m_hud_info = info;
        ++m_hud_build_count;
    }

    renderer.blit(*m_hud, Rect{kHudOrigin, kHudOrigin, m_hud->width(), m_hud->height()});
}

Surface SceneRenderer::build_hud(Renderer& renderer, const HudInfo& info) const
{
    std::ostringstream scale;
    scale << "Time Scale: " << std::fixed << std::setprecision(1) << info.time_factor << "x";
    if (info.paused)
    {
        scale << " (Paused)";
    }

    std::vector<std::string> text = {
        "FPS: " + std::to_string(info.fps),
        "Planets: " + std::to_string(info.planet_count),
        "Moons: " + std::to_string(info.moon_count),
        scale.str(),
        "",
    };
    text.insert(text.end(), kControlHelp.begin(), kControlHelp.end());

    std::vector<Surface> lines;
    lines.reserve(text.size());
    i32 max_width = 0;
    for (const auto& line : text)
    {
        lines.push_back(renderer.text_to_surface(line, colors::kWhite));
        max_width = std::max(max_width, lines.back().width());
    }

    const i32 width = max_width + 2 * kHudPadding;
    const i32 height = static_cast<i32>(lines.size()) * kHudLinePitch + 2 * kHudPadding;

    Surface hud(width, height);
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const auto y = kHudPadding + static_cast<i32>(i) * kHudLinePitch;
        hud.draw_surface(lines[i], Vec2d{static_cast<f64>(kHudPadding), static_cast<f64>(y)});
    }
    return hud;
}

} // namespace orrery::rendering
