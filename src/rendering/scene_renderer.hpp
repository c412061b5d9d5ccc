#pragma once

/// @file scene_renderer.hpp
/// @brief Draws one frame of the scene: orbits, bodies, labels, facts and the HUD.

#include "core/types.hpp"
#include "rendering/camera.hpp"
#include "rendering/render_cache.hpp"
#include "rendering/renderer.hpp"
#include "rendering/surface.hpp"
#include "scene/scene_graph.hpp"

#include <optional>

namespace orrery::rendering
{
    /// @brief Values shown in the HUD panel. The panel is rebuilt only when
    ///        one of them changes.
    struct HudInfo
    {
        i32 fps = 0;
        f64 time_factor = 1.0;
        bool paused = false;
        std::size_t planet_count = 0;
        std::size_t moon_count = 0;

        bool operator==(const HudInfo&) const = default;
    };

    /// @brief Per-frame inputs besides the scene itself.
    struct FrameView
    {
        std::optional<scene::BodyId> selected;
        Vec2d pointer{0.0, 0.0};
        HudInfo hud;
    };

    /// @brief True if a projected center lies more than half the larger
    ///        viewport dimension outside the viewport.
    [[nodiscard]] bool is_culled(Vec2d screen, const Camera& camera);

    /// @brief Top-left corner for a @p size panel next to @p pointer.
    ///
    /// Placed at pointer + 20 on each axis, or flipped to the other side of
    /// the pointer on any axis where it would overflow the viewport.
    [[nodiscard]] Vec2i overlay_position(Vec2d pointer, Vec2i size, Vec2i viewport);

    /// @brief Vertical label offset: above the disk in the top half of the
    ///        viewport, below it otherwise.
    [[nodiscard]] f64 label_offset(f64 screen_y, f64 scaled_radius, i32 viewport_height);

    class SceneRenderer
    {
    public:
        void render(Renderer& renderer, const scene::SceneGraph& scene, const Camera& camera,
                    RenderCacheSet& caches, const FrameView& view);

        /// @brief Force the HUD panel to be rebuilt on the next frame.
        void invalidate_hud() { m_hud.reset(); }

        [[nodiscard]] u32 hud_build_count() const { return m_hud_build_count; }

    private:
        void draw_body(Renderer& renderer, const scene::SceneGraph& scene,
                       const scene::CelestialBody& body, const Camera& camera,
                       BodyRenderCache& cache);

        void draw_orbit(Renderer& renderer, const scene::SceneGraph& scene,
                        const scene::CelestialBody& body, const Camera& camera,
                        BodyRenderCache& cache);

        void draw_facts(Renderer& renderer, const scene::CelestialBody& body, const Camera& camera,
                        BodyRenderCache& cache, Vec2d pointer);

        void draw_hud(Renderer& renderer, const HudInfo& info);

        [[nodiscard]] Surface build_hud(Renderer& renderer, const HudInfo& info) const;

        std::optional<Surface> m_hud;
        HudInfo m_hud_info;
        u32 m_hud_build_count = 0;
    };

} // namespace orrery::rendering
