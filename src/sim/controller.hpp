#pragma once

/// @file controller.hpp
/// @brief Owns the simulation state and applies input, ticks and rendering to it.

#include "catalog/body_record.hpp"
#include "catalog/scene_builder.hpp"
#include "core/types.hpp"
#include "orbit/simulation_context.hpp"
#include "rendering/camera.hpp"
#include "rendering/render_cache.hpp"
#include "rendering/renderer.hpp"
#include "rendering/scene_renderer.hpp"
#include "scene/scene_graph.hpp"
#include "sim/input_event.hpp"

#include <cstddef>
#include <optional>

namespace orrery::sim
{
    struct ControllerConfig
    {
        i32 viewport_width = 1200;
        i32 viewport_height = 800;
        u64 seed = 0x853c49e6748fea9bULL;
        catalog::SceneScale scale;
    };

    /// @brief Timing figures measured by the frame loop.
    struct FrameStats
    {
        f64 fps = 0.0;
    };

    /// @brief Interaction and simulation state for one viewer.
    ///
    /// Two independent state axes persist across frames: panning
    /// (idle or dragging, driven by the primary button) and simulation
    /// (running or paused). Picking and drawing never mutate the scene.
    class Controller
    {
    public:
        /// @param catalog Record tree to build the scene from. Must outlive
        ///        the controller; it is read again on reset().
        Controller(const catalog::BodyRecord& catalog, ControllerConfig config);

        /// @brief Apply one input event.
        void handle(const InputEvent& event);

        /// @brief Advance the simulation one tick.
        /// @return Bodies advanced (0 while paused).
        std::size_t tick();

        /// @brief Draw the current frame.
        void render(rendering::Renderer& renderer, const FrameStats& stats);

        /// @brief Rebuild the scene with the next seed and restore the default view.
        void reset();

        [[nodiscard]] bool should_quit() const { return m_quit; }
        [[nodiscard]] bool dragging() const { return m_dragging; }
        [[nodiscard]] std::optional<scene::BodyId> selection() const { return m_selection; }
        [[nodiscard]] Vec2d pointer() const { return m_pointer; }
        [[nodiscard]] u64 seed() const { return m_seed; }

        [[nodiscard]] const scene::SceneGraph& scene() const { return m_scene; }
        [[nodiscard]] scene::SceneGraph& scene() { return m_scene; }
        [[nodiscard]] const rendering::Camera& camera() const { return m_camera; }
        [[nodiscard]] const orbit::SimulationContext& context() const { return m_context; }
        [[nodiscard]] orbit::SimulationContext& context() { return m_context; }
        [[nodiscard]] const rendering::RenderCacheSet& caches() const { return m_caches; }
        [[nodiscard]] const rendering::SceneRenderer& scene_renderer() const { return m_renderer; }

    private:
        void on_event(const ResizeEvent& event);
        void on_event(const KeyDownEvent& event);
        void on_event(const PointerDownEvent& event);
        void on_event(const PointerUpEvent& event);
        void on_event(const PointerMoveEvent& event);
        void on_event(const QuitEvent& event);

        void populate_scene();

        const catalog::BodyRecord& m_catalog;
        catalog::SceneBuilder m_builder;
        u64 m_seed;

        scene::SceneGraph m_scene;
        rendering::Camera m_camera;
        orbit::SimulationContext m_context;
        rendering::RenderCacheSet m_caches;
        rendering::SceneRenderer m_renderer;

        std::optional<scene::BodyId> m_selection;
        Vec2d m_pointer{0.0, 0.0};
        bool m_dragging = false;
        bool m_quit = false;
    };

} // namespace orrery::sim
