/// @file controller.cpp
/// @brief Controller event handling and frame steps.

#include "sim/controller.hpp"

#include "core/logger.hpp"
#include "orbit/orbital_engine.hpp"
#include "sim/picking.hpp"

#include <algorithm>

namespace orrery::sim
{

Controller::Controller(const catalog::BodyRecord& catalog, ControllerConfig config)
    : m_catalog(catalog)
    , m_builder(config.scale)
    , m_seed(config.seed)
    , m_scene(config.seed)
    , m_camera(std::max(config.viewport_width, 1), std::max(config.viewport_height, 1))
{
    populate_scene();
}

void Controller::populate_scene()
{
    const Vec2d center{static_cast<f64>(m_camera.width() / 2), static_cast<f64>(m_camera.height() / 2)};
    m_builder.build(m_scene, m_catalog, center);
    m_caches.reset(m_scene.size());
}

// -----------------------------------------------------------------
// Events
// -----------------------------------------------------------------

void Controller::handle(const InputEvent& event)
{
    std::visit([this](const auto& e) { on_event(e); }, event);
}

void Controller::on_event(const ResizeEvent& event)
{
    const i32 width = std::max(event.width, 1);
    const i32 height = std::max(event.height, 1);

    m_camera.resize(width, height);
    m_caches.clear_all();
    m_renderer.invalidate_hud();

    ORR_CORE_INFO("Controller: Viewport resized to {}x{}", width, height);
}

void Controller::on_event(const KeyDownEvent& event)
{
    switch (event.key)
    {
    case Key::Escape:
        m_quit = true;
        break;
    case Key::Space:
        m_context.toggle_pause();
        ORR_INFO("Simulation {}", m_context.paused() ? "paused" : "resumed");
        break;
    case Key::Plus:
        m_context.speed_up();
        ORR_INFO("Time scale {:.2f}x", m_context.time_factor());
        break;
    case Key::Minus:
        m_context.slow_down();
        ORR_INFO("Time scale {:.2f}x", m_context.time_factor());
        break;
    case Key::ZoomIn:
        m_camera.zoom_in();
        break;
    case Key::ZoomOut:
        m_camera.zoom_out();
        break;
    case Key::Reset:
        reset();
        break;
    case Key::Other:
        break;
    }
}

void Controller::on_event(const PointerDownEvent& event)
{
    m_pointer = event.position;
    if (event.button != MouseButton::Primary)
    {
        return;
    }

    m_dragging = true;

    const auto picked = pick(m_scene, m_camera, event.position);
    m_selection = toggle_selection(m_selection, picked);

    if (m_selection.has_value())
    {
        ORR_INFO("Selected '{}'", m_scene.body(*m_selection).name);
    }
}

void Controller::on_event(const PointerUpEvent& event)
{
    if (event.button == MouseButton::Primary)
    {
        m_dragging = false;
    }
}

void Controller::on_event(const PointerMoveEvent& event)
{
    if (m_dragging)
    {
        const Vec2d delta = event.position - m_pointer;
        m_camera.drag(delta.x, delta.y);
    }
    m_pointer = event.position;
}

void Controller::on_event(const QuitEvent&)
{
    m_quit = true;
}

// -----------------------------------------------------------------
// Frame steps
// -----------------------------------------------------------------

std::size_t Controller::tick()
{
    return orbit::OrbitalEngine::step(m_scene, m_context);
}

void Controller::render(rendering::Renderer& renderer, const FrameStats& stats)
{
    const rendering::FrameView view{
        .selected = m_selection,
        .pointer = m_pointer,
        .hud = rendering::HudInfo{
            .fps = static_cast<i32>(stats.fps),
            .time_factor = m_context.time_factor(),
            .paused = m_context.paused(),
            .planet_count = m_scene.planet_count(),
            .moon_count = m_scene.moon_count(),
        },
    };

    m_renderer.render(renderer, m_scene, m_camera, m_caches, view);
}

void Controller::reset()
{
    ++m_seed;
    m_scene = scene::SceneGraph(m_seed);
    m_camera.reset(m_camera.width(), m_camera.height());
    m_context.reset();
    m_selection.reset();
    m_dragging = false;

    populate_scene();
    m_renderer.invalidate_hud();

    ORR_INFO("Simulation reset (seed {})", m_seed);
}

} // namespace orrery::sim
