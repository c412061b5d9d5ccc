/// @file test_controller.cpp
/// @brief End-to-end tests for orrery::sim::Controller.
///
/// Drives the controller with translated input events against the
/// built-in catalog and checks the resulting view and simulation state.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "recording_renderer.hpp"

#include "catalog/solar_system_catalog.hpp"
#include "core/types.hpp"
#include "sim/controller.hpp"
#include "sim/input_event.hpp"

using namespace orrery;
using namespace orrery::sim;

namespace
{
    Controller make_controller()
    {
        return Controller(catalog::solar_system(), ControllerConfig{});
    }

    void press(Controller& controller, Key key, int times = 1)
    {
        for (int i = 0; i < times; ++i)
        {
            controller.handle(KeyDownEvent{key});
        }
    }
}

// =================================================================
// Construction
// =================================================================

TEST_CASE("Controller starts with the full system at the viewport center")
{
    const Controller controller = make_controller();
    CHECK(controller.scene().planet_count() == 18);
    CHECK(controller.scene().moon_count() == 31);
    CHECK(controller.caches().size() == controller.scene().size());
    CHECK(controller.camera().zoom() == doctest::Approx(1.0));
    CHECK(controller.camera().pan() == Vec2d{600.0, 400.0});
    CHECK(controller.scene().body(*controller.scene().root()).position == Vec2d{600.0, 400.0});
    CHECK(controller.seed() == 0x853c49e6748fea9bULL);
    CHECK_FALSE(controller.should_quit());
    CHECK_FALSE(controller.dragging());
}

// =================================================================
// Keys
// =================================================================

TEST_CASE("Zoom keys step and clamp the camera")
{
    Controller controller = make_controller();
    press(controller, Key::ZoomIn);
    CHECK(controller.camera().zoom() == doctest::Approx(1.1));
    press(controller, Key::ZoomIn, 100);
    CHECK(controller.camera().zoom() == doctest::Approx(5.0));
    press(controller, Key::ZoomOut, 200);
    CHECK(controller.camera().zoom() == doctest::Approx(0.05));
}

TEST_CASE("Speed keys step and clamp the time factor")
{
    Controller controller = make_controller();
    press(controller, Key::Plus);
    CHECK(controller.context().time_factor() == doctest::Approx(1.5));
    press(controller, Key::Plus, 50);
    CHECK(controller.context().time_factor() == doctest::Approx(100.0));
    press(controller, Key::Minus, 100);
    CHECK(controller.context().time_factor() == doctest::Approx(0.01));
}

TEST_CASE("Pause freezes the simulation")
{
    Controller controller = make_controller();
    CHECK(controller.tick() == controller.scene().size() - 1);

    press(controller, Key::Space);
    CHECK(controller.context().paused());

    const auto earth = *controller.scene().find_by_name("Earth");
    const Vec2d before = controller.scene().body(earth).position;
    const f64 anomaly = controller.scene().body(earth).elements.mean_anomaly;
    for (int i = 0; i < 10; ++i)
    {
        CHECK(controller.tick() == 0);
    }
    CHECK(controller.scene().body(earth).position == before);
    CHECK(controller.scene().body(earth).elements.mean_anomaly == anomaly);

    press(controller, Key::Space);
    CHECK(controller.tick() > 0);
    CHECK(controller.scene().body(earth).elements.mean_anomaly != anomaly);
}

TEST_CASE("Escape and window close both request quit")
{
    Controller a = make_controller();
    press(a, Key::Escape);
    CHECK(a.should_quit());

    Controller b = make_controller();
    b.handle(QuitEvent{});
    CHECK(b.should_quit());

    Controller c = make_controller();
    press(c, Key::Other);
    CHECK_FALSE(c.should_quit());
}

// =================================================================
// Pointer
// =================================================================

TEST_CASE("Dragging pans opposite to the pointer")
{
    Controller controller = make_controller();
    press(controller, Key::ZoomIn, 8);
    const f64 zoom = controller.camera().zoom();
    const Vec2d pan = controller.camera().pan();

    controller.handle(PointerDownEvent{MouseButton::Primary, {50.0, 50.0}});
    CHECK(controller.dragging());
    controller.handle(PointerMoveEvent{{80.0, 40.0}});
    controller.handle(PointerMoveEvent{{110.0, 30.0}});
    controller.handle(PointerUpEvent{MouseButton::Primary});
    CHECK_FALSE(controller.dragging());

    CHECK(controller.camera().pan().x == doctest::Approx(pan.x - 60.0 / zoom));
    CHECK(controller.camera().pan().y == doctest::Approx(pan.y + 20.0 / zoom));

    controller.handle(PointerMoveEvent{{500.0, 500.0}});
    CHECK(controller.camera().pan().x == doctest::Approx(pan.x - 60.0 / zoom));
    CHECK(controller.pointer() == Vec2d{500.0, 500.0});
}

TEST_CASE("Releasing the button ends the drag and keeps the pointer anchor")
{
    Controller controller = make_controller();
    controller.handle(PointerDownEvent{MouseButton::Primary, {300.0, 200.0}});
    controller.handle(PointerMoveEvent{{320.0, 210.0}});
    const Vec2d pan = controller.camera().pan();

    controller.handle(PointerUpEvent{MouseButton::Secondary});
    CHECK(controller.dragging());

    controller.handle(PointerUpEvent{MouseButton::Primary});
    CHECK_FALSE(controller.dragging());
    CHECK(controller.pointer() == Vec2d{320.0, 210.0});
    CHECK(controller.camera().pan() == pan);
}

TEST_CASE("Secondary button neither drags nor selects")
{
    Controller controller = make_controller();
    controller.handle(PointerDownEvent{MouseButton::Secondary, {600.0, 400.0}});
    CHECK_FALSE(controller.dragging());
    CHECK_FALSE(controller.selection().has_value());
    CHECK(controller.pointer() == Vec2d{600.0, 400.0});
}

TEST_CASE("Clicking toggles the selection and a miss clears it")
{
    Controller controller = make_controller();
    const auto sun = *controller.scene().root();

    // Before the first tick every body still sits on the Sun; the Sun wins
    controller.handle(PointerDownEvent{MouseButton::Primary, {600.0, 400.0}});
    controller.handle(PointerUpEvent{MouseButton::Primary});
    CHECK(controller.selection() == sun);

    controller.handle(PointerDownEvent{MouseButton::Primary, {600.0, 400.0}});
    controller.handle(PointerUpEvent{MouseButton::Primary});
    CHECK_FALSE(controller.selection().has_value());

    controller.handle(PointerDownEvent{MouseButton::Primary, {600.0, 400.0}});
    controller.handle(PointerUpEvent{MouseButton::Primary});
    controller.handle(PointerDownEvent{MouseButton::Primary, {5.0, 5.0}});
    CHECK_FALSE(controller.selection().has_value());
}

// =================================================================
// Reset / resize
// =================================================================

TEST_CASE("Reset reseeds the scene and restores the default view")
{
    Controller controller = make_controller();
    const u64 seed = controller.seed();
    const auto earth = *controller.scene().find_by_name("Earth");
    const f64 anomaly = controller.scene().body(earth).elements.mean_anomaly;

    press(controller, Key::ZoomIn, 3);
    press(controller, Key::Plus, 2);
    press(controller, Key::Space);
    controller.handle(PointerDownEvent{MouseButton::Primary, {600.0, 400.0}});
    controller.handle(PointerMoveEvent{{650.0, 420.0}});
    REQUIRE(controller.selection().has_value());

    press(controller, Key::Reset);

    CHECK(controller.seed() == seed + 1);
    CHECK(controller.camera().zoom() == doctest::Approx(1.0));
    CHECK(controller.camera().pan() == Vec2d{600.0, 400.0});
    CHECK(controller.context().time_factor() == doctest::Approx(1.0));
    CHECK(controller.context().paused());
    CHECK_FALSE(controller.selection().has_value());
    CHECK_FALSE(controller.dragging());
    CHECK(controller.scene().planet_count() == 18);
    CHECK(controller.scene().moon_count() == 31);
    CHECK(controller.caches().populated_count() == 0);

    const auto reseeded = *controller.scene().find_by_name("Earth");
    CHECK(controller.scene().body(reseeded).elements.mean_anomaly != anomaly);
}

TEST_CASE("Reset forces a HUD rebuild")
{
    Controller controller = make_controller();
    testing::RecordingRenderer renderer;
    controller.render(renderer, FrameStats{.fps = 60.0});
    controller.render(renderer, FrameStats{.fps = 60.0});
    CHECK(controller.scene_renderer().hud_build_count() == 1);

    controller.reset();
    controller.render(renderer, FrameStats{.fps = 60.0});
    CHECK(controller.scene_renderer().hud_build_count() == 2);
}

TEST_CASE("Resize clears caches and recenters the camera")
{
    Controller controller = make_controller();
    controller.tick();

    testing::RecordingRenderer renderer;
    controller.render(renderer, FrameStats{.fps = 30.0});
    CHECK(controller.caches().populated_count() > 0);
    const u64 rebuilds = controller.caches().total_orbit_rebuilds();
    CHECK(rebuilds > 0);

    press(controller, Key::ZoomIn);
    controller.handle(ResizeEvent{1000, 700});
    CHECK(controller.caches().populated_count() == 0);
    CHECK(controller.camera().viewport() == Vec2i{1000, 700});
    CHECK(controller.camera().pan() == Vec2d{500.0, 350.0});
    CHECK(controller.camera().zoom() == doctest::Approx(1.1));

    controller.render(renderer, FrameStats{.fps = 30.0});
    CHECK(controller.caches().total_orbit_rebuilds() > rebuilds);
    CHECK(controller.scene_renderer().hud_build_count() == 2);
}

TEST_CASE("Degenerate resize is clamped to one pixel")
{
    Controller controller = make_controller();
    controller.handle(ResizeEvent{0, -5});
    CHECK(controller.camera().viewport() == Vec2i{1, 1});

    testing::RecordingRenderer renderer;
    controller.render(renderer, FrameStats{});
    CHECK_FALSE(renderer.blits.empty());
}
