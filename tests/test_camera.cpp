/// @file test_camera.cpp
/// @brief Unit tests for orrery::rendering::Camera.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "rendering/camera.hpp"

#include <cmath>

using namespace orrery;
using namespace orrery::rendering;

// =================================================================
// Projection
// =================================================================

TEST_CASE("Default camera maps the viewport center to itself")
{
    const Camera camera(1200, 800);
    CHECK(camera.zoom() == doctest::Approx(1.0));
    CHECK(camera.pan() == Vec2d{600.0, 400.0});

    const Vec2d s = camera.world_to_screen({600.0, 400.0});
    CHECK(s.x == doctest::Approx(600.0));
    CHECK(s.y == doctest::Approx(400.0));
}

TEST_CASE("Odd viewport sizes use integer halves")
{
    const Camera camera(1201, 801);
    CHECK(camera.pan() == Vec2d{600.0, 400.0});
    const Vec2d s = camera.world_to_screen({600.0, 400.0});
    CHECK(s.x == doctest::Approx(600.0));
    CHECK(s.y == doctest::Approx(400.0));
}

TEST_CASE("world_to_screen and screen_to_world are inverses")
{
    // Zoom levels reached by clamped stepping, besides the exact limits
    Camera stepped(1024, 768);
    for (int i = 0; i < 7; ++i)
    {
        stepped.zoom_in();
    }
    const f64 stepped_in = stepped.zoom();
    for (int i = 0; i < 200; ++i)
    {
        stepped.zoom_out();
    }
    const f64 clamped_out = stepped.zoom();

    const f64 zooms[] = {Camera::kMinZoom, 1.0, Camera::kMaxZoom, 2.5, stepped_in, clamped_out};
    const Vec2d pans[] = {
        Vec2d{512.0, 384.0},
        Vec2d{-37.5, 810.25},
        Vec2d{-1e5, -2.5e4},
        Vec2d{3.75e6, 1e6},
    };
    const Vec2d points[] = {Vec2d{0.0, 0.0}, Vec2d{123.4, -56.7}, Vec2d{1e4, 3e3}, Vec2d{-8e5, 4.2e5}};

    for (const f64 zoom : zooms)
    {
        for (const Vec2d pan : pans)
        {
            Camera camera(1024, 768);
            camera.set_zoom(zoom);
            camera.set_pan(pan);
            REQUIRE(camera.zoom() == doctest::Approx(zoom));

            // Rounding grows with the largest coordinate involved
            const f64 reach = std::abs(pan.x) + std::abs(pan.y) + 1e6;

            CAPTURE(zoom);
            for (const Vec2d world : points)
            {
                const Vec2d back = camera.screen_to_world(camera.world_to_screen(world));
                CHECK(back.x == doctest::Approx(world.x).epsilon(1e-12).scale(reach));
                CHECK(back.y == doctest::Approx(world.y).epsilon(1e-12).scale(reach));
            }

            const Vec2d screen{17.0, 701.0};
            const Vec2d again = camera.world_to_screen(camera.screen_to_world(screen));
            CHECK(again.x == doctest::Approx(screen.x).epsilon(1e-12).scale(reach * zoom));
            CHECK(again.y == doctest::Approx(screen.y).epsilon(1e-12).scale(reach * zoom));
        }
    }
}

TEST_CASE("scale_length multiplies by zoom")
{
    Camera camera(800, 600);
    camera.set_zoom(0.5);
    CHECK(camera.scale_length(10.0) == doctest::Approx(5.0));
}

// =================================================================
// Zoom
// =================================================================

TEST_CASE("Zoom steps and clamps")
{
    Camera camera(800, 600);
    camera.zoom_in();
    CHECK(camera.zoom() == doctest::Approx(1.1));
    camera.zoom_out();
    CHECK(camera.zoom() == doctest::Approx(1.1 * 0.909));

    for (int i = 0; i < 100; ++i)
    {
        camera.zoom_in();
    }
    CHECK(camera.zoom() == doctest::Approx(Camera::kMaxZoom));

    for (int i = 0; i < 200; ++i)
    {
        camera.zoom_out();
    }
    CHECK(camera.zoom() == doctest::Approx(Camera::kMinZoom));

    camera.set_zoom(100.0);
    CHECK(camera.zoom() == doctest::Approx(5.0));
    camera.set_zoom(0.0);
    CHECK(camera.zoom() == doctest::Approx(0.05));
}

// =================================================================
// Drag / resize
// =================================================================

TEST_CASE("Dragging right moves the pan left in world units")
{
    Camera camera(800, 600);
    camera.set_zoom(2.0);
    const Vec2d before = camera.pan();
    camera.drag(20.0, -10.0);
    CHECK(camera.pan().x == doctest::Approx(before.x - 10.0));
    CHECK(camera.pan().y == doctest::Approx(before.y + 5.0));
}

TEST_CASE("A dragged world point follows the pointer")
{
    Camera camera(800, 600);
    const Vec2d world{250.0, 100.0};
    const Vec2d before = camera.world_to_screen(world);
    camera.drag(30.0, 40.0);
    const Vec2d after = camera.world_to_screen(world);
    CHECK(after.x == doctest::Approx(before.x + 30.0));
    CHECK(after.y == doctest::Approx(before.y + 40.0));
}

TEST_CASE("resize recenters the pan and keeps the zoom")
{
    Camera camera(800, 600);
    camera.set_zoom(3.0);
    camera.drag(100.0, 100.0);
    camera.resize(1000, 500);
    CHECK(camera.width() == 1000);
    CHECK(camera.height() == 500);
    CHECK(camera.viewport() == Vec2i{1000, 500});
    CHECK(camera.pan() == Vec2d{500.0, 250.0});
    CHECK(camera.zoom() == doctest::Approx(3.0));
}

TEST_CASE("reset restores the default zoom")
{
    Camera camera(800, 600);
    camera.set_zoom(3.0);
    camera.drag(5.0, 5.0);
    camera.reset(800, 600);
    CHECK(camera.zoom() == doctest::Approx(1.0));
    CHECK(camera.pan() == Vec2d{400.0, 300.0});
}
