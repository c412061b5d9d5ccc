/// @file test_scene_renderer.cpp
/// @brief Unit tests for orrery::rendering::SceneRenderer and its layout helpers.
///
/// Frames are drawn into a RecordingRenderer and checked for draw order,
/// cache use and overlay placement.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "recording_renderer.hpp"

#include "core/types.hpp"
#include "orbit/orbital_engine.hpp"
#include "orbit/simulation_context.hpp"
#include "rendering/camera.hpp"
#include "rendering/render_cache.hpp"
#include "rendering/scene_renderer.hpp"
#include "scene/scene_graph.hpp"

#include <algorithm>

using namespace orrery;
using namespace orrery::rendering;
using namespace orrery::scene;

namespace
{
    struct Fixture
    {
        SceneGraph scene{11};
        Camera camera{1200, 800};
        RenderCacheSet caches;
        SceneRenderer renderer;
        testing::RecordingRenderer out;
        BodyId sun = 0;
        BodyId planet = 0;
        BodyId moon = 0;

        Fixture()
        {
            sun = *scene.add_star({600.0, 400.0}, 5.0, Color{255, 255, 0, 255}, "Sun");
            planet = *scene.add_planet(sun,
                OrbitSpec{.semi_major_axis = 150.0, .eccentricity = 0.1, .angular_speed = 0.02, .radius = 3.0},
                Color{0, 0, 255, 255}, "Earth", Facts{{"Mass", "5.97e24 kg"}});
            moon = *scene.add_moon(planet,
                OrbitSpec{.semi_major_axis = 20.0, .eccentricity = 0.05, .angular_speed = 0.1, .radius = 1.0},
                "Moon");
            caches.reset(scene.size());
            orbit::OrbitalEngine::step(scene, orbit::SimulationContext{});
        }

        void frame(const FrameView& view = {})
        {
            out.clear();
            renderer.render(out, scene, camera, caches, view);
        }
    };
}

// =================================================================
// Layout helpers
// =================================================================

TEST_CASE("Culling keeps half a viewport of margin")
{
    const Camera camera(800, 600);
    CHECK_FALSE(is_culled({-399.0, 300.0}, camera));
    CHECK(is_culled({-401.0, 300.0}, camera));
    CHECK_FALSE(is_culled({1200.0, 300.0}, camera));
    CHECK(is_culled({1201.0, 300.0}, camera));
    CHECK(is_culled({400.0, 1001.0}, camera));
    CHECK_FALSE(is_culled({400.0, -400.0}, camera));
}

TEST_CASE("Overlay sits beside the pointer and flips on overflow")
{
    const Vec2i viewport{800, 600};
    CHECK(overlay_position({100.0, 100.0}, {50, 40}, viewport) == Vec2i{120, 120});
    CHECK(overlay_position({780.0, 100.0}, {50, 40}, viewport) == Vec2i{710, 120});
    CHECK(overlay_position({100.0, 590.0}, {50, 40}, viewport) == Vec2i{120, 530});
    CHECK(overlay_position({780.0, 590.0}, {50, 40}, viewport) == Vec2i{710, 530});
}

TEST_CASE("Labels go above in the top half and below otherwise")
{
    CHECK(label_offset(100.0, 5.0, 600) == doctest::Approx(-20.0));
    CHECK(label_offset(300.0, 5.0, 600) == doctest::Approx(10.0));
    CHECK(label_offset(500.0, 2.0, 600) == doctest::Approx(7.0));
}

// =================================================================
// Orbits
// =================================================================

TEST_CASE("Star-child orbits are cached and deeper orbits are drawn fresh")
{
    Fixture f;
    f.frame();

    CHECK(f.caches[f.planet].orbit.rebuild_count() == 1);
    CHECK(f.caches[f.planet].orbit.surface().has_value());
    CHECK(f.caches[f.moon].orbit.rebuild_count() == 0);
    CHECK_FALSE(f.caches[f.moon].orbit.surface().has_value());

    REQUIRE(f.out.polylines.size() == 1);
    const auto& ring = f.out.polylines.front();
    CHECK(ring.closed);
    CHECK(ring.points.size() == 30);
    CHECK(ring.width == doctest::Approx(1.0));
    CHECK(ring.color == colors::kOrbit);
    for (const Vec2d p : ring.points)
    {
        CHECK(p.x == static_cast<f64>(static_cast<i32>(p.x)));
        CHECK(p.y == static_cast<f64>(static_cast<i32>(p.y)));
    }

    for (int i = 0; i < 10; ++i)
    {
        orbit::OrbitalEngine::step(f.scene, orbit::SimulationContext{});
        f.frame();
        CHECK(f.out.polylines.size() == 1);
    }
    CHECK(f.caches[f.planet].orbit.rebuild_count() == 1);
    CHECK(f.caches[f.moon].orbit.rebuild_count() == 0);
}

TEST_CASE("Panning past the tolerance rebuilds the cached orbit once")
{
    Fixture f;
    f.frame();
    f.camera.drag(5.0, 0.0);
    f.frame();
    f.frame();
    CHECK(f.caches[f.planet].orbit.rebuild_count() == 2);
}

// =================================================================
// Bodies and labels
// =================================================================

TEST_CASE("Disks are drawn at truncated centers with a minimum radius")
{
    Fixture f;
    f.camera.set_zoom(0.5);
    f.frame();

    REQUIRE(f.out.circles.size() == 3);
    CHECK(f.out.circles[0].center == Vec2d{600.0, 400.0});
    CHECK(f.out.circles[0].radius == doctest::Approx(2.0));
    CHECK(f.out.circles[1].radius == doctest::Approx(1.0));
    CHECK(f.out.circles[2].radius == doctest::Approx(1.0));
    CHECK(f.out.circles[2].color == colors::kMoon);
}

TEST_CASE("Only bodies larger than one pixel get a cached label")
{
    Fixture f;
    f.frame();
    CHECK(std::count(f.out.texts.begin(), f.out.texts.end(), "Sun") == 1);
    CHECK(std::count(f.out.texts.begin(), f.out.texts.end(), "Earth") == 1);
    CHECK(std::count(f.out.texts.begin(), f.out.texts.end(), "Moon") == 0);

    f.frame();
    CHECK(f.out.texts.empty());
}

TEST_CASE("Sun label is centered above the disk in the top half")
{
    Fixture f;
    f.scene.body(f.sun).position = Vec2d{600.0, 200.0};
    f.frame();

    const i32 width = f.caches[f.sun].label->width();
    const auto it = std::find_if(f.out.blits.begin(), f.out.blits.end(), [&](const auto& b) {
        return b.surface.width() == width && b.dest.y == 200 - 5 - 15;
    });
    REQUIRE(it != f.out.blits.end());
    CHECK(it->dest.x == 600 - width / 2);
}

TEST_CASE("Off-screen bodies are skipped")
{
    Fixture f;
    f.scene.body(f.moon).position = Vec2d{-5000.0, -5000.0};
    f.frame();
    CHECK(f.out.circles.size() == 2);
    CHECK(f.out.polylines.empty());
}

// =================================================================
// Facts and HUD
// =================================================================

TEST_CASE("Selected body shows its facts beside the pointer")
{
    Fixture f;
    FrameView view;
    view.selected = f.planet;
    view.pointer = Vec2d{100.0, 100.0};
    f.frame(view);

    const Surface& panel = *f.caches[f.planet].facts;
    REQUIRE(f.out.blits.size() >= 2);
    const auto& facts_blit = f.out.blits[f.out.blits.size() - 2];
    CHECK(facts_blit.dest == Rect{120, 120, panel.width(), panel.height()});

    f.frame(view);
    CHECK(f.caches[f.planet].facts_build_count == 1);
}

TEST_CASE("Selecting a body without facts draws no panel")
{
    Fixture f;
    f.frame();
    const std::size_t without = f.out.blits.size();

    FrameView view;
    view.selected = f.moon;
    f.frame(view);
    CHECK(f.out.blits.size() == without);
}

TEST_CASE("HUD is drawn last and rebuilt only when its contents change")
{
    Fixture f;
    FrameView view;
    view.hud = HudInfo{.fps = 60, .time_factor = 1.0, .paused = false, .planet_count = 1, .moon_count = 1};
    f.frame(view);
    CHECK(f.renderer.hud_build_count() == 1);

    const auto& hud = f.out.blits.back();
    CHECK(hud.dest.x == 10);
    CHECK(hud.dest.y == 10);
    CHECK(hud.surface.height() == 13 * 22 + 20);
    CHECK(std::find(f.out.texts.begin(), f.out.texts.end(), "Time Scale: 1.0x") != f.out.texts.end());
    CHECK(std::find(f.out.texts.begin(), f.out.texts.end(), "ESC - Exit") != f.out.texts.end());

    f.frame(view);
    f.frame(view);
    CHECK(f.renderer.hud_build_count() == 1);

    view.hud.paused = true;
    view.hud.time_factor = 2.5;
    f.frame(view);
    CHECK(f.renderer.hud_build_count() == 2);
    CHECK(std::find(f.out.texts.begin(), f.out.texts.end(), "Time Scale: 2.5x (Paused)") != f.out.texts.end());

    f.renderer.invalidate_hud();
    f.frame(view);
    CHECK(f.renderer.hud_build_count() == 3);
}
