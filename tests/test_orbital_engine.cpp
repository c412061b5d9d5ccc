/// @file test_orbital_engine.cpp
/// @brief Unit tests for orrery::orbit::OrbitalEngine and SimulationContext.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "orbit/orbital_engine.hpp"
#include "orbit/simulation_context.hpp"
#include "scene/scene_graph.hpp"

#include <cmath>

using namespace orrery;
using namespace orrery::orbit;
using namespace orrery::scene;

namespace
{
    struct System
    {
        SceneGraph scene{42};
        BodyId sun = 0;
        BodyId planet = 0;
        BodyId moon = 0;
    };

    System make_system(f64 e = 0.2)
    {
        System s;
        s.sun = *s.scene.add_star({600.0, 400.0}, 5.0, colors::kWhite, "Sun");
        s.planet = *s.scene.add_planet(s.sun,
            OrbitSpec{.semi_major_axis = 100.0, .eccentricity = e, .angular_speed = 0.05, .radius = 3.0},
            colors::kWhite, "Planet");
        s.moon = *s.scene.add_moon(s.planet,
            OrbitSpec{.semi_major_axis = 15.0, .eccentricity = 0.1, .angular_speed = -0.2, .radius = 1.0},
            "Moon");
        return s;
    }
}

// =================================================================
// step
// =================================================================

TEST_CASE("Root never moves")
{
    System s = make_system();
    SimulationContext context;
    const Vec2d before = s.scene.body(s.sun).position;
    for (int i = 0; i < 100; ++i)
    {
        OrbitalEngine::step(s.scene, context);
    }
    CHECK(s.scene.body(s.sun).position == before);
}

TEST_CASE("Paused context leaves state unchanged")
{
    System s = make_system();
    SimulationContext context;
    OrbitalEngine::step(s.scene, context);

    context.set_paused(true);
    const f64 m = s.scene.body(s.planet).elements.mean_anomaly;
    const Vec2d p = s.scene.body(s.moon).position;
    CHECK(OrbitalEngine::step(s.scene, context) == 0);
    CHECK(s.scene.body(s.planet).elements.mean_anomaly == m);
    CHECK(s.scene.body(s.moon).position == p);
}

TEST_CASE("Time factor 0 advances nothing")
{
    System s = make_system();
    SimulationContext context;
    OrbitalEngine::step(s.scene, context);

    context.set_time_factor(0.0);
    const f64 m = s.scene.body(s.planet).elements.mean_anomaly;
    const Vec2d p = s.scene.body(s.planet).position;
    CHECK(OrbitalEngine::step(s.scene, context) == 2);
    CHECK(s.scene.body(s.planet).elements.mean_anomaly == doctest::Approx(m));
    CHECK(s.scene.body(s.planet).position.x == doctest::Approx(p.x));
    CHECK(s.scene.body(s.planet).position.y == doctest::Approx(p.y));
}

TEST_CASE("Distance to parent stays within apsides")
{
    System s = make_system(0.4);
    SimulationContext context;
    context.set_time_factor(3.0);
    for (int i = 0; i < 500; ++i)
    {
        OrbitalEngine::step(s.scene, context);
        const auto& planet = s.scene.body(s.planet);
        const f64 r = glm::distance(planet.position, s.scene.body(s.sun).position);
        CHECK(r >= 60.0 - 1e-9);
        CHECK(r <= 140.0 + 1e-9);

        const f64 m = planet.elements.mean_anomaly;
        CHECK(m >= 0.0);
        CHECK(m < math_constants::kTwoPi);
    }
}

TEST_CASE("Moon follows its planet within the same tick")
{
    System s = make_system();
    SimulationContext context;
    OrbitalEngine::step(s.scene, context);
    const f64 r = glm::distance(s.scene.body(s.moon).position, s.scene.body(s.planet).position);
    CHECK(r >= 15.0 * 0.9 - 1e-9);
    CHECK(r <= 15.0 * 1.1 + 1e-9);
}

TEST_CASE("Half orbit of a circular body lands opposite periapsis")
{
    SceneGraph scene(1);
    const auto sun = *scene.add_star({600.0, 400.0}, 5.0, colors::kWhite, "Sun");
    const auto planet = *scene.add_planet(sun,
        OrbitSpec{.semi_major_axis = 100.0, .eccentricity = 0.0, .angular_speed = math_constants::kPi},
        colors::kWhite, "Planet");
    scene.body(planet).elements.mean_anomaly = 0.0;

    OrbitalEngine::step(scene, SimulationContext{});
    const Vec2d p = scene.body(planet).position;
    CHECK(p.x == doctest::Approx(500.0));
    CHECK(p.y == doctest::Approx(400.0));
}

// =================================================================
// SimulationContext
// =================================================================

TEST_CASE("Speed controls step by 1.5 and clamp")
{
    SimulationContext context;
    CHECK(context.time_factor() == doctest::Approx(1.0));
    context.speed_up();
    CHECK(context.time_factor() == doctest::Approx(1.5));
    context.slow_down();
    context.slow_down();
    CHECK(context.time_factor() == doctest::Approx(1.0 / 1.5));

    for (int i = 0; i < 50; ++i)
    {
        context.speed_up();
    }
    CHECK(context.time_factor() == doctest::Approx(100.0));

    for (int i = 0; i < 50; ++i)
    {
        context.slow_down();
    }
    CHECK(context.time_factor() == doctest::Approx(0.01));

    context.set_time_factor(-3.0);
    CHECK(context.time_factor() == doctest::Approx(0.0));
    context.set_time_factor(500.0);
    CHECK(context.time_factor() == doctest::Approx(100.0));
}

TEST_CASE("Pause toggles and reset restores the default factor")
{
    SimulationContext context;
    context.toggle_pause();
    CHECK(context.paused());
    context.toggle_pause();
    CHECK_FALSE(context.paused());

    context.set_paused(true);
    context.speed_up();
    context.reset();
    CHECK(context.paused());
    CHECK(context.time_factor() == doctest::Approx(1.0));

    context.set_paused(false);
    context.set_time_factor(0.0);
    context.reset();
    CHECK_FALSE(context.paused());
    CHECK(context.time_factor() == doctest::Approx(1.0));
}
