/// @file test_scene_builder.cpp
/// @brief Unit tests for catalog scaling and the built-in Solar System catalog.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "catalog/body_record.hpp"
#include "catalog/scene_builder.hpp"
#include "catalog/solar_system_catalog.hpp"
#include "core/types.hpp"
#include "scene/scene_graph.hpp"

#include <cmath>

using namespace orrery;
using namespace orrery::catalog;

namespace
{
    BodyRecord record(const char* name, f64 orbit_km, f64 period_days, f64 e = 0.0, f64 radius_km = 2000.0)
    {
        BodyRecord r;
        r.name = name;
        r.radius_km = radius_km;
        r.orbit_radius_km = orbit_km;
        r.orbital_period_days = period_days;
        r.eccentricity = e;
        return r;
    }

    const Vec2d kCenter{600.0, 400.0};
}

// =================================================================
// Unit conversion
// =================================================================

TEST_CASE("Distances scale linearly from km to pixels")
{
    const SceneBuilder builder;
    CHECK(builder.pixel_distance(149.6e6) == doctest::Approx(149.6e6 * 1.335e-7));
    CHECK(builder.pixel_distance(0.0) == doctest::Approx(0.0));
}

TEST_CASE("Body radii follow the logarithmic size curves")
{
    const SceneBuilder builder;
    CHECK(builder.planet_radius(6371.0) == doctest::Approx(1.0 + 8.0 * std::log10(6.371)));
    CHECK(builder.planet_radius(69911.0) == doctest::Approx(1.0 + 8.0 * std::log10(69.911)));
    CHECK(builder.planet_radius(500.0) == doctest::Approx(1.0));
    CHECK(builder.moon_radius(1737.4) == doctest::Approx(0.5 + 5.0 * std::log10(1.7374)));
    CHECK(builder.moon_radius(11.0) == doctest::Approx(0.5));
    CHECK(builder.moon_radius(0.0) == doctest::Approx(0.5));
}

TEST_CASE("Angular speed is one turn per 3600 ticks per reference year")
{
    const SceneBuilder builder;
    CHECK(builder.base_speed() == doctest::Approx(math_constants::kTwoPi / 3600.0));
    CHECK(builder.planet_angular_speed(365.26) == doctest::Approx(builder.base_speed()));
    CHECK(builder.planet_angular_speed(365.26 / 4.0) == doctest::Approx(4.0 * builder.base_speed()));
}

TEST_CASE("Zero and negative periods")
{
    const SceneBuilder builder;
    CHECK(builder.planet_angular_speed(0.0) == 0.0);
    CHECK(builder.planet_angular_speed(-10.0) == 0.0);
    CHECK(builder.moon_angular_speed(0.0) == 0.0);
    CHECK(builder.moon_angular_speed(1e-12) == 0.0);

    const f64 prograde = builder.moon_angular_speed(5.877);
    const f64 retrograde = builder.moon_angular_speed(-5.877);
    CHECK(prograde > 0.0);
    CHECK(retrograde == doctest::Approx(-prograde));
}

// =================================================================
// build
// =================================================================

TEST_CASE("Small system builds star, planets and moons")
{
    BodyRecord sun = record("Sun", 0.0, 0.0, 0.0, 696340.0);
    BodyRecord earth = record("Earth", 149.6e6, 365.26, 0.0167, 6371.0);
    earth.children.push_back(record("Moon", 384400.0, 27.3, 0.0549, 1737.4));
    sun.children.push_back(earth);

    scene::SceneGraph scene(1);
    const SceneBuilder builder;
    CHECK(builder.build(scene, sun, kCenter) == 3);

    const auto& star = scene.body(*scene.root());
    CHECK(star.position == kCenter);
    CHECK(star.radius == doctest::Approx(5.0));

    const auto& planet = scene.body(*scene.find_by_name("Earth"));
    CHECK(planet.elements.semi_major_axis == doctest::Approx(149.6e6 * 1.335e-7));
    CHECK(planet.elements.eccentricity == doctest::Approx(0.0167));
    CHECK(planet.base_angular_speed == doctest::Approx(builder.base_speed()));

    // The Moon's scaled orbit is inside Earth's disk, so it is pushed out to 2r
    const auto& moon = scene.body(*scene.find_by_name("Moon"));
    CHECK(moon.elements.semi_major_axis == doctest::Approx(2.0 * planet.radius));
    CHECK(moon.radius == doctest::Approx(builder.moon_radius(1737.4)));
}

TEST_CASE("Invalid records are skipped together with their subtree")
{
    BodyRecord sun = record("Sun", 0.0, 0.0);
    BodyRecord broken = record("Broken", -1.0, 100.0);
    broken.children.push_back(record("Orphan", 1000.0, 1.0));
    BodyRecord hyperbolic = record("Hyperbolic", 1e8, 100.0, 1.2);
    BodyRecord fine = record("Fine", 1e8, 100.0);
    fine.children.push_back(record("Bad moon", 0.0, 1.0));
    fine.children.push_back(record("Good moon", 1e6, 1.0));
    sun.children = {broken, hyperbolic, fine};

    scene::SceneGraph scene(1);
    CHECK(SceneBuilder{}.build(scene, sun, kCenter) == 3);
    CHECK(scene.planet_count() == 1);
    CHECK(scene.moon_count() == 1);
    CHECK_FALSE(scene.find_by_name("Orphan").has_value());
    CHECK_FALSE(scene.find_by_name("Bad moon").has_value());
    CHECK(scene.find_by_name("Good moon").has_value());
}

TEST_CASE("Building into a scene that already has a root adds nothing")
{
    const BodyRecord sun = record("Sun", 0.0, 0.0);
    scene::SceneGraph scene(1);
    const SceneBuilder builder;
    CHECK(builder.build(scene, sun, kCenter) == 1);
    CHECK(builder.build(scene, sun, kCenter) == 0);
    CHECK(scene.size() == 1);
}

// =================================================================
// Built-in catalog
// =================================================================

TEST_CASE("Solar System catalog builds completely")
{
    const BodyRecord& sun = solar_system();
    CHECK(sun.name == "Sun");
    CHECK(sun.children.size() == 18);

    scene::SceneGraph scene(0x853c49e6748fea9bULL);
    const std::size_t added = SceneBuilder{}.build(scene, sun, kCenter);
    CHECK(added == 1 + 18 + 31);
    CHECK(scene.planet_count() == 18);
    CHECK(scene.moon_count() == 31);
    CHECK(scene.star_count() == 1);

    CHECK(scene.find_by_name("Earth").has_value());
    CHECK(scene.find_by_name("Jupiter").has_value());
    CHECK(scene.find_by_name("Pluto").has_value());
    CHECK(scene.is_star_child(*scene.find_by_name("Neptune")));
}

TEST_CASE("Retrograde moons orbit backwards")
{
    scene::SceneGraph scene(1);
    (void)SceneBuilder{}.build(scene, solar_system(), kCenter);
    const auto triton = scene.find_by_name("Triton");
    REQUIRE(triton.has_value());
    CHECK(scene.body(*triton).base_angular_speed < 0.0);
    CHECK(scene.body(*scene.find_by_name("Moon")).base_angular_speed > 0.0);
}
