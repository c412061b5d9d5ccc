#pragma once

/// @file scene_builder.hpp
/// @brief Converts catalog records (km, days) into scene bodies (pixels, radians per tick).

#include "catalog/body_record.hpp"
#include "core/types.hpp"
#include "scene/scene_graph.hpp"

#include <cstddef>

namespace orrery::catalog
{
    /// @brief Unit conversion constants used when populating a scene.
    struct SceneScale
    {
        f64 distance_scale = 1.335e-7;          ///< Pixels per km of semi-major axis
        f64 star_radius = 5.0;                  ///< Root star disk radius (pixels)
        f64 ticks_per_year = 3600.0;            ///< Ticks per orbit at the reference period
        f64 reference_period_days = 365.26;     ///< One Earth year

        // radius_px = max(min, base + gain · log10(radius_km / 1000))
        f64 planet_radius_base = 1.0;
        f64 planet_radius_gain = 8.0;
        f64 planet_min_radius = 1.0;
        f64 moon_radius_base = 0.5;
        f64 moon_radius_gain = 5.0;
        f64 moon_min_radius = 0.5;

        f64 min_period_days = 1e-9;             ///< Shorter periods give angular speed 0
    };

    /// @brief Populates a SceneGraph from a BodyRecord tree.
    ///
    /// The root record becomes the star at the given center. Its children
    /// become planets; every deeper record becomes a moon of its parent.
    /// Records with unusable elements are skipped, together with their
    /// subtree, and logged as warnings.
    class SceneBuilder
    {
    public:
        explicit SceneBuilder(SceneScale scale = {});

        /// @brief Add @p root and its subtree to an empty @p scene.
        /// @return Number of bodies added (0 if the scene already has a root).
        std::size_t build(scene::SceneGraph& scene, const BodyRecord& root, Vec2d center) const;

        [[nodiscard]] f64 pixel_distance(f64 km) const;
        [[nodiscard]] f64 planet_radius(f64 radius_km) const;
        [[nodiscard]] f64 moon_radius(f64 radius_km) const;

        /// @brief Radians per tick at time factor 1 for one reference period.
        [[nodiscard]] f64 base_speed() const;

        /// @brief ω₀ for a planet. Non-positive periods give 0.
        [[nodiscard]] f64 planet_angular_speed(f64 period_days) const;

        /// @brief ω₀ for a moon. Negative periods give a retrograde (negative) speed.
        [[nodiscard]] f64 moon_angular_speed(f64 period_days) const;

        /// @brief True if @p record can orbit something (a > 0, 0 ≤ e < 1).
        [[nodiscard]] static bool has_valid_orbit(const BodyRecord& record);

        [[nodiscard]] const SceneScale& scale() const { return m_scale; }

    private:
        std::size_t add_moons(scene::SceneGraph& scene, scene::BodyId parent,
                              const BodyRecord& record) const;

        SceneScale m_scale;
    };

} // namespace orrery::catalog
