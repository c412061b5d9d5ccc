#pragma once

/// @file celestial_body.hpp
/// @brief Body data model: identity, Keplerian elements, parent link, world position.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orrery::scene
{
    /// @brief Stable handle into the SceneGraph (insertion index).
    using BodyId = u32;

    /// @brief Ordered key/value facts shown in the selection overlay.
    using Facts = std::vector<std::pair<std::string, std::string>>;

    enum class BodyKind : u8
    {
        Star,
        Planet,
        Moon,
    };

    /// @brief Planar Keplerian elements. Periapsis lies on the parent's local +x axis.
    struct OrbitalElements
    {
        f64 semi_major_axis = 0.0;   ///< a (world units)
        f64 eccentricity = 0.0;      ///< e, in [0, 1)
        f64 mean_anomaly = 0.0;      ///< M (radians, [0, 2π))
        f64 one_minus_e2 = 1.0;      ///< Cached 1 − e²
    };

    /// @brief A star, planet or moon.
    ///
    /// The root star has zero elements and zero angular speed; its position is
    /// set once at construction. Every other body's position is derived each
    /// tick from its elements and the parent's current position.
    struct CelestialBody
    {
        BodyId id = 0;
        BodyKind kind = BodyKind::Star;
        std::string name;
        f64 radius = 1.0;                 ///< Visual radius (pixels at zoom 1)
        Color color;
        f64 mass = 0.0;                   ///< kg, informational only
        OrbitalElements elements;
        f64 base_angular_speed = 0.0;     ///< ω₀ (radians per tick at time factor 1)
        std::optional<BodyId> parent;     ///< Non-owning back-reference; empty for the root
        std::vector<BodyId> children;     ///< Owned subtree, in insertion order
        Vec2d position{0.0, 0.0};         ///< World position
        Facts facts;

        [[nodiscard]] bool is_root() const { return !parent.has_value(); }
        [[nodiscard]] bool has_facts() const { return !facts.empty(); }
    };

} // namespace orrery::scene
