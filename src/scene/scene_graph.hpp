#pragma once

/// @file scene_graph.hpp
/// @brief Ownership tree of bodies (star → planets → moons) with insertion-order traversal.

#include "core/random.hpp"
#include "core/types.hpp"
#include "scene/celestial_body.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::scene
{
    /// @brief Parameters shared by add_planet() and add_moon().
    struct OrbitSpec
    {
        f64 semi_major_axis = 0.0;
        f64 eccentricity = 0.0;
        f64 angular_speed = 0.0;
        f64 radius = 1.0;
        f64 mass = 0.0;
    };

    /// @brief Owns every body of one planetary system.
    ///
    /// Bodies are stored in insertion order and addressed by BodyId. A parent
    /// has to exist before a child can be added, so insertion order is also a
    /// parent-before-child order; the orbital engine and the renderer rely on it.
    ///
    /// Initial mean anomalies are drawn from a PCG generator seeded at
    /// construction, so two graphs built with the same seed and the same calls
    /// are identical.
    class SceneGraph
    {
    public:
        explicit SceneGraph(u64 seed);

        /// @brief Create the root star at a fixed world position.
        /// @return The root id, or std::nullopt if a root already exists.
        std::optional<BodyId> add_star(Vec2d position, f64 radius, Color color,
                                       std::string name, f64 mass = 0.0, Facts facts = {});

        /// @brief Add a body orbiting @p parent.
        /// @return The new id, or std::nullopt if the parent is unknown or the
        ///         elements are out of range (a <= 0, e outside [0, 1)).
        std::optional<BodyId> add_planet(BodyId parent, const OrbitSpec& orbit, Color color,
                                         std::string name, Facts facts = {});

        /// @brief Add a moon orbiting @p parent.
        ///
        /// When the parent is not the root star, the semi-major axis is raised
        /// to at least twice the parent's radius so the orbit clears the
        /// parent's disk.
        std::optional<BodyId> add_moon(BodyId parent, const OrbitSpec& orbit,
                                       std::string name, Facts facts = {});

        /// @brief Drop every body. The random source keeps its state.
        void clear();

        [[nodiscard]] std::size_t size() const { return m_bodies.size(); }
        [[nodiscard]] bool empty() const { return m_bodies.empty(); }
        [[nodiscard]] bool contains(BodyId id) const { return id < m_bodies.size(); }

        [[nodiscard]] std::optional<BodyId> root() const;

        [[nodiscard]] const CelestialBody& body(BodyId id) const { return m_bodies[id]; }
        [[nodiscard]] CelestialBody& body(BodyId id) { return m_bodies[id]; }

        /// @brief All bodies in insertion order.
        [[nodiscard]] std::span<const CelestialBody> bodies() const { return m_bodies; }
        [[nodiscard]] std::span<CelestialBody> bodies() { return m_bodies; }

        [[nodiscard]] std::span<const BodyId> children(BodyId id) const;

        /// @brief Case-insensitive lookup, first match in insertion order.
        [[nodiscard]] std::optional<BodyId> find_by_name(std::string_view name) const;

        [[nodiscard]] std::size_t star_count() const { return m_star_count; }
        [[nodiscard]] std::size_t planet_count() const { return m_planet_count; }
        [[nodiscard]] std::size_t moon_count() const { return m_moon_count; }

        /// @brief True if @p id orbits the root star directly.
        [[nodiscard]] bool is_star_child(BodyId id) const;

    private:
        std::optional<BodyId> add_orbiter(BodyKind kind, BodyId parent, f64 semi_major_axis,
                                          const OrbitSpec& orbit, Color color,
                                          std::string name, Facts facts);

        [[nodiscard]] static bool validate(const OrbitSpec& orbit, f64 semi_major_axis,
                                           std::string_view name);

        std::vector<CelestialBody> m_bodies;
        core::PcgRng m_rng;

        std::size_t m_star_count = 0;
        std::size_t m_planet_count = 0;
        std::size_t m_moon_count = 0;
    };

} // namespace orrery::scene
