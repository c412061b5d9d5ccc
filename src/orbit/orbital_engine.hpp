#pragma once

/// @file orbital_engine.hpp
/// @brief Per-tick Keplerian advance of every orbiting body.

#include "core/types.hpp"
#include "orbit/simulation_context.hpp"
#include "scene/scene_graph.hpp"

#include <cstddef>

namespace orrery::orbit
{
    /// @brief Advances mean anomalies and resolves world positions.
    ///
    /// Bodies are visited in insertion order, which puts every parent before
    /// its children, so a moon always reads its planet's position from the
    /// current tick. The root star is never modified.
    class OrbitalEngine
    {
    public:
        /// @brief Advance one tick.
        /// @return Number of bodies advanced (0 when paused).
        static std::size_t step(scene::SceneGraph& scene, const SimulationContext& context);

        /// @brief Recompute one body's position from its current elements
        ///        without advancing time.
        static void place(scene::SceneGraph& scene, scene::BodyId id);
    };

} // namespace orrery::orbit
