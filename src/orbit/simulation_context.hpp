#pragma once

/// @file simulation_context.hpp
/// @brief Time scale and pause state handed to the orbital engine each tick.

#include "core/types.hpp"

namespace orrery::orbit
{
    /// @brief Simulation speed settings.
    ///
    /// The keyboard steps (speed_up / slow_down) stay within
    /// [kMinStepFactor, kMaxTimeFactor]. set_time_factor() additionally
    /// accepts 0, which freezes motion without pausing.
    class SimulationContext
    {
    public:
        SimulationContext() = default;

        /// @brief Multiply the time factor by kStepRatio, clamped to kMaxTimeFactor.
        void speed_up();

        /// @brief Divide the time factor by kStepRatio, clamped to kMinStepFactor.
        void slow_down();

        void toggle_pause() { m_paused = !m_paused; }
        void set_paused(bool paused) { m_paused = paused; }

        /// @brief Set the time factor directly, clamped to [0, kMaxTimeFactor].
        void set_time_factor(f64 factor);

        /// @brief Back to the default time factor. The pause state is left as is.
        void reset();

        [[nodiscard]] f64 time_factor() const { return m_time_factor; }
        [[nodiscard]] bool paused() const { return m_paused; }

        static constexpr f64 kDefaultTimeFactor = 1.0;
        static constexpr f64 kMinStepFactor     = 0.01;
        static constexpr f64 kMaxTimeFactor     = 100.0;
        static constexpr f64 kStepRatio         = 1.5;

    private:
        f64 m_time_factor = kDefaultTimeFactor;
        bool m_paused = false;
    };

} // namespace orrery::orbit
