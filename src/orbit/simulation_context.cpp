/// @file simulation_context.cpp
/// @brief SimulationContext speed controls.

#include "orbit/simulation_context.hpp"

#include <algorithm>

namespace orrery::orbit
{

void SimulationContext::speed_up()
{
    m_time_factor = std::min(m_time_factor * kStepRatio, kMaxTimeFactor);
}

void SimulationContext::slow_down()
{
    m_time_factor = std::max(m_time_factor / kStepRatio, kMinStepFactor);
}

void SimulationContext::set_time_factor(f64 factor)
{
    m_time_factor = std::clamp(factor, 0.0, kMaxTimeFactor);
}

void SimulationContext::reset()
{
    m_time_factor = kDefaultTimeFactor;
}

} // namespace orrery::orbit
