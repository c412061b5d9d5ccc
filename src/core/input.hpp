#pragma once

/// @file input.hpp
/// @brief Translates raw SDL2 events into the controller's input events.
///
/// Input only queues events; it never touches the simulation. The
/// Application drains the queue once per frame and hands each event to
/// the Controller.

#include "sim/input_event.hpp"

#include <SDL2/SDL.h>

#include <optional>
#include <vector>

namespace orrery::core
{
    class Input
    {
    public:
        Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        /// @brief Queue the controller event for @p event, if it maps to one.
        void process_event(const SDL_Event& event);

        /// @brief Hand over everything queued since the last drain, in arrival order.
        [[nodiscard]] std::vector<sim::InputEvent> drain();

        [[nodiscard]] std::size_t pending() const { return m_queue.size(); }

        /// @brief Key binding table. Auto-repeat is filtered out by process_event().
        [[nodiscard]] static sim::Key map_key(SDL_Keycode key);

        [[nodiscard]] static sim::MouseButton map_button(Uint8 button);

    private:
        [[nodiscard]] static std::optional<sim::InputEvent> translate(const SDL_Event& event);

        std::vector<sim::InputEvent> m_queue;
    };

} // namespace orrery::core
