/// @file input.cpp
/// @brief SDL2 event translation.

#include "core/input.hpp"

#include <utility>

namespace orrery::core
{

void Input::process_event(const SDL_Event& event)
{
    if (auto translated = translate(event))
    {
        m_queue.push_back(std::move(*translated));
    }
}

std::vector<sim::InputEvent> Input::drain()
{
    std::vector<sim::InputEvent> events;
    events.swap(m_queue);
    return events;
}

sim::Key Input::map_key(SDL_Keycode key)
{
    switch (key)
    {
        case SDLK_ESCAPE:   return sim::Key::Escape;
        case SDLK_SPACE:    return sim::Key::Space;
        case SDLK_PLUS:
        case SDLK_EQUALS:
        case SDLK_KP_PLUS:  return sim::Key::Plus;
        case SDLK_MINUS:
        case SDLK_KP_MINUS: return sim::Key::Minus;
        case SDLK_i:        return sim::Key::ZoomIn;
        case SDLK_o:        return sim::Key::ZoomOut;
        case SDLK_r:        return sim::Key::Reset;
        default:            return sim::Key::Other;
    }
}

sim::MouseButton Input::map_button(Uint8 button)
{
    switch (button)
    {
        case SDL_BUTTON_LEFT:   return sim::MouseButton::Primary;
        case SDL_BUTTON_RIGHT:  return sim::MouseButton::Secondary;
        case SDL_BUTTON_MIDDLE: return sim::MouseButton::Middle;
        default:                return sim::MouseButton::Other;
    }
}

std::optional<sim::InputEvent> Input::translate(const SDL_Event& event)
{
    switch (event.type)
    {
        case SDL_QUIT:
            return sim::QuitEvent{};

        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
            {
                return sim::ResizeEvent{event.window.data1, event.window.data2};
            }
            if (event.window.event == SDL_WINDOWEVENT_CLOSE)
            {
                return sim::QuitEvent{};
            }
            return std::nullopt;

        case SDL_KEYDOWN:
        {
            if (event.key.repeat != 0)
            {
                return std::nullopt;
            }
            const sim::Key key = map_key(event.key.keysym.sym);
            if (key == sim::Key::Other)
            {
                return std::nullopt;
            }
            return sim::KeyDownEvent{key};
        }

        // The wheel is a shortcut for the zoom keys.
        case SDL_MOUSEWHEEL:
            if (event.wheel.y > 0)
            {
                return sim::KeyDownEvent{sim::Key::ZoomIn};
            }
            if (event.wheel.y < 0)
            {
                return sim::KeyDownEvent{sim::Key::ZoomOut};
            }
            return std::nullopt;

        case SDL_MOUSEBUTTONDOWN:
            return sim::PointerDownEvent{
                map_button(event.button.button),
                Vec2d{static_cast<f64>(event.button.x), static_cast<f64>(event.button.y)},
            };

        case SDL_MOUSEBUTTONUP:
            return sim::PointerUpEvent{map_button(event.button.button)};

        case SDL_MOUSEMOTION:
            return sim::PointerMoveEvent{
                Vec2d{static_cast<f64>(event.motion.x), static_cast<f64>(event.motion.y)},
            };

        default:
            return std::nullopt;
    }
}

} // namespace orrery::core
