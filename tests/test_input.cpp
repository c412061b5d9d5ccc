/// @file test_input.cpp
/// @brief Unit tests for SDL event translation in orrery::core::Input.
///
/// Events are built by hand, so SDL does not need to be initialized.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/input.hpp"
#include "core/types.hpp"
#include "sim/input_event.hpp"

#include <SDL2/SDL.h>

#include <variant>

using namespace orrery;
using namespace orrery::core;

namespace
{
    SDL_Event key_down(SDL_Keycode key, Uint8 repeat = 0)
    {
        SDL_Event event{};
        event.type = SDL_KEYDOWN;
        event.key.keysym.sym = key;
        event.key.repeat = repeat;
        return event;
    }

    SDL_Event mouse_button(Uint32 type, Uint8 button, Sint32 x, Sint32 y)
    {
        SDL_Event event{};
        event.type = type;
        event.button.button = button;
        event.button.x = x;
        event.button.y = y;
        return event;
    }

    SDL_Event window_event(SDL_WindowEventID id, Sint32 data1 = 0, Sint32 data2 = 0)
    {
        SDL_Event event{};
        event.type = SDL_WINDOWEVENT;
        event.window.event = static_cast<Uint8>(id);
        event.window.data1 = data1;
        event.window.data2 = data2;
        return event;
    }
}

// =================================================================
// Key mapping
// =================================================================

TEST_CASE("Keycodes map to viewer keys")
{
    CHECK(Input::map_key(SDLK_ESCAPE) == sim::Key::Escape);
    CHECK(Input::map_key(SDLK_SPACE) == sim::Key::Space);
    CHECK(Input::map_key(SDLK_PLUS) == sim::Key::Plus);
    CHECK(Input::map_key(SDLK_EQUALS) == sim::Key::Plus);
    CHECK(Input::map_key(SDLK_KP_PLUS) == sim::Key::Plus);
    CHECK(Input::map_key(SDLK_MINUS) == sim::Key::Minus);
    CHECK(Input::map_key(SDLK_KP_MINUS) == sim::Key::Minus);
    CHECK(Input::map_key(SDLK_i) == sim::Key::ZoomIn);
    CHECK(Input::map_key(SDLK_o) == sim::Key::ZoomOut);
    CHECK(Input::map_key(SDLK_r) == sim::Key::Reset);
    CHECK(Input::map_key(SDLK_q) == sim::Key::Other);
}

TEST_CASE("Mouse buttons map to pointer buttons")
{
    CHECK(Input::map_button(SDL_BUTTON_LEFT) == sim::MouseButton::Primary);
    CHECK(Input::map_button(SDL_BUTTON_RIGHT) == sim::MouseButton::Secondary);
    CHECK(Input::map_button(SDL_BUTTON_MIDDLE) == sim::MouseButton::Middle);
    CHECK(Input::map_button(SDL_BUTTON_X1) == sim::MouseButton::Other);
}

// =================================================================
// Event translation
// =================================================================

TEST_CASE("Key presses are queued and drained in order")
{
    Input input;
    input.process_event(key_down(SDLK_SPACE));
    input.process_event(key_down(SDLK_r));
    CHECK(input.pending() == 2);

    const auto events = input.drain();
    CHECK(input.pending() == 0);
    REQUIRE(events.size() == 2);
    CHECK(std::get<sim::KeyDownEvent>(events[0]).key == sim::Key::Space);
    CHECK(std::get<sim::KeyDownEvent>(events[1]).key == sim::Key::Reset);
}

TEST_CASE("Key repeats and unmapped keys are dropped")
{
    Input input;
    input.process_event(key_down(SDLK_PLUS, 1));
    input.process_event(key_down(SDLK_F1));
    CHECK(input.pending() == 0);
}

TEST_CASE("Mouse wheel zooms")
{
    Input input;

    SDL_Event up{};
    up.type = SDL_MOUSEWHEEL;
    up.wheel.y = 2;
    SDL_Event down = up;
    down.wheel.y = -1;
    SDL_Event sideways = up;
    sideways.wheel.y = 0;
    sideways.wheel.x = 3;

    input.process_event(up);
    input.process_event(down);
    input.process_event(sideways);

    const auto events = input.drain();
    REQUIRE(events.size() == 2);
    CHECK(std::get<sim::KeyDownEvent>(events[0]).key == sim::Key::ZoomIn);
    CHECK(std::get<sim::KeyDownEvent>(events[1]).key == sim::Key::ZoomOut);
}

TEST_CASE("Mouse buttons and motion become pointer events")
{
    Input input;
    input.process_event(mouse_button(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT, 10, 20));

    SDL_Event motion{};
    motion.type = SDL_MOUSEMOTION;
    motion.motion.x = 30;
    motion.motion.y = 45;
    input.process_event(motion);

    input.process_event(mouse_button(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT, 30, 45));

    const auto events = input.drain();
    REQUIRE(events.size() == 3);

    const auto& down = std::get<sim::PointerDownEvent>(events[0]);
    CHECK(down.button == sim::MouseButton::Primary);
    CHECK(down.position == Vec2d{10.0, 20.0});

    CHECK(std::get<sim::PointerMoveEvent>(events[1]).position == Vec2d{30.0, 45.0});

    const auto& up = std::get<sim::PointerUpEvent>(events[2]);
    CHECK(up.button == sim::MouseButton::Primary);
}

TEST_CASE("Window events become resize and quit")
{
    Input input;
    input.process_event(window_event(SDL_WINDOWEVENT_SIZE_CHANGED, 1024, 640));
    input.process_event(window_event(SDL_WINDOWEVENT_MOVED, 5, 5));
    input.process_event(window_event(SDL_WINDOWEVENT_CLOSE));

    SDL_Event quit{};
    quit.type = SDL_QUIT;
    input.process_event(quit);

    const auto events = input.drain();
    REQUIRE(events.size() == 3);
    const auto& resize = std::get<sim::ResizeEvent>(events[0]);
    CHECK(resize.width == 1024);
    CHECK(resize.height == 640);
    CHECK(std::holds_alternative<sim::QuitEvent>(events[1]));
    CHECK(std::holds_alternative<sim::QuitEvent>(events[2]));
}
