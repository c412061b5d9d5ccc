#pragma once

/// @file input_event.hpp
/// @brief Window-system independent input events consumed by the Controller.

#include "core/types.hpp"

#include <variant>

namespace orrery::sim
{
    /// @brief Commands the keyboard can issue. The platform layer maps
    ///        physical keys onto these.
    enum class Key : u8
    {
        Escape,
        Space,
        Plus,
        Minus,
        ZoomIn,
        ZoomOut,
        Reset,
        Other,
    };

    enum class MouseButton : u8
    {
        Primary,
        Secondary,
        Middle,
        Other,
    };

    struct ResizeEvent
    {
        i32 width = 0;
        i32 height = 0;
    };

    struct KeyDownEvent
    {
        Key key = Key::Other;
    };

    struct PointerDownEvent
    {
        MouseButton button = MouseButton::Primary;
        Vec2d position{0.0, 0.0};
    };

    struct PointerUpEvent
    {
        MouseButton button = MouseButton::Primary;
    };

    struct PointerMoveEvent
    {
        Vec2d position{0.0, 0.0};
    };

    /// @brief Window close request.
    struct QuitEvent
    {
    };

    using InputEvent = std::variant<ResizeEvent, KeyDownEvent, PointerDownEvent,
                                    PointerUpEvent, PointerMoveEvent, QuitEvent>;

} // namespace orrery::sim
