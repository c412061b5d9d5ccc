#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace orrery
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for world/screen positions)
    using Vec2d = glm::dvec2;

    // Vector types (float for GPU vertex data)
    using Vec2f = glm::vec2;
    using Vec4f = glm::vec4;

    // Integer pixel sizes
    using Vec2i = glm::ivec2;

    /// @brief 8-bit RGBA color, as catalogs and the renderer exchange it.
    struct Color
    {
        u8 r = 255;
        u8 g = 255;
        u8 b = 255;
        u8 a = 255;

        [[nodiscard]] Vec4f to_vec4() const
        {
            return Vec4f{r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
        }

        bool operator==(const Color&) const = default;
    };

    /// @brief Axis-aligned integer pixel rectangle.
    struct Rect
    {
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;

        bool operator==(const Rect&) const = default;
    };

    namespace colors
    {
        constexpr Color kBlack{0, 0, 0, 255};
        constexpr Color kWhite{255, 255, 255, 255};
        constexpr Color kMoon{200, 200, 200, 255};
        constexpr Color kOrbit{50, 50, 50, 64};
        constexpr Color kPanel{0, 0, 0, 128};
    }

    namespace math_constants
    {
        constexpr f64 kPi     = glm::pi<f64>();
        constexpr f64 kTwoPi  = 2.0 * kPi;
        constexpr f64 kHalfPi = kPi / 2.0;
    }
}
