#pragma once

/// @file stroke_font.hpp
/// @brief Vector text: glyphs drawn as line strokes into a Surface.

#include "core/types.hpp"
#include "rendering/surface.hpp"

#include <string_view>

namespace orrery::rendering
{
    /// @brief Monoline stroke font on a 4 × 6 design grid.
    ///
    /// Uppercase letters, digits and common punctuation have their own glyphs.
    /// Lowercase letters are drawn as small capitals. Characters without a
    /// glyph (including any non-ASCII code point) render as an open box.
    class StrokeFont
    {
    public:
        /// @param line_height Height of one text line in pixels. Capitals
        ///        fill roughly 70% of it; the rest is descender room.
        explicit StrokeFont(f64 line_height = kDefaultLineHeight);

        /// @brief Render one line of text into a surface of size
        ///        (ceil(text_width), line_height).
        [[nodiscard]] Surface render(std::string_view text, Color color) const;

        /// @brief Advance width of @p text in pixels.
        [[nodiscard]] f64 text_width(std::string_view text) const;

        [[nodiscard]] f64 line_height() const { return m_line_height; }

        static constexpr f64 kDefaultLineHeight = 14.0;

    private:
        f64 m_line_height;
        f64 m_unit;            ///< Pixels per design-grid unit
        f64 m_stroke_width;
    };

} // namespace orrery::rendering
