/// @file stroke_font.cpp
/// @brief Stroke font glyph table and layout.

#include "rendering/stroke_font.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace orrery::rendering
{

namespace
{
    // Design grid: x in [0, 4], y in [0, 6] with y = 6 on the baseline and
    // y = 7 reserved for descenders.
    struct GridPoint
    {
        i32 x;
        i32 y;
    };

    using Stroke = std::vector<GridPoint>;

    struct Glyph
    {
        i32 advance = 4;                ///< Glyph width in grid units (spacing added on layout)
        std::vector<Stroke> strokes;
    };

    constexpr f64 kGridHeight   = 6.0;
    constexpr f64 kCapFraction  = 0.7;     ///< Cap height relative to the line height
    constexpr f64 kSmallCapScaleY = 4.0 / 6.0;
    constexpr f64 kSmallCapScaleX = 0.8;
    constexpr i32 kLetterSpacing = 1;

    const Stroke kRing = {{1, 0}, {3, 0}, {4, 1}, {4, 5}, {3, 6}, {1, 6}, {0, 5}, {0, 1}, {1, 0}};
    const Stroke kBowl = {{0, 0}, {3, 0}, {4, 1}, {4, 2}, {3, 3}, {0, 3}};

    const std::unordered_map<char, Glyph>& glyph_table()
    {
        static const std::unordered_map<char, Glyph> table = {
            // -----------------------------------------------------------------
            // Letters
            // -----------------------------------------------------------------
            {'A', {4, {{{0, 6}, {0, 2}, {2, 0}, {4, 2}, {4, 6}}, {{0, 3}, {4, 3}}}}},
            {'B', {4, {{{0, 0}, {0, 6}, {3, 6}, {4, 5}, {4, 4}, {3, 3}, {0, 3}},
                       {{0, 0}, {3, 0}, {4, 1}, {4, 2}, {3, 3}}}}},
            {'C', {4, {{{4, 1}, {3, 0}, {1, 0}, {0, 1}, {0, 5}, {1, 6}, {3, 6}, {4, 5}}}}},
            {'D', {4, {{{0, 0}, {0, 6}, {2, 6}, {4, 4}, {4, 2}, {2, 0}, {0, 0}}}}},
            {'E', {4, {{{4, 0}, {0, 0}, {0, 6}, {4, 6}}, {{0, 3}, {3, 3}}}}},
            {'F', {4, {{{4, 0}, {0, 0}, {0, 6}}, {{0, 3}, {3, 3}}}}},
            {'G', {4, {{{4, 1}, {3, 0}, {1, 0}, {0, 1}, {0, 5}, {1, 6}, {3, 6}, {4, 5}, {4, 3}, {2, 3}}}}},
            {'H', {4, {{{0, 0}, {0, 6}}, {{4, 0}, {4, 6}}, {{0, 3}, {4, 3}}}}},
            {'I', {2, {{{0, 0}, {2, 0}}, {{1, 0}, {1, 6}}, {{0, 6}, {2, 6}}}}},
            {'J', {4, {{{4, 0}, {4, 5}, {3, 6}, {1, 6}, {0, 5}}}}},
            {'K', {4, {{{0, 0}, {0, 6}}, {{4, 0}, {0, 4}}, {{1, 3}, {4, 6}}}}},
            {'L', {4, {{{0, 0}, {0, 6}, {4, 6}}}}},
            {'M', {4, {{{0, 6}, {0, 0}, {2, 3}, {4, 0}, {4, 6}}}}},
            {'N', {4, {{{0, 6}, {0, 0}, {4, 6}, {4, 0}}}}},
            {'O', {4, {kRing}}},
            {'P', {4, {{{0, 6}, {0, 0}}, kBowl}}},
            {'Q', {4, {kRing, {{2, 4}, {4, 6}}}}},
            {'R', {4, {{{0, 6}, {0, 0}}, kBowl, {{2, 3}, {4, 6}}}}},
            {'S', {4, {{{4, 1}, {3, 0}, {1, 0}, {0, 1}, {0, 2}, {1, 3}, {3, 3}, {4, 4}, {4, 5}, {3, 6}, {1, 6}, {0, 5}}}}},
            {'T', {4, {{{0, 0}, {4, 0}}, {{2, 0}, {2, 6}}}}},
            {'U', {4, {{{0, 0}, {0, 5}, {1, 6}, {3, 6}, {4, 5}, {4, 0}}}}},
            {'V', {4, {{{0, 0}, {2, 6}, {4, 0}}}}},
            {'W', {4, {{{0, 0}, {1, 6}, {2, 3}, {3, 6}, {4, 0}}}}},
            {'X', {4, {{{0, 0}, {4, 6}}, {{4, 0}, {0, 6}}}}},
            {'Y', {4, {{{0, 0}, {2, 3}, {4, 0}}, {{2, 3}, {2, 6}}}}},
            {'Z', {4, {{{0, 0}, {4, 0}, {0, 6}, {4, 6}}}}},

            // -----------------------------------------------------------------
            // Digits
            // -----------------------------------------------------------------
            {'0', {4, {kRing, {{4, 1}, {0, 5}}}}},
            {'1', {2, {{{0, 1}, {1, 0}, {1, 6}}, {{0, 6}, {2, 6}}}}},
            {'2', {4, {{{0, 1}, {1, 0}, {3, 0}, {4, 1}, {4, 2}, {0, 6}, {4, 6}}}}},
            {'3', {4, {{{0, 1}, {1, 0}, {3, 0}, {4, 1}, {4, 2}, {3, 3}, {4, 4}, {4, 5}, {3, 6}, {1, 6}, {0, 5}},
                       {{1, 3}, {3, 3}}}}},
            {'4', {4, {{{3, 6}, {3, 0}, {0, 4}, {4, 4}}}}},
            {'5', {4, {{{4, 0}, {0, 0}, {0, 3}, {3, 3}, {4, 4}, {4, 5}, {3, 6}, {0, 6}}}}},
            {'6', {4, {{{3, 0}, {1, 0}, {0, 1}, {0, 5}, {1, 6}, {3, 6}, {4, 5}, {4, 4}, {3, 3}, {0, 3}}}}},
            {'7', {4, {{{0, 0}, {4, 0}, {1, 6}}}}},
            {'8', {4, {{{1, 0}, {3, 0}, {4, 1}, {4, 2}, {3, 3}, {1, 3}, {0, 2}, {0, 1}, {1, 0}},
                       {{1, 3}, {0, 4}, {0, 5}, {1, 6}, {3, 6}, {4, 5}, {4, 4}, {3, 3}}}}},
            {'9', {4, {{{4, 3}, {1, 3}, {0, 2}, {0, 1}, {1, 0}, {3, 0}, {4, 1}, {4, 5}, {3, 6}, {1, 6}}}}},

            // -----------------------------------------------------------------
            // Punctuation
            // -----------------------------------------------------------------
            {' ', {2, {}}},
            {'.', {1, {{{0, 5}, {0, 6}}}}},
            {',', {1, {{{1, 5}, {0, 7}}}}},
            {':', {1, {{{0, 1}, {0, 2}}, {{0, 4}, {0, 5}}}}},
            {';', {1, {{{1, 1}, {1, 2}}, {{1, 4}, {0, 7}}}}},
            {'!', {1, {{{0, 0}, {0, 4}}, {{0, 5}, {0, 6}}}}},
            {'?', {4, {{{0, 1}, {1, 0}, {3, 0}, {4, 1}, {4, 2}, {2, 3}, {2, 4}}, {{2, 5}, {2, 6}}}}},
            {'\'', {1, {{{0, 0}, {0, 2}}}}},
            {'"', {2, {{{0, 0}, {0, 2}}, {{2, 0}, {2, 2}}}}},
            {'-', {3, {{{0, 3}, {3, 3}}}}},
            {'_', {4, {{{0, 6}, {4, 6}}}}},
            {'+', {4, {{{0, 3}, {4, 3}}, {{2, 1}, {2, 5}}}}},
            {'=', {4, {{{0, 2}, {4, 2}}, {{0, 4}, {4, 4}}}}},
            {'*', {4, {{{2, 1}, {2, 5}}, {{0, 2}, {4, 4}}, {{4, 2}, {0, 4}}}}},
            {'/', {4, {{{0, 6}, {4, 0}}}}},
            {'|', {1, {{{0, 0}, {0, 7}}}}},
            {'^', {4, {{{0, 2}, {2, 0}, {4, 2}}}}},
            {'~', {4, {{{0, 3}, {1, 2}, {3, 4}, {4, 3}}}}},
            {'<', {3, {{{3, 0}, {0, 3}, {3, 6}}}}},
            {'>', {3, {{{0, 0}, {3, 3}, {0, 6}}}}},
            {'(', {2, {{{2, 0}, {1, 1}, {1, 5}, {2, 6}}}}},
            {')', {2, {{{0, 0}, {1, 1}, {1, 5}, {0, 6}}}}},
            {'[', {2, {{{2, 0}, {0, 0}, {0, 6}, {2, 6}}}}},
            {']', {2, {{{0, 0}, {2, 0}, {2, 6}, {0, 6}}}}},
            {'%', {4, {{{0, 6}, {4, 0}}, {{0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0}},
                       {{3, 5}, {4, 5}, {4, 6}, {3, 6}, {3, 5}}}}},
            {'#', {4, {{{1, 0}, {1, 6}}, {{3, 0}, {3, 6}}, {{0, 2}, {4, 2}}, {{0, 4}, {4, 4}}}}},
            {'&', {4, {{{4, 6}, {1, 2}, {1, 1}, {2, 0}, {3, 1}, {3, 2}, {0, 4}, {0, 5}, {1, 6}, {2, 6}, {4, 4}}}}},
        };
        return table;
    }

    const Glyph& missing_glyph()
    {
        static const Glyph box{3, {{{0, 1}, {3, 1}, {3, 6}, {0, 6}, {0, 1}}}};
        return box;
    }

    // Visit each character as (glyph, small_cap). UTF-8 continuation bytes
    // are skipped so one multi-byte code point maps to one missing glyph.
    template <typename Fn>
    void for_each_glyph(std::string_view text, Fn&& fn)
    {
        const auto& table = glyph_table();

        for (char raw : text)
        {
            const auto byte = static_cast<unsigned char>(raw);
            if ((byte & 0xC0u) == 0x80u)
            {
                continue;
            }

            bool small_cap = false;
            char key = raw;
            if (raw >= 'a' && raw <= 'z')
            {
                key = static_cast<char>(raw - 'a' + 'A');
                small_cap = true;
            }

            const auto it = table.find(key);
            fn(it != table.end() ? it->second : missing_glyph(), small_cap);
        }
    }

    f64 glyph_advance(const Glyph& glyph, bool small_cap)
    {
        const f64 width = small_cap ? glyph.advance * kSmallCapScaleX : glyph.advance;
        return width + kLetterSpacing;
    }

} // anonymous namespace

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

StrokeFont::StrokeFont(f64 line_height)
    : m_line_height(line_height)
    , m_unit(line_height * kCapFraction / kGridHeight)
    , m_stroke_width(std::max(1.0, line_height / 12.0))
{
}

// -----------------------------------------------------------------
// Layout
// -----------------------------------------------------------------

f64 StrokeFont::text_width(std::string_view text) const
{
    f64 units = 0.0;
    for_each_glyph(text, [&](const Glyph& glyph, bool small_cap) {
        units += glyph_advance(glyph, small_cap);
    });
    return units * m_unit;
}

Surface StrokeFont::render(std::string_view text, Color color) const
{
    const auto width = static_cast<i32>(std::ceil(text_width(text)));
    const auto height = static_cast<i32>(std::ceil(m_line_height));
    Surface surface(std::max(width, 1), std::max(height, 1));

    // Half a grid unit of margin keeps the stroke width inside the surface
    const f64 top = m_unit * 0.5;
    f64 pen_x = m_unit * 0.5;
    std::vector<Vec2d> points;

    for_each_glyph(text, [&](const Glyph& glyph, bool small_cap) {
        const f64 sx = small_cap ? kSmallCapScaleX : 1.0;
        const f64 sy = small_cap ? kSmallCapScaleY : 1.0;
        // Small capitals share the baseline with full capitals
        const f64 y_shift = small_cap ? kGridHeight * (1.0 - kSmallCapScaleY) : 0.0;

        for (const auto& stroke : glyph.strokes)
        {
            points.clear();
            for (const auto& p : stroke)
            {
                points.emplace_back(pen_x + p.x * sx * m_unit,
                                    top + (p.y * sy + y_shift) * m_unit);
            }
            surface.draw_polyline(points, false, color, m_stroke_width);
        }

        pen_x += glyph_advance(glyph, small_cap) * m_unit;
    });

    return surface;
}

} // namespace orrery::rendering
