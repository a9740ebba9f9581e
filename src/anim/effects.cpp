/// @file effects.cpp
/// @brief Stock effect implementations.

#include "anim/effects.hpp"

#include <algorithm>
#include <cmath>

namespace cadence::anim::effects
{

using rendering::Canvas;
using rendering::Style;

namespace
{

std::vector<std::u32string_view> split_lines(const std::u32string& text)
{
    std::vector<std::u32string_view> lines;
    const std::u32string_view view{text};
    std::size_t begin = 0;
    while (true)
    {
        const std::size_t end = view.find(U'\n', begin);
        if (end == std::u32string_view::npos)
        {
            lines.push_back(view.substr(begin));
            break;
        }
        lines.push_back(view.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

} // anonymous namespace

void typewriter(Canvas& canvas, TypewriterState& state, i32 layer, Vec2i pos, const Style& style,
                i32 chars_per_beat)
{
    if (state.text.empty())
    {
        return;
    }

    std::size_t line_first = 0;
    i32 line_number = 0;
    for (const auto line : split_lines(state.text))
    {
        // Only the line the cursor is on, and lines already passed, are visible
        if (state.offset >= line_first)
        {
            const std::size_t shown = std::min(state.offset - line_first, line.size());
            std::u32string visible{line.substr(0, shown)};
            if (shown < line.size())
            {
                visible.push_back(U'_');
            }
            canvas.set_string(layer, Vec2i{pos.x, pos.y + line_number}, std::u32string_view{visible}, style);
        }

        line_first += line.size() + 1;
        ++line_number;
    }

    state.offset += static_cast<std::size_t>(std::max(chars_per_beat, 0));
}

void typewriter_clear(Canvas& canvas, const TypewriterState& state, i32 layer, Vec2i pos)
{
    const auto lines = split_lines(state.text);
    std::size_t widest = 0;
    for (const auto line : lines)
    {
        widest = std::max(widest, line.size());
    }

    // +1 for the cursor cell
    const std::u32string blank(widest + 1, U' ');
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        canvas.set_string(layer, Vec2i{pos.x, pos.y + static_cast<i32>(i)}, std::u32string_view{blank});
    }
}

void blink(Canvas& canvas, i32 layer, Vec2i pos, const Style& style_a, const Style& style_b, i64 beat)
{
    canvas.set_string(layer, pos, std::u32string_view{U"##"}, (beat % 2 == 0) ? style_a : style_b);
}

void noise(Canvas& canvas, i32 layer, i32 amount, const std::u32string& glyphs,
           const std::vector<Style>& styles, Pcg32& rng)
{
    if (glyphs.empty() || amount <= 0)
    {
        return;
    }

    const auto width = static_cast<u32>(canvas.width());
    const auto height = static_cast<u32>(canvas.height());
    const auto glyph_count = static_cast<u32>(glyphs.size());
    const auto style_count = static_cast<u32>(styles.size());

    for (i32 i = 0; i < amount; ++i)
    {
        const Vec2i pos{static_cast<i32>(rng.next_below(width)), static_cast<i32>(rng.next_below(height))};
        const char32_t glyph = glyphs[rng.next_below(glyph_count)];
        const Style style = styles.empty() ? rendering::fg(rendering::Color::White)
                                           : styles[rng.next_below(style_count)];
        canvas.set_char(layer, pos, glyph, style);
    }
}

void wave(Canvas& canvas, i32 layer, i32 y, f64 amplitude, f64 frequency, f64 phase, char32_t glyph,
          const Style& style)
{
    for (i32 x = 0; x < canvas.width(); ++x)
    {
        const auto wave_y = static_cast<i32>(
            static_cast<f64>(y) + amplitude * std::sin(frequency * static_cast<f64>(x) + phase));
        if (wave_y >= 0 && wave_y < canvas.height())
        {
            canvas.set_char(layer, Vec2i{x, wave_y}, glyph, style);
        }
    }
}

void glitch(Canvas& canvas, i32 layer, i32 intensity, Pcg32& rng, const std::u32string& glyphs)
{
    using rendering::Color;
    using rendering::fg;
    static const std::vector<Style> palette{fg(Color::Red), fg(Color::Yellow), fg(Color::Green),
                                            fg(Color::Magenta)};
    noise(canvas, layer, intensity, glyphs, palette, rng);
}

void fade(Canvas& canvas, i32 layer, Vec2i top_left, Vec2i bottom_right, i32 step, i32 steps, Pcg32& rng,
          char32_t glyph)
{
    if (steps <= 0 || step < 0)
    {
        return;
    }

    // Chance in percent; the final step reaches 100
    const i64 chance = (static_cast<i64>(std::min(step, steps - 1)) + 1) * 100 / steps;
    const i32 x0 = std::max(top_left.x, 0);
    const i32 y0 = std::max(top_left.y, 0);
    const i32 x1 = std::min(bottom_right.x, canvas.width() - 1);
    const i32 y1 = std::min(bottom_right.y, canvas.height() - 1);

    for (i32 y = y0; y <= y1; ++y)
    {
        for (i32 x = x0; x <= x1; ++x)
        {
            if (static_cast<i64>(rng.next_below(100)) < chance)
            {
                canvas.set_char(layer, Vec2i{x, y}, glyph);
            }
        }
    }
}

void matrix_rain(Canvas& canvas, i32 layer, const std::vector<i32>& columns, Pcg32& rng,
                 const std::u32string& glyphs, const Style& style)
{
    if (glyphs.empty())
    {
        return;
    }

    const auto glyph_count = static_cast<u32>(glyphs.size());
    for (const i32 column : columns)
    {
        if (column < 0 || column >= canvas.width())
        {
            continue;
        }
        for (i32 y = 0; y < canvas.height(); ++y)
        {
            if (rng.next_below(101) < 15u)
            {
                canvas.set_char(layer, Vec2i{column, y}, glyphs[rng.next_below(glyph_count)], style);
            }
        }
    }
}

void loading_bar(Canvas& canvas, i32 layer, Vec2i pos, i32 width, f64 progress, const Style& style,
                 char32_t fill_glyph, char32_t empty_glyph)
{
    if (width <= 0)
    {
        return;
    }

    const f64 clamped = std::clamp(progress, 0.0, 1.0);
    const auto filled = static_cast<i32>(static_cast<f64>(width) * clamped);
    for (i32 x = 0; x < width; ++x)
    {
        canvas.set_char(layer, Vec2i{pos.x + x, pos.y}, x < filled ? fill_glyph : empty_glyph, style);
    }
}

void pulse(Canvas& canvas, i32 layer, Vec2i pos, std::u32string_view text, i64 beat, rendering::Color color)
{
    canvas.set_string(layer, pos, text, rendering::fg(color, beat % 2 == 0));
}

void scramble_text(Canvas& canvas, i32 layer, Vec2i pos, std::u32string_view text,
                   const std::u32string& scramble_glyphs, f64 progress, Pcg32& rng, const Style& style)
{
    const f64 clamped = std::clamp(progress, 0.0, 1.0);
    const auto revealed = static_cast<std::size_t>(static_cast<f64>(text.size()) * clamped);

    std::u32string shown{text};
    if (!scramble_glyphs.empty())
    {
        const auto glyph_count = static_cast<u32>(scramble_glyphs.size());
        for (std::size_t i = revealed; i < shown.size(); ++i)
        {
            shown[i] = scramble_glyphs[rng.next_below(glyph_count)];
        }
    }
    canvas.set_string(layer, pos, std::u32string_view{shown}, style);
}

void debug_info(Canvas& canvas, i32 layer, Vec2i pos, i64 beat, const Style& style)
{
    const std::string line = "beat " + std::to_string(beat) + " edits " +
                             std::to_string(canvas.edits_this_frame());
    canvas.set_string(layer, pos, std::string_view{line}, style);
}

} // namespace cadence::anim::effects
