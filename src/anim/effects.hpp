#pragma once

/// @file effects.hpp
/// @brief Stock visual effects that write into a Canvas.

#include "core/random.hpp"
#include "core/types.hpp"
#include "rendering/canvas.hpp"
#include "rendering/style.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cadence::anim::effects
{
    inline const std::u32string kNoiseGlyphs = U"!@#$%^&*()_+-=[]{}|;':,.<>?/~`";

    /// Half-width katakana.
    inline const std::u32string kRainGlyphs =
        U"\uFF8A\uFF90\uFF8B\uFF70\uFF73\uFF7C\uFF85\uFF93\uFF86\uFF7B\uFF9C\uFF82\uFF75\uFF98\uFF71\uFF8E"
        U"\uFF83\uFF8F\uFF79\uFF92\uFF74\uFF76\uFF77\uFF91\uFF95\uFF97\uFF7E\uFF88\uFF7D\uFF80\uFF87\uFF8D";
    /// @brief Progress of a typewriter effect. Owned by the generator that draws it.
    struct TypewriterState
    {
        std::u32string text;        ///< May contain '\n'
        std::size_t offset = 0;     ///< Characters revealed so far (newlines count)
    };

    /// @brief Reveal text progressively with a trailing '_' cursor, then advance.
    void typewriter(rendering::Canvas& canvas, TypewriterState& state, i32 layer, Vec2i pos,
                    const rendering::Style& style, i32 chars_per_beat = 3);

    /// @brief Blank the bounding box of the typewriter text.
    void typewriter_clear(rendering::Canvas& canvas, const TypewriterState& state, i32 layer, Vec2i pos);

    /// @brief "##" at pos, style_a on even beats and style_b on odd beats.
    void blink(rendering::Canvas& canvas, i32 layer, Vec2i pos, const rendering::Style& style_a,
               const rendering::Style& style_b, i64 beat);

    /// @brief Scatter `amount` random glyphs over the whole canvas.
    void noise(rendering::Canvas& canvas, i32 layer, i32 amount, const std::u32string& glyphs,
               const std::vector<rendering::Style>& styles, Pcg32& rng);

    /// @brief One glyph per column on y + amplitude * sin(frequency * x + phase).
    void wave(rendering::Canvas& canvas, i32 layer, i32 y, f64 amplitude, f64 frequency, f64 phase,
              char32_t glyph, const rendering::Style& style);

    /// @brief noise() with the glitch palette (red, yellow, green, magenta).
    void glitch(rendering::Canvas& canvas, i32 layer, i32 intensity, Pcg32& rng,
                const std::u32string& glyphs = kNoiseGlyphs);

    /// @brief One step of a fade of the inclusive region [top_left, bottom_right] to `glyph`.
    ///
    /// Step s of n blanks each cell with a chance of (s + 1) / n, so the last
    /// step covers the whole region. Call once per beat to animate.
    void fade(rendering::Canvas& canvas, i32 layer, Vec2i top_left, Vec2i bottom_right, i32 step, i32 steps,
              Pcg32& rng, char32_t glyph = U' ');

    /// @brief Digital rain: each cell of each listed column gets a random glyph with a 15% chance.
    void matrix_rain(rendering::Canvas& canvas, i32 layer, const std::vector<i32>& columns, Pcg32& rng,
                     const std::u32string& glyphs = kRainGlyphs,
                     const rendering::Style& style = rendering::fg(rendering::Color::Green));

    /// @brief `width` cells of fill then empty glyphs; the fill covers floor(width * progress).
    void loading_bar(rendering::Canvas& canvas, i32 layer, Vec2i pos, i32 width, f64 progress,
                     const rendering::Style& style = rendering::fg(rendering::Color::Cyan),
                     char32_t fill_glyph = U'\u2588', char32_t empty_glyph = U'\u2591');

    /// @brief Text in `color`, bright on even beats and normal on odd ones.
    void pulse(rendering::Canvas& canvas, i32 layer, Vec2i pos, std::u32string_view text, i64 beat,
               rendering::Color color = rendering::Color::White);

    /// @brief The first floor(size * progress) characters of text, random scramble glyphs after.
    void scramble_text(rendering::Canvas& canvas, i32 layer, Vec2i pos, std::u32string_view text,
                       const std::u32string& scramble_glyphs, f64 progress, Pcg32& rng,
                       const rendering::Style& style = rendering::fg(rendering::Color::White));

    /// @brief "beat N edits M" readout.
    void debug_info(rendering::Canvas& canvas, i32 layer, Vec2i pos, i64 beat, const rendering::Style& style);

} // namespace cadence::anim::effects
