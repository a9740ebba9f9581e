/// @file test_effects.cpp
/// @brief Unit tests for the stock effects in cadence::anim::effects.

#include "test_main.hpp"

#include "anim/effects.hpp"
#include "core/random.hpp"
#include "rendering/canvas.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cadence;
using namespace cadence::anim;
using namespace cadence::rendering;

// =================================================================
// Helpers
// =================================================================

static std::u32string read_row(const Canvas& canvas, i32 layer, Vec2i pos, i32 count)
{
    std::u32string out;
    for (i32 i = 0; i < count; ++i)
    {
        out.push_back(canvas.get_char(layer, Vec2i{pos.x + i, pos.y}).glyph);
    }
    return out;
}

static constexpr Style kCyan = fg(Color::Cyan, true);

// =================================================================
// Typewriter
// =================================================================

TEST_CASE("Typewriter reveals a few characters per beat with a cursor")
{
    Canvas canvas({.width = 8, .height = 3, .layer_count = 1});
    effects::TypewriterState state{.text = U"ab\ncd", .offset = 0};

    effects::typewriter(canvas, state, 0, Vec2i{1, 0}, kCyan, 3);
    CHECK(read_row(canvas, 0, Vec2i{1, 0}, 2) == U"_ ");
    CHECK(read_row(canvas, 0, Vec2i{1, 1}, 2) == U"  ");
    CHECK(state.offset == 3);

    effects::typewriter(canvas, state, 0, Vec2i{1, 0}, kCyan, 3);
    CHECK(read_row(canvas, 0, Vec2i{1, 0}, 2) == U"ab");
    CHECK(read_row(canvas, 0, Vec2i{1, 1}, 2) == U"_ ");

    effects::typewriter(canvas, state, 0, Vec2i{1, 0}, kCyan, 3);
    CHECK(read_row(canvas, 0, Vec2i{1, 1}, 2) == U"cd");
    CHECK(canvas.get_char(0, Vec2i{1, 1}).style == kCyan);
}

TEST_CASE("typewriter_clear blanks the text box including the cursor cell")
{
    Canvas canvas({.width = 8, .height = 3, .layer_count = 1});
    canvas.fill_rectangle(0, Vec2i{0, 0}, Vec2i{8, 3}, U'#');

    const effects::TypewriterState state{.text = U"abc\nd", .offset = 5};
    effects::typewriter_clear(canvas, state, 0, Vec2i{1, 0});

    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 6) == U"#    #");
    CHECK(read_row(canvas, 0, Vec2i{0, 1}, 6) == U"#    #");
    CHECK(read_row(canvas, 0, Vec2i{0, 2}, 6) == U"######");
}

// =================================================================
// Blink, noise, wave, debug
// =================================================================

TEST_CASE("Blink alternates styles on even and odd beats")
{
    Canvas canvas({.width = 4, .height = 1, .layer_count = 1});
    const Style even = fg(Color::Yellow);
    const Style odd = fg(Color::Red);

    effects::blink(canvas, 0, Vec2i{0, 0}, even, odd, 4);
    CHECK(canvas.get_char(0, Vec2i{1, 0}) == (Cell{.glyph = U'#', .style = even}));

    effects::blink(canvas, 0, Vec2i{0, 0}, even, odd, 5);
    CHECK(canvas.get_char(0, Vec2i{1, 0}) == (Cell{.glyph = U'#', .style = odd}));
}

TEST_CASE("Noise is one write per glyph and repeatable for a seed")
{
    const std::u32string glyphs = U"*+";

    Canvas first({.width = 6, .height = 4, .layer_count = 1});
    Canvas second({.width = 6, .height = 4, .layer_count = 1});
    Pcg32 rng_a(42u);
    Pcg32 rng_b(42u);

    effects::noise(first, 0, 10, glyphs, {fg(Color::Green)}, rng_a);
    effects::noise(second, 0, 10, glyphs, {fg(Color::Green)}, rng_b);

    CHECK(first.edits_this_frame() == 10);

    for (i32 y = 0; y < 4; ++y)
    {
        for (i32 x = 0; x < 6; ++x)
        {
            const Cell cell = first.get_char(0, Vec2i{x, y});
            CHECK(cell == second.get_char(0, Vec2i{x, y}));
            CHECK((cell == kBlankCell || glyphs.find(cell.glyph) != std::u32string::npos));
        }
    }
}

TEST_CASE("A flat wave draws one glyph per column on its baseline")
{
    Canvas canvas({.width = 5, .height = 3, .layer_count = 1});
    effects::wave(canvas, 0, 1, 0.0, 1.0, 0.0, U'~', fg(Color::Blue));

    CHECK(read_row(canvas, 0, Vec2i{0, 1}, 5) == U"~~~~~");
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 5) == U"     ");
}

TEST_CASE("debug_info reports the beat and the edits so far")
{
    Canvas canvas({.width = 20, .height = 2, .layer_count = 1});
    canvas.set_char(0, Vec2i{0, 0}, U'x');
    canvas.set_char(0, Vec2i{1, 0}, U'y');

    effects::debug_info(canvas, 0, Vec2i{0, 1}, 7, Style{});
    CHECK(read_row(canvas, 0, Vec2i{0, 1}, 14) == U"beat 7 edits 2");
}

// =================================================================
// Glitch, fade, rain
// =================================================================

TEST_CASE("Glitch draws only from its four-color palette")
{
    Canvas canvas({.width = 6, .height = 4, .layer_count = 1});
    Pcg32 rng(7u);
    effects::glitch(canvas, 0, 30, rng);

    CHECK(canvas.edits_this_frame() == 30);

    const std::vector<Style> palette{fg(Color::Red), fg(Color::Yellow), fg(Color::Green), fg(Color::Magenta)};
    i32 drawn = 0;
    for (i32 y = 0; y < 4; ++y)
    {
        for (i32 x = 0; x < 6; ++x)
        {
            const Cell cell = canvas.get_char(0, Vec2i{x, y});
            if (cell == kBlankCell)
            {
                continue;
            }
            ++drawn;
            CHECK(effects::kNoiseGlyphs.find(cell.glyph) != std::u32string::npos);
            CHECK(std::find(palette.begin(), palette.end(), cell.style) != palette.end());
        }
    }
    CHECK(drawn > 0);
}

TEST_CASE("The last fade step blanks the whole region and nothing else")
{
    Canvas canvas({.width = 6, .height = 4, .layer_count = 1});
    canvas.fill_rectangle(0, Vec2i{0, 0}, Vec2i{6, 4}, U'#', kCyan);
    Pcg32 rng(3u);

    effects::fade(canvas, 0, Vec2i{1, 1}, Vec2i{3, 2}, 9, 10, rng);

    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 6) == U"######");
    CHECK(read_row(canvas, 0, Vec2i{0, 1}, 6) == U"#   ##");
    CHECK(read_row(canvas, 0, Vec2i{0, 2}, 6) == U"#   ##");
    CHECK(read_row(canvas, 0, Vec2i{0, 3}, 6) == U"######");
    CHECK(canvas.get_char(0, Vec2i{2, 1}) == kBlankCell);
}

TEST_CASE("Fade with no steps writes nothing")
{
    Canvas canvas({.width = 3, .height = 3, .layer_count = 1});
    Pcg32 rng(3u);
    effects::fade(canvas, 0, Vec2i{0, 0}, Vec2i{2, 2}, 0, 0, rng);
    CHECK(canvas.edits_this_frame() == 0);
}

TEST_CASE("Rain falls only in the listed on-canvas columns")
{
    Canvas canvas({.width = 5, .height = 200, .layer_count = 1});
    Pcg32 rng(11u);
    effects::matrix_rain(canvas, 0, {1, 3, -1, 9}, rng);

    i32 drops = 0;
    for (i32 y = 0; y < 200; ++y)
    {
        for (i32 x = 0; x < 5; ++x)
        {
            const Cell cell = canvas.get_char(0, Vec2i{x, y});
            if (x != 1 && x != 3)
            {
                CHECK(cell == kBlankCell);
            }
            else if (!(cell == kBlankCell))
            {
                ++drops;
                CHECK(effects::kRainGlyphs.find(cell.glyph) != std::u32string::npos);
                CHECK(cell.style == fg(Color::Green));
            }
        }
    }
    CHECK(drops > 0);
    CHECK(drops < 200);
}

// =================================================================
// Loading bar, pulse, scramble
// =================================================================

TEST_CASE("Loading bar fills floor(width * progress) cells")
{
    Canvas canvas({.width = 6, .height = 1, .layer_count = 1});

    effects::loading_bar(canvas, 0, Vec2i{1, 0}, 4, 0.5, kCyan, U'=', U'.');
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 6) == U" ==.. ");
    CHECK(canvas.get_char(0, Vec2i{1, 0}).style == kCyan);

    effects::loading_bar(canvas, 0, Vec2i{1, 0}, 4, 0.99, kCyan, U'=', U'.');
    CHECK(read_row(canvas, 0, Vec2i{1, 0}, 4) == U"===.");

    effects::loading_bar(canvas, 0, Vec2i{1, 0}, 4, 1.7, kCyan, U'=', U'.');
    CHECK(read_row(canvas, 0, Vec2i{1, 0}, 4) == U"====");

    effects::loading_bar(canvas, 0, Vec2i{1, 0}, 4, -1.0, kCyan, U'=', U'.');
    CHECK(read_row(canvas, 0, Vec2i{1, 0}, 4) == U"....");
}

TEST_CASE("Pulse is bright on even beats and normal on odd beats")
{
    Canvas canvas({.width = 6, .height = 1, .layer_count = 1});

    effects::pulse(canvas, 0, Vec2i{0, 0}, U"hey", 2, Color::Magenta);
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 3) == U"hey");
    CHECK(canvas.get_char(0, Vec2i{0, 0}).style == fg(Color::Magenta, true));

    effects::pulse(canvas, 0, Vec2i{0, 0}, U"hey", 3, Color::Magenta);
    CHECK(canvas.get_char(0, Vec2i{2, 0}).style == fg(Color::Magenta, false));
}

TEST_CASE("Scramble reveals a prefix and fills the rest from the scramble set")
{
    Canvas canvas({.width = 8, .height = 1, .layer_count = 1});
    Pcg32 rng(5u);

    effects::scramble_text(canvas, 0, Vec2i{0, 0}, U"abcd", U"#", 0.5, rng);
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 4) == U"ab##");

    effects::scramble_text(canvas, 0, Vec2i{0, 0}, U"abcd", U"#", 0.0, rng);
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 4) == U"####");

    effects::scramble_text(canvas, 0, Vec2i{0, 0}, U"abcd", U"#", 1.0, rng);
    CHECK(read_row(canvas, 0, Vec2i{0, 0}, 4) == U"abcd");
}
