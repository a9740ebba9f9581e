/// @file test_ansi_encoder.cpp
/// @brief Unit tests for cadence::rendering::AnsiEncoder.
///
/// Checks SGR sequences, cursor addressing, and row wrapping on a 3x2 grid
/// (six terminal columns per row).

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "rendering/ansi_encoder.hpp"

#include <string>

using namespace cadence;
using namespace cadence::rendering;

static constexpr Style kRed = fg(Color::Red);

// =================================================================
// SGR
// =================================================================

TEST_CASE("Default style encodes as a plain reset")
{
    CHECK(AnsiEncoder::sgr(Style{}) == "\x1b[0m");
}

TEST_CASE("Foreground, background, and intensity map to SGR parameters")
{
    CHECK(AnsiEncoder::sgr(fg(Color::Red)) == "\x1b[0;31m");
    CHECK(AnsiEncoder::sgr(fg(Color::Black)) == "\x1b[0;30m");
    CHECK(AnsiEncoder::sgr(fg(Color::White, true)) == "\x1b[0;1;37m");

    const Style green_on_blue{.fg = Color::Green, .bg = Color::Blue, .bright = true};
    CHECK(AnsiEncoder::sgr(green_on_blue) == "\x1b[0;1;32;44m");
}

TEST_CASE("Cursor moves are 1-based")
{
    std::string out;
    AnsiEncoder::move_cursor(out, 0, 0);
    AnsiEncoder::move_cursor(out, 4, 9);
    CHECK(out == "\x1b[1;1H\x1b[5;10H");
}

// =================================================================
// Spans
// =================================================================

TEST_CASE("Span is positioned at its row and terminal column")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.encode_span(out, Span(8, U"z", kRed));  // cell (1, 1)
    CHECK(out == "\x1b[2;3H\x1b[0;31mz ");
}

TEST_CASE("Span wraps onto the next row at the right edge")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.encode_span(out, Span(4, U"abc", kRed));
    CHECK(out == "\x1b[1;5H\x1b[0;31ma \x1b[2;1Hb c ");
}

TEST_CASE("Span that exactly fills a row adds no extra cursor move")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.encode_span(out, Span(0, U"abc", kRed));
    CHECK(out == "\x1b[1;1H\x1b[0;31ma b c ");
}

TEST_CASE("Text below the last row is not emitted")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.encode_span(out, Span(6, U"abcdef", kRed));
    CHECK(out == "\x1b[2;1H\x1b[0;31ma b c ");

    out.clear();
    encoder.encode_span(out, Span(12, U"q", kRed));
    CHECK(out.empty());
}

TEST_CASE("Wide glyphs are emitted without padding")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.encode_span(out, Span(0, U"漢a", Style{}));
    CHECK(out == "\x1b[1;1H\x1b[0m\xE6\xBC\xA2" "a ");
}

// =================================================================
// Frames
// =================================================================

TEST_CASE("Frame trailer resets and parks the cursor below the grid")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    std::string out;

    encoder.begin_frame(out);
    encoder.end_frame(out);
    CHECK(out == "\x1b[1;1H\x1b[0m\x1b[3;1H");
}

TEST_CASE("Blank frame repaints every row")
{
    const AnsiEncoder encoder(Vec2i{3, 2});
    CHECK(encoder.blank_frame() ==
          "\x1b[1;1H\x1b[0m\x1b[1;1H      \x1b[2;1H      \x1b[0m\x1b[3;1H");
}
