/// @file test_glyph.cpp
/// @brief Unit tests for cadence::rendering::glyph.
///
/// Verifies control-character sanitizing, UTF-8 decoding (including malformed
/// input), and the two-column padding applied to every emitted cell.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "rendering/glyph.hpp"

#include <string>

using namespace cadence::rendering;

// =================================================================
// Sanitizing
// =================================================================

TEST_CASE("Printable code points pass through sanitize unchanged")
{
    CHECK(glyph::sanitize(U'A') == U'A');
    CHECK(glyph::sanitize(U'~') == U'~');
    CHECK(glyph::sanitize(U'█') == U'█');
}

TEST_CASE("Control code points sanitize to a blank")
{
    CHECK(glyph::sanitize(U'\n') == U' ');
    CHECK(glyph::sanitize(U'\x1b') == U' ');
    CHECK(glyph::sanitize(U'\x7f') == U' ');
    CHECK(glyph::sanitize(static_cast<char32_t>(0x110000)) == U' ');
}

// =================================================================
// UTF-8
// =================================================================

TEST_CASE("decode_utf8 yields one code point per character")
{
    const std::u32string decoded = glyph::decode_utf8("a\xC3\xA9\xE2\x96\x88");  // a é █
    REQUIRE(decoded.size() == 3);
    CHECK(decoded[0] == U'a');
    CHECK(decoded[1] == U'é');
    CHECK(decoded[2] == U'█');
}

TEST_CASE("Malformed UTF-8 decodes to the replacement character")
{
    const std::u32string decoded = glyph::decode_utf8("x\xFFy");
    REQUIRE(decoded.size() == 3);
    CHECK(decoded[1] == U'�');
    CHECK(decoded[2] == U'y');
}

TEST_CASE("append_utf8 encodes multi-byte code points")
{
    std::string out;
    glyph::append_utf8(out, U'é');
    CHECK(out == "\xC3\xA9");
}

// =================================================================
// Cell padding
// =================================================================

TEST_CASE("Narrow glyphs are padded to two columns")
{
    std::string out;
    glyph::append_cell(out, U'A');
    CHECK(out == "A ");
    CHECK(glyph::column_width(U'A') == 1);
}

TEST_CASE("Wide glyphs already fill two columns")
{
    std::string out;
    glyph::append_cell(out, U'漢');  // 漢
    CHECK(glyph::column_width(U'漢') == 2);
    CHECK(out == "\xE6\xBC\xA2");
}
