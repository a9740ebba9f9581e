/// @file glyph.cpp
/// @brief Code point helpers backed by ICU character properties.

#include "rendering/glyph.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>

namespace cadence::rendering::glyph
{

namespace
{

constexpr char32_t kReplacement = 0xFFFD;

} // anonymous namespace

int column_width(char32_t cp)
{
    const auto eaw = static_cast<UEastAsianWidth>(
        u_getIntPropertyValue(static_cast<UChar32>(cp), UCHAR_EAST_ASIAN_WIDTH));
    return (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH) ? 2 : 1;
}

char32_t sanitize(char32_t cp)
{
    if (cp < 0x20 || cp == 0x7F || cp > 0x10FFFF)
    {
        return U' ';
    }
    return cp;
}

std::u32string decode_utf8(std::string_view text)
{
    std::u32string out;
    out.reserve(text.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length)
    {
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        out.push_back(c < 0 ? kReplacement : static_cast<char32_t>(c));
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp)
{
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(cp));
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
}

void append_cell(std::string& out, char32_t cp)
{
    append_utf8(out, cp);
    if (column_width(cp) < 2)
    {
        out.push_back(' ');
    }
}

} // namespace cadence::rendering::glyph
