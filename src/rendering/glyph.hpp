#pragma once

/// @file glyph.hpp
/// @brief Code point helpers: UTF-8 conversion and two-column cell padding.

#include <string>
#include <string_view>

namespace cadence::rendering::glyph
{
    /// @brief Terminal column width of a code point (2 for East Asian wide/full-width, else 1).
    [[nodiscard]] int column_width(char32_t cp);

    /// @brief Replace control code points with a blank so they never reach the terminal.
    [[nodiscard]] char32_t sanitize(char32_t cp);

    /// @brief Decode UTF-8 into code points. Malformed sequences decode to U+FFFD.
    [[nodiscard]] std::u32string decode_utf8(std::string_view text);

    /// @brief Append the UTF-8 encoding of a code point.
    void append_utf8(std::string& out, char32_t cp);

    /// @brief Append a code point padded to exactly two terminal columns.
    void append_cell(std::string& out, char32_t cp);

} // namespace cadence::rendering::glyph
