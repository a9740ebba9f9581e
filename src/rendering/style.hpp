#pragma once

/// @file style.hpp
/// @brief Color/style token carried by spans and cells.
///
/// The span machinery treats Style as opaque: it only ever compares two
/// styles for equality. The ANSI encoder is the single place that turns a
/// Style into terminal control sequences.

#include "core/types.hpp"

namespace cadence::rendering
{
    /// @brief The eight classic terminal colors plus "leave as is".
    enum class Color : u8
    {
        Default = 0,
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        White,
    };

    /// @brief Foreground/background pair with an intensity flag.
    struct Style
    {
        Color fg = Color::Default;
        Color bg = Color::Default;
        bool bright = false;

        friend bool operator==(const Style&, const Style&) = default;
    };

    /// @brief Shorthand for a foreground-only style.
    [[nodiscard]] constexpr Style fg(Color color, bool bright = false)
    {
        return Style{.fg = color, .bg = Color::Default, .bright = bright};
    }

    /// @brief One logical grid cell: a code point and its style.
    struct Cell
    {
        char32_t glyph = U' ';
        Style style{};

        friend bool operator==(const Cell&, const Cell&) = default;
    };

    /// @brief The value every cell holds before any write and after a clear.
    inline constexpr Cell kBlankCell{};

} // namespace cadence::rendering
