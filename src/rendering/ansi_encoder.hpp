#pragma once

/// @file ansi_encoder.hpp
/// @brief Turns pending spans into an ANSI/VT100 frame stream.

#include "core/types.hpp"
#include "rendering/span.hpp"
#include "rendering/style.hpp"

#include <string>

namespace cadence::rendering
{
    /// @brief Stateless encoder for one canvas geometry.
    ///
    /// Frame layout:
    ///   ESC[1;1H
    ///   per span: ESC[row;colH  SGR  text   (ESC[row;1H at each row wrap)
    ///   ESC[0m ESC[H+1;1H
    ///
    /// Every SGR starts from a reset so one span's colors never bleed into the next.
    class AnsiEncoder
    {
    public:
        /// @param grid_size Canvas width and height in cells.
        explicit AnsiEncoder(Vec2i grid_size);

        /// @brief Append the frame prefix (cursor home).
        void begin_frame(std::string& out) const;

        /// @brief Append one span: position, style, text, wrapping at row ends.
        /// Text on rows at or below the canvas height is not emitted.
        void encode_span(std::string& out, const Span& span) const;

        /// @brief Append the frame trailer (reset, park cursor below the grid).
        void end_frame(std::string& out) const;

        /// @brief Full repaint of blank cells, independent of any pending spans.
        [[nodiscard]] std::string blank_frame() const;

        /// @brief SGR sequence for a style, always beginning with a reset.
        [[nodiscard]] static std::string sgr(const Style& style);

        /// @brief Append a 1-based cursor position sequence for a 0-based row/column.
        static void move_cursor(std::string& out, i64 row, i64 column);

    private:
        i64 m_row_units = 0;
        i64 m_rows = 0;
    };

} // namespace cadence::rendering
