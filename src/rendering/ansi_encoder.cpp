/// @file ansi_encoder.cpp
/// @brief ANSI frame encoding with row-wrap handling.

#include "rendering/ansi_encoder.hpp"

#include "rendering/glyph.hpp"

#include <algorithm>

namespace cadence::rendering
{

namespace
{

constexpr const char* kReset = "\x1b[0m";

int color_index(Color color)
{
    return static_cast<int>(color) - static_cast<int>(Color::Black);
}

} // anonymous namespace

AnsiEncoder::AnsiEncoder(Vec2i grid_size)
    : m_row_units{static_cast<i64>(grid_size.x) * kUnitsPerCell}
    , m_rows{grid_size.y}
{
}

std::string AnsiEncoder::sgr(const Style& style)
{
    if (style == Style{})
    {
        return kReset;
    }

    std::string seq = "\x1b[0";
    if (style.bright)
    {
        seq += ";1";
    }
    if (style.fg != Color::Default)
    {
        seq += ";" + std::to_string(30 + color_index(style.fg));
    }
    if (style.bg != Color::Default)
    {
        seq += ";" + std::to_string(40 + color_index(style.bg));
    }
    seq += 'm';
    return seq;
}

void AnsiEncoder::move_cursor(std::string& out, i64 row, i64 column)
{
    out += "\x1b[";
    out += std::to_string(row + 1);
    out += ';';
    out += std::to_string(column + 1);
    out += 'H';
}

void AnsiEncoder::begin_frame(std::string& out) const
{
    move_cursor(out, 0, 0);
}

void AnsiEncoder::encode_span(std::string& out, const Span& span) const
{
    i64 row = span.start() / m_row_units;
    i64 column = span.start() % m_row_units;
    if (row >= m_rows)
    {
        return;
    }

    move_cursor(out, row, column);
    out += sgr(span.code());

    const std::u32string& text = span.text();
    std::size_t emitted = 0;

    while (emitted < text.size() && row < m_rows)
    {
        const auto room = static_cast<std::size_t>((m_row_units - column) / kUnitsPerCell);
        const std::size_t chunk = std::min(text.size() - emitted, room);

        for (std::size_t i = 0; i < chunk; ++i)
        {
            glyph::append_cell(out, text[emitted + i]);
        }
        emitted += chunk;
        ++row;
        column = 0;

        // Continue on the next row only if text remains and that row exists
        if (emitted < text.size() && row < m_rows)
        {
            move_cursor(out, row, 0);
        }
    }
}

void AnsiEncoder::end_frame(std::string& out) const
{
    out += kReset;
    move_cursor(out, m_rows, 0);
}

std::string AnsiEncoder::blank_frame() const
{
    std::string out;
    out.reserve(static_cast<std::size_t>((m_row_units + 16) * m_rows));

    begin_frame(out);
    out += kReset;
    for (i64 row = 0; row < m_rows; ++row)
    {
        move_cursor(out, row, 0);
        out.append(static_cast<std::size_t>(m_row_units), ' ');
    }
    end_frame(out);
    return out;
}

} // namespace cadence::rendering
