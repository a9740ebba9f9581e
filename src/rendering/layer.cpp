/// @file layer.cpp
/// @brief Layer write operations: ordered span splitting and coalescing.

#include "rendering/layer.hpp"

#include "rendering/glyph.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace cadence::rendering
{

namespace
{

i64 align_to_cell(i64 loc)
{
    return loc - (loc % kUnitsPerCell);
}

} // anonymous namespace

Layer::Layer(Vec2i grid_size)
{
    if (grid_size.x <= 0 || grid_size.y <= 0)
    {
        throw std::invalid_argument("Layer: grid size must be positive");
    }

    m_row_units = static_cast<i64>(grid_size.x) * kUnitsPerCell;
    m_capacity = m_row_units * grid_size.y;
    m_cells.assign(static_cast<std::size_t>(grid_size.x) * static_cast<std::size_t>(grid_size.y),
                   kBlankCell);
}

bool Layer::in_range(i64 loc) const
{
    return loc >= 0 && loc < m_capacity;
}

void Layer::store(i64 loc, char32_t ch, const Style& code)
{
    m_cells[static_cast<std::size_t>(loc / kUnitsPerCell)] = Cell{.glyph = ch, .style = code};
}

const Cell& Layer::cell_at(i64 loc) const
{
    if (!in_range(loc))
    {
        return kBlankCell;
    }
    return m_cells[static_cast<std::size_t>(loc / kUnitsPerCell)];
}

void Layer::drain()
{
    m_spans.clear();
}

// -----------------------------------------------------------------
// set_char: splice one cell into the span set
// -----------------------------------------------------------------

void Layer::set_char(i64 loc, char32_t ch, const Style& code)
{
    if (!in_range(loc))
    {
        return;
    }

    loc = align_to_cell(loc);
    ch = glyph::sanitize(ch);
    store(loc, ch, code);

    // First span starting after loc; its predecessor is the rightmost start <= loc
    auto next = std::upper_bound(m_spans.begin(), m_spans.end(), loc,
                                 [](i64 value, const Span& span) { return value < span.start(); });

    if (next != m_spans.begin())
    {
        auto prev = std::prev(next);

        if (prev->code() == code && (prev->covers(loc) || prev->end() == loc))
        {
            const bool appended = prev->end() == loc;
            prev->put(loc, ch);

            // Growing right may close the gap to a same-style neighbour
            if (appended && next != m_spans.end() && next->start() == prev->end() &&
                next->code() == code)
            {
                prev->absorb(*next);
                m_spans.erase(next);
            }
            return;
        }

        // Splitting a different style can leave the new cell touching same-style neighbours
        if (prev->covers(loc))
        {
            splice(Span(loc, std::u32string(1, ch), code));
            return;
        }
    }

    Span fresh(loc, std::u32string(1, ch), code);

    if (next != m_spans.end() && next->start() == fresh.end() && next->code() == code)
    {
        fresh.absorb(*next);
        *next = std::move(fresh);
        return;
    }

    m_spans.insert(next, std::move(fresh));
}

// -----------------------------------------------------------------
// set_string: batch overwrite of [loc, loc + 2n)
//
// splice(): every span overlapping or touching the incoming extent is consumed:
//   same style       -> folded into the incoming span
//   different style  -> only the parts outside the extent survive
// The survivors and the incoming span replace the consumed range in order.
// -----------------------------------------------------------------

void Layer::set_string(i64 loc, std::u32string_view text, const Style& code)
{
    if (!in_range(loc) || text.empty())
    {
        return;
    }

    loc = align_to_cell(loc);

    const auto room = static_cast<std::size_t>((m_capacity - loc) / kUnitsPerCell);
    const std::size_t count = std::min(text.size(), room);

    std::u32string cells;
    cells.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const char32_t ch = glyph::sanitize(text[i]);
        cells.push_back(ch);
        store(loc + static_cast<i64>(i) * kUnitsPerCell, ch, code);
    }

    splice(Span(loc, std::move(cells), code));
}

void Layer::splice(Span incoming)
{
    const i64 write_begin = incoming.start();
    const i64 write_end = incoming.end();
    const Style code = incoming.code();

    std::vector<Span> before;
    std::vector<Span> after;

    auto first = std::partition_point(m_spans.begin(), m_spans.end(),
                                      [write_begin](const Span& span) { return span.end() < write_begin; });
    auto last = first;

    for (; last != m_spans.end() && last->start() <= write_end; ++last)
    {
        const Span& span = *last;

        if (span.code() == code)
        {
            incoming.absorb(span);
            continue;
        }

        // Different style, only touching: kept whole
        if (span.end() == write_begin)
        {
            before.push_back(span);
            continue;
        }
        if (span.start() == write_end)
        {
            after.push_back(span);
            continue;
        }

        auto [head, tail] = span.cut(write_begin, write_end);
        if (head)
        {
            before.push_back(std::move(*head));
        }
        if (tail)
        {
            after.push_back(std::move(*tail));
        }
    }

    std::vector<Span> replacement;
    replacement.reserve(before.size() + 1 + after.size());
    std::move(before.begin(), before.end(), std::back_inserter(replacement));
    replacement.push_back(std::move(incoming));
    std::move(after.begin(), after.end(), std::back_inserter(replacement));

    auto pos = m_spans.erase(first, last);
    m_spans.insert(pos, std::make_move_iterator(replacement.begin()),
                   std::make_move_iterator(replacement.end()));
}

void Layer::clear()
{
    const auto cells = static_cast<std::size_t>(m_capacity / kUnitsPerCell);
    set_string(0, std::u32string(cells, kBlankCell.glyph), kBlankCell.style);
}

} // namespace cadence::rendering
