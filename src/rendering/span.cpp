/// @file span.cpp
/// @brief Span splice, merge, and split primitives.

#include "rendering/span.hpp"

#include <algorithm>

namespace cadence::rendering
{

Span::Span(i64 start, std::u32string text, const Style& code)
    : m_start{start}
    , m_text{std::move(text)}
    , m_code{code}
{
}

i64 Span::length() const
{
    return static_cast<i64>(m_text.size()) * kUnitsPerCell;
}

bool Span::covers(i64 loc) const
{
    return loc >= m_start && loc < end();
}

std::size_t Span::index_of(i64 loc) const
{
    return static_cast<std::size_t>((loc - m_start) / kUnitsPerCell);
}

void Span::put(i64 loc, char32_t ch)
{
    if (loc == end())
    {
        m_text.push_back(ch);
        return;
    }
    m_text[index_of(loc)] = ch;
}

void Span::absorb(const Span& older)
{
    std::u32string merged;
    merged.reserve(m_text.size() + older.m_text.size());

    // Older cells left of this span
    if (older.m_start < m_start)
    {
        merged.append(older.m_text, 0, older.index_of(m_start));
    }

    merged.append(m_text);

    // Older cells right of this span
    if (older.end() > end())
    {
        merged.append(older.m_text, older.index_of(end()), std::u32string::npos);
    }

    m_start = std::min(m_start, older.m_start);
    m_text = std::move(merged);
}

std::pair<std::optional<Span>, std::optional<Span>> Span::cut(i64 begin, i64 end) const
{
    std::optional<Span> head;
    std::optional<Span> tail;

    if (m_start < begin)
    {
        head.emplace(m_start, m_text.substr(0, index_of(begin)), m_code);
    }

    if (this->end() > end)
    {
        const i64 tail_start = std::max(end, m_start);
        tail.emplace(tail_start, m_text.substr(index_of(tail_start)), m_code);
    }

    return {std::move(head), std::move(tail)};
}

} // namespace cadence::rendering
