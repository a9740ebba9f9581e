#pragma once

/// @file span.hpp
/// @brief A run of same-styled cells pending flush, addressed in flattened units.

#include "core/types.hpp"
#include "rendering/style.hpp"

#include <optional>
#include <string>
#include <utility>

namespace cadence::rendering
{
    /// @brief Flattened units occupied by one logical cell (two terminal columns).
    inline constexpr i64 kUnitsPerCell = 2;

    /// @brief Contiguous same-style run of cells starting at a flattened offset.
    ///
    /// A span covers [start, start + 2 * text.size()). Offsets are always cell
    /// aligned (even). Spans never share state; splitting produces new spans.
    class Span
    {
    public:
        Span(i64 start, std::u32string text, const Style& code);

        [[nodiscard]] i64 start() const { return m_start; }
        [[nodiscard]] i64 end() const { return m_start + length(); }

        /// @brief Extent in flattened units.
        [[nodiscard]] i64 length() const;

        [[nodiscard]] std::size_t cell_count() const { return m_text.size(); }
        [[nodiscard]] const std::u32string& text() const { return m_text; }
        [[nodiscard]] const Style& code() const { return m_code; }

        /// @brief True if loc lies in [start, end).
        [[nodiscard]] bool covers(i64 loc) const;

        /// @brief Overwrite the cell at loc, or append when loc == end().
        /// @pre start() <= loc <= end(), loc cell aligned.
        void put(i64 loc, char32_t ch);

        /// @brief Fold an overlapping or touching older span of the same style into this one.
        ///
        /// Cells of this span win where the two overlap; the older span contributes
        /// only what lies outside this span's extent.
        void absorb(const Span& older);

        /// @brief The parts of this span that lie outside [begin, end).
        /// @return (head, tail); either is empty when nothing remains on that side.
        [[nodiscard]] std::pair<std::optional<Span>, std::optional<Span>>
            cut(i64 begin, i64 end) const;

    private:
        [[nodiscard]] std::size_t index_of(i64 loc) const;

        i64 m_start = 0;
        std::u32string m_text;
        Style m_code;
    };

} // namespace cadence::rendering
