#pragma once

/// @file layer.hpp
/// @brief One independently diffed paint surface: pending spans plus a dense snapshot.

#include "core/types.hpp"
#include "rendering/span.hpp"
#include "rendering/style.hpp"

#include <string_view>
#include <vector>

namespace cadence::rendering
{
    /// @brief Paint surface holding two views of the same writes.
    ///
    /// - The pending spans: what changed since the last flush, sorted by start and
    ///   pairwise non-overlapping. Drained by the canvas once per frame.
    /// - The snapshot: one Cell per grid cell, always fully populated, authoritative
    ///   for reads regardless of what has or has not been flushed.
    ///
    /// Every write updates both views before returning. Offsets are flattened units
    /// (x * 2 + y * 2W); anything outside [0, capacity()) is clipped silently.
    class Layer
    {
    public:
        /// @param grid_size Width and height in cells. Both must be positive.
        explicit Layer(Vec2i grid_size);

        /// @brief Write one cell at flattened offset loc.
        void set_char(i64 loc, char32_t ch, const Style& code);

        /// @brief Write a run of cells starting at loc as one batch.
        /// Cells past the end of the layer are dropped; the run may cross rows.
        void set_string(i64 loc, std::u32string_view text, const Style& code);

        /// @brief Blank the whole layer through a single full-capacity write.
        void clear();

        /// @brief Snapshot cell at loc, or the blank cell when out of range.
        [[nodiscard]] const Cell& cell_at(i64 loc) const;

        /// @brief Pending spans in start order.
        [[nodiscard]] const std::vector<Span>& pending() const { return m_spans; }

        /// @brief Drop all pending spans (after they have been flushed).
        void drain();

        /// @brief Size of the flattened space: 2W * H.
        [[nodiscard]] i64 capacity() const { return m_capacity; }

        /// @brief Flattened units per grid row: 2W.
        [[nodiscard]] i64 row_units() const { return m_row_units; }

    private:
        [[nodiscard]] bool in_range(i64 loc) const;
        void store(i64 loc, char32_t ch, const Style& code);
        /// @brief Replace every span overlapping or touching incoming's extent.
        void splice(Span incoming);

        std::vector<Span> m_spans;
        std::vector<Cell> m_cells;
        i64 m_row_units = 0;
        i64 m_capacity = 0;
    };

} // namespace cadence::rendering
