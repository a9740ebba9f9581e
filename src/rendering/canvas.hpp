#pragma once

/// @file canvas.hpp
/// @brief Layered character grid with sparse diffing and one-shot frame flush.

#include "core/types.hpp"
#include "rendering/ansi_encoder.hpp"
#include "rendering/layer.hpp"
#include "rendering/style.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cadence::rendering
{
    /// @brief Canvas geometry. Use designated initializers:
    /// Canvas canvas({.width = 40, .height = 12, .layer_count = 2});
    struct CanvasConfig
    {
        i32 width = 80;
        i32 height = 24;
        i32 layer_count = 5;
    };

    /// @brief Fixed-size character grid made of stacked layers.
    ///
    /// Writes are addressed by (layer, x, y) with x in [0, width) and y in [0, height).
    /// Anything outside the grid, or naming a layer that does not exist, is clipped
    /// without error. render() drains every layer's pending spans, bottom layer
    /// first, into a single stream so later layers win on the terminal.
    ///
    /// Single writer: all writes for a beat must happen before that beat's render().
    class Canvas
    {
    public:
        /// @throws std::invalid_argument if any dimension or the layer count is not positive.
        explicit Canvas(const CanvasConfig& config);

        // -----------------------------------------------------------------
        // Writes
        // -----------------------------------------------------------------

        void set_char(i32 layer, Vec2i pos, char32_t ch, const Style& style = {});

        /// @brief Write a run of cells on row pos.y, clipped to the row.
        void set_string(i32 layer, Vec2i pos, std::u32string_view text, const Style& style = {});

        /// @brief UTF-8 convenience overload.
        void set_string(i32 layer, Vec2i pos, std::string_view text, const Style& style = {});

        /// @brief One set_string per line; stops at the bottom of the canvas.
        void set_multiline_string(i32 layer, Vec2i pos, std::string_view text, const Style& style = {});

        /// @brief set_char over every cell of the rectangle that lies on the canvas.
        void fill_rectangle(i32 layer, Vec2i pos, Vec2i size, char32_t ch, const Style& style = {});

        /// @brief Draw a rectangular outline.
        /// @param border_chars Eight glyphs: top-left, top, top-right, left, right,
        ///        bottom-left, bottom, bottom-right. Any other count uses the first
        ///        glyph everywhere ('#' if empty).
        void draw_border(i32 layer, Vec2i pos, Vec2i size,
                         std::string_view border_chars = "+-+||+-+", const Style& style = {});

        void clear_layer(i32 layer);
        void clear_all();

        // -----------------------------------------------------------------
        // Reads
        // -----------------------------------------------------------------

        /// @brief Current snapshot cell; the blank cell when out of range.
        [[nodiscard]] Cell get_char(i32 layer, Vec2i pos) const;

        /// @throws std::out_of_range for an invalid index.
        [[nodiscard]] const Layer& layer(i32 index) const;

        [[nodiscard]] i32 width() const { return m_size.x; }
        [[nodiscard]] i32 height() const { return m_size.y; }
        [[nodiscard]] i32 layer_count() const { return static_cast<i32>(m_layers.size()); }

        /// @brief Write calls since the last render().
        [[nodiscard]] u32 edits_this_frame() const { return m_edits_this_frame; }

        // -----------------------------------------------------------------
        // Flush
        // -----------------------------------------------------------------

        /// @brief Encode and drain all pending spans into one frame stream.
        [[nodiscard]] std::string render();

        /// @brief Full blank repaint; leaves pending spans untouched.
        [[nodiscard]] std::string render_blank() const;

    private:
        [[nodiscard]] bool has_layer(i32 layer) const;
        [[nodiscard]] bool on_grid(Vec2i pos) const;
        [[nodiscard]] i64 flatten(Vec2i pos) const;

        Vec2i m_size{0, 0};
        std::vector<Layer> m_layers;
        AnsiEncoder m_encoder;
        u32 m_edits_this_frame = 0;
        u64 m_frame_count = 0;
    };

} // namespace cadence::rendering
