/// @file canvas.cpp
/// @brief Canvas coordinate mapping, clipping, and frame flush.

#include "rendering/canvas.hpp"

#include "core/logger.hpp"
#include "rendering/glyph.hpp"

#include <algorithm>
#include <stdexcept>

namespace cadence::rendering
{

Canvas::Canvas(const CanvasConfig& config)
    : m_size{config.width, config.height}
    , m_encoder{Vec2i{config.width, config.height}}
{
    if (config.width <= 0 || config.height <= 0)
    {
        throw std::invalid_argument("Canvas: width and height must be positive");
    }
    if (config.layer_count <= 0)
    {
        throw std::invalid_argument("Canvas: layer_count must be positive");
    }

    m_layers.reserve(static_cast<std::size_t>(config.layer_count));
    for (i32 i = 0; i < config.layer_count; ++i)
    {
        m_layers.emplace_back(m_size);
    }

    CDN_CORE_INFO("Canvas created: {}x{} cells, {} layers", m_size.x, m_size.y, config.layer_count);
}

bool Canvas::has_layer(i32 layer) const
{
    return layer >= 0 && layer < layer_count();
}

bool Canvas::on_grid(Vec2i pos) const
{
    return pos.x >= 0 && pos.x < m_size.x && pos.y >= 0 && pos.y < m_size.y;
}

i64 Canvas::flatten(Vec2i pos) const
{
    return static_cast<i64>(pos.x) * kUnitsPerCell +
           static_cast<i64>(pos.y) * static_cast<i64>(m_size.x) * kUnitsPerCell;
}

const Layer& Canvas::layer(i32 index) const
{
    return m_layers.at(static_cast<std::size_t>(index));
}

// =================================================================
// Writes
// =================================================================

void Canvas::set_char(i32 layer, Vec2i pos, char32_t ch, const Style& style)
{
    if (!has_layer(layer))
    {
        return;
    }
    ++m_edits_this_frame;

    if (!on_grid(pos))
    {
        return;
    }
    m_layers[static_cast<std::size_t>(layer)].set_char(flatten(pos), ch, style);
}

void Canvas::set_string(i32 layer, Vec2i pos, std::u32string_view text, const Style& style)
{
    if (!has_layer(layer))
    {
        return;
    }
    ++m_edits_this_frame;

    if (pos.y < 0 || pos.y >= m_size.y || pos.x >= m_size.x)
    {
        return;
    }

    // Drop cells left of column 0
    if (pos.x < 0)
    {
        const auto skip = static_cast<std::size_t>(-static_cast<i64>(pos.x));
        if (skip >= text.size())
        {
            return;
        }
        text.remove_prefix(skip);
        pos.x = 0;
    }

    // Drop cells right of the last column
    const auto room = static_cast<std::size_t>(m_size.x - pos.x);
    if (text.size() > room)
    {
        text = text.substr(0, room);
    }

    m_layers[static_cast<std::size_t>(layer)].set_string(flatten(pos), text, style);
}

void Canvas::set_string(i32 layer, Vec2i pos, std::string_view text, const Style& style)
{
    const std::u32string decoded = glyph::decode_utf8(text);
    set_string(layer, pos, std::u32string_view{decoded}, style);
}

void Canvas::set_multiline_string(i32 layer, Vec2i pos, std::string_view text, const Style& style)
{
    i32 y = pos.y;
    std::size_t line_begin = 0;

    while (line_begin <= text.size())
    {
        if (y >= m_size.y)
        {
            break;
        }

        std::size_t line_end = text.find('\n', line_begin);
        if (line_end == std::string_view::npos)
        {
            line_end = text.size();
        }

        set_string(layer, Vec2i{pos.x, y}, text.substr(line_begin, line_end - line_begin), style);

        line_begin = line_end + 1;
        ++y;
    }
}

void Canvas::fill_rectangle(i32 layer, Vec2i pos, Vec2i size, char32_t ch, const Style& style)
{
    const i32 x0 = std::max(pos.x, 0);
    const i32 y0 = std::max(pos.y, 0);
    const auto x1 = static_cast<i32>(std::min(static_cast<i64>(pos.x) + size.x, static_cast<i64>(m_size.x)));
    const auto y1 = static_cast<i32>(std::min(static_cast<i64>(pos.y) + size.y, static_cast<i64>(m_size.y)));

    for (i32 y = y0; y < y1; ++y)
    {
        for (i32 x = x0; x < x1; ++x)
        {
            set_char(layer, Vec2i{x, y}, ch, style);
        }
    }
}

void Canvas::draw_border(i32 layer, Vec2i pos, Vec2i size, std::string_view border_chars,
                         const Style& style)
{
    if (size.x <= 0 || size.y <= 0)
    {
        return;
    }

    std::u32string glyphs = glyph::decode_utf8(border_chars);
    if (glyphs.size() != 8)
    {
        const char32_t only = glyphs.empty() ? U'#' : glyphs.front();
        glyphs.assign(8, only);
    }

    const char32_t top_left = glyphs[0];
    const char32_t top = glyphs[1];
    const char32_t top_right = glyphs[2];
    const char32_t left = glyphs[3];
    const char32_t right = glyphs[4];
    const char32_t bottom_left = glyphs[5];
    const char32_t bottom = glyphs[6];
    const char32_t bottom_right = glyphs[7];

    const i32 last_x = size.x - 1;
    const i32 last_y = size.y - 1;

    for (i32 x = 0; x < size.x; ++x)
    {
        const char32_t upper = (x == 0) ? top_left : (x == last_x ? top_right : top);
        const char32_t lower = (x == 0) ? bottom_left : (x == last_x ? bottom_right : bottom);
        set_char(layer, Vec2i{pos.x + x, pos.y}, upper, style);
        set_char(layer, Vec2i{pos.x + x, pos.y + last_y}, lower, style);
    }

    for (i32 y = 1; y < last_y; ++y)
    {
        set_char(layer, Vec2i{pos.x, pos.y + y}, left, style);
        set_char(layer, Vec2i{pos.x + last_x, pos.y + y}, right, style);
    }
}

void Canvas::clear_layer(i32 layer)
{
    if (!has_layer(layer))
    {
        return;
    }
    ++m_edits_this_frame;
    m_layers[static_cast<std::size_t>(layer)].clear();
}

void Canvas::clear_all()
{
    for (i32 i = 0; i < layer_count(); ++i)
    {
        clear_layer(i);
    }
}

// =================================================================
// Reads
// =================================================================

Cell Canvas::get_char(i32 layer, Vec2i pos) const
{
    if (!has_layer(layer) || !on_grid(pos))
    {
        return kBlankCell;
    }
    return m_layers[static_cast<std::size_t>(layer)].cell_at(flatten(pos));
}

// =================================================================
// Flush
// =================================================================

std::string Canvas::render()
{
    std::string frame;
    std::size_t span_count = 0;

    m_encoder.begin_frame(frame);

    // Bottom layer first: later layers overwrite it on the terminal
    for (auto& layer : m_layers)
    {
        for (const auto& span : layer.pending())
        {
            m_encoder.encode_span(frame, span);
        }
        span_count += layer.pending().size();
        layer.drain();
    }

    m_encoder.end_frame(frame);

    CDN_CORE_TRACE("Frame {}: {} edits, {} spans, {} bytes",
                   m_frame_count, m_edits_this_frame, span_count, frame.size());

    ++m_frame_count;
    m_edits_this_frame = 0;
    return frame;
}

std::string Canvas::render_blank() const
{
    return m_encoder.blank_frame();
}

} // namespace cadence::rendering
