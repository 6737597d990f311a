/// @file frame_composer.cpp
/// @brief Frame layout and text formatting.

#include "rendering/frame_composer.hpp"

#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace orrery::rendering
{

// =================================================================
// Layout
// =================================================================

FrameLayout FrameLayout::compute(i32 cols, i32 rows)
{
    cols = std::max(cols, 0);
    rows = std::max(rows, 0);

    FrameLayout layout;

    const i32 header_height = std::min(kHeaderHeight, rows);
    layout.header = Rect{0, 0, cols, header_height};

    const i32 body_height = rows - header_height;
    const i32 table_width = cols * kTablePercent / 100;

    layout.table = Rect{0, header_height, table_width, body_height};
    layout.map = Rect{table_width, header_height, cols - table_width, body_height};
    return layout;
}

Rect FrameLayout::interior(const Rect& panel)
{
    return Rect{
        panel.x + 1,
        panel.y + 1,
        std::max(panel.width - 2, 1),
        std::max(panel.height - 2, 1),
    };
}

// =================================================================
// Text
// =================================================================

std::string FrameComposer::format_header(const solar::ViewState& view)
{
    const auto& focus = view.focus();
    const std::string_view updated = view.last_update_utc.has_value()
        ? std::string_view(*view.last_update_utc)
        : kUnknown;

    return fmt::format(
        "Last update: {} | Status: {} | zoom: {:.2f}x | focus: {} ({:.2f} AU) | "
        "+/- zoom, 0 reset, [ ] focus, q quit",
        updated, view.status, view.zoom, focus.name, focus.orbit_au);
}

ReadoutRow FrameComposer::format_readout_row(const solar::BodyInfo& body,
                                             const solar::ViewState& view)
{
    ReadoutRow row;
    row.icon = solar::BodyCatalog::icon(body, view.icon_style);
    row.color = body.color;
    row.name = body.name;

    const auto& position = view.position(body.id);
    if (!position.has_value())
    {
        row.x = row.y = row.z = row.r = std::string(kUnknown);
        return row;
    }

    const Vec3d& v = *position;
    row.x = fmt::format("{:+.6f}", v.x);
    row.y = fmt::format("{:+.6f}", v.y);
    row.z = fmt::format("{:+.6f}", v.z);
    row.r = fmt::format("{:.6f}", std::sqrt(v.x * v.x + v.y * v.y));
    return row;
}

std::vector<ReadoutRow> FrameComposer::readout_rows(const solar::ViewState& view)
{
    std::vector<ReadoutRow> rows;
    rows.reserve(solar::kBodyCount);
    for (const auto& body : solar::BodyCatalog::all())
    {
        rows.push_back(format_readout_row(body, view));
    }
    return rows;
}

std::string FrameComposer::format_column_headers()
{
    std::string line;
    for (std::size_t i = 0; i < kColumnHeaders.size(); ++i)
    {
        if (i > 0)
        {
            line.append(static_cast<std::size_t>(kColumnSpacing), ' ');
        }
        line += core::utf8_pad(kColumnHeaders[i], kColumnWidths[i]);
    }
    return line;
}

i32 FrameComposer::column_offset(std::size_t index)
{
    i32 offset = 0;
    for (std::size_t i = 0; i < index && i < kColumnWidths.size(); ++i)
    {
        offset += kColumnWidths[i] + kColumnSpacing;
    }
    return offset;
}

} // namespace orrery::rendering
