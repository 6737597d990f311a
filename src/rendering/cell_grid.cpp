/// @file cell_grid.cpp
/// @brief Priority compositing, ring sampling, and span serialization.

#include "rendering/cell_grid.hpp"

#include <algorithm>
#include <cmath>

namespace orrery::rendering
{

CellGrid::CellGrid(i32 width, i32 height)
    : m_width(std::max(width, 1))
    , m_height(std::max(height, 1))
    , m_cells(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height))
{
}

bool CellGrid::in_bounds(i32 x, i32 y) const
{
    return x >= 0 && y >= 0 && x < m_width && y < m_height;
}

std::size_t CellGrid::index(i32 x, i32 y) const
{
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width)
         + static_cast<std::size_t>(x);
}

// -----------------------------------------------------------------
// Compositing: empty → write, occupied → strictly higher priority wins
// -----------------------------------------------------------------

bool CellGrid::put(i32 x, i32 y, const Pixel& pixel)
{
    if (!in_bounds(x, y))
    {
        return false;
    }

    auto& cell = m_cells[index(x, y)];
    if (cell.has_value() && pixel.priority <= cell->priority)
    {
        return false;
    }

    cell = pixel;
    return true;
}

std::optional<Pixel> CellGrid::at(i32 x, i32 y) const
{
    if (!in_bounds(x, y))
    {
        return std::nullopt;
    }
    return m_cells[index(x, y)];
}

std::size_t CellGrid::filled_count() const
{
    return static_cast<std::size_t>(std::ranges::count_if(
        m_cells, [](const std::optional<Pixel>& cell) { return cell.has_value(); }));
}

// -----------------------------------------------------------------
// Ring rasterization by angular sampling
//
// Sample density scales with radius so large rings have no gaps and
// small rings do not waste samples on the same few cells.
// -----------------------------------------------------------------

i32 CellGrid::ring_steps(f64 radius_cells)
{
    if (radius_cells < 1.0)
    {
        return 0;
    }
    const f64 steps = std::clamp(radius_cells * kRingStepsPerCell,
                                 static_cast<f64>(kMinRingSteps),
                                 static_cast<f64>(kMaxRingSteps));
    return static_cast<i32>(steps);
}

i32 CellGrid::draw_ring(Vec2i center, f64 radius_cells)
{
    const i32 steps = ring_steps(radius_cells);

    const Pixel ring{
        .glyph    = kRingGlyph,
        .color    = Color::DarkGray,
        .priority = priority::kRing,
    };

    for (i32 i = 0; i < steps; ++i)
    {
        const f64 t = static_cast<f64>(i) * astro_constants::kTwoPi / static_cast<f64>(steps);
        const auto dx = static_cast<i32>(std::lround(std::cos(t) * radius_cells));
        const auto dy = static_cast<i32>(std::lround(std::sin(t) * radius_cells));
        put(center.x + dx, center.y - dy, ring);
    }

    return steps;
}

// -----------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------

std::vector<SpanRow> CellGrid::serialize() const
{
    std::vector<SpanRow> rows;
    rows.reserve(static_cast<std::size_t>(m_height));

    for (i32 y = 0; y < m_height; ++y)
    {
        SpanRow row;
        row.reserve(static_cast<std::size_t>(m_width));
        for (i32 x = 0; x < m_width; ++x)
        {
            const auto& cell = m_cells[index(x, y)];
            if (cell.has_value())
            {
                row.push_back(Span{.text = cell->glyph, .color = cell->color});
            }
            else
            {
                row.push_back(Span{.text = kBlankGlyph, .color = std::nullopt});
            }
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace orrery::rendering
