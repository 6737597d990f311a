/// @file orbit_map.cpp
/// @brief Map panel composition over CellGrid.

#include "rendering/orbit_map.hpp"

#include "solar/body_catalog.hpp"

namespace orrery::rendering
{

using solar::BodyCatalog;
using solar::BodyId;

CellGrid OrbitMap::render(i32 width, i32 height, const solar::ViewState& view)
{
    CellGrid grid(width, height);

    const f64 focus_au = view.focus().orbit_au;
    const Projection projection(grid.width(), grid.height(), focus_au, view.zoom);

    draw_rings(grid, projection, focus_au);
    draw_bodies(grid, projection, view);

    return grid;
}

std::vector<SpanRow> OrbitMap::render_rows(i32 width, i32 height, const solar::ViewState& view)
{
    return render(width, height, view).serialize();
}

// -----------------------------------------------------------------
// Rings: only orbits inside the focus radius
// -----------------------------------------------------------------

void OrbitMap::draw_rings(CellGrid& grid, const Projection& projection, f64 focus_au)
{
    for (const auto& body : BodyCatalog::all())
    {
        if (!body.orbit_au.has_value() || *body.orbit_au > focus_au)
        {
            continue;
        }
        grid.draw_ring(projection.center(), projection.to_cells(*body.orbit_au));
    }
}

// -----------------------------------------------------------------
// Sun at the center, then every body with a known position.
// Outer planets are still drawn when focused in; only their rings hide.
// -----------------------------------------------------------------

void OrbitMap::draw_bodies(CellGrid& grid, const Projection& projection,
                           const solar::ViewState& view)
{
    const auto& sun = BodyCatalog::get(BodyId::Sun);
    const Vec2i center = projection.center();
    grid.put(center.x, center.y, Pixel{
        .glyph    = BodyCatalog::icon(sun, view.icon_style),
        .color    = sun.color,
        .priority = priority::kSun,
    });

    for (const auto& body : BodyCatalog::all())
    {
        const auto& position = view.position(body.id);
        if (!position.has_value())
        {
            continue;
        }

        const Vec2i cell = projection.to_screen(*position);
        grid.put(cell.x, cell.y, Pixel{
            .glyph    = BodyCatalog::icon(body, view.icon_style),
            .color    = body.color,
            .priority = priority::kPlanet,
        });
    }
}

} // namespace orrery::rendering
