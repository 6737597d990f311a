#pragma once

/// @file orbit_map.hpp
/// @brief Builds the map panel: orbit rings, the Sun, and planet markers.

#include "core/types.hpp"
#include "rendering/cell_grid.hpp"
#include "rendering/projection.hpp"
#include "solar/view_state.hpp"

#include <vector>

namespace orrery::rendering
{
    /// @brief Stateless renderer from a ViewState snapshot to a filled CellGrid.
    ///
    /// Draw order is fixed: rings (orbit ≤ focus radius, Mercury outward), the
    /// Sun at the grid center, then every body with a known position in catalog
    /// order. Focus affects which rings appear, never which markers appear.
    class OrbitMap
    {
    public:
        OrbitMap() = delete;

        /// @brief Render a full grid for a width × height panel interior.
        [[nodiscard]] static CellGrid render(i32 width, i32 height, const solar::ViewState& view);

        /// @brief render() followed by serialization into styled rows.
        [[nodiscard]] static std::vector<SpanRow> render_rows(i32 width, i32 height,
                                                              const solar::ViewState& view);

    private:
        static void draw_rings(CellGrid& grid, const Projection& projection,
                               f64 focus_au);
        static void draw_bodies(CellGrid& grid, const Projection& projection,
                                const solar::ViewState& view);
    };

} // namespace orrery::rendering
