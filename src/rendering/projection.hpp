#pragma once

/// @file projection.hpp
/// @brief Top-down orthographic mapping from heliocentric AU to grid cells.

#include "core/types.hpp"

namespace orrery::rendering
{
    /// @brief Maps ecliptic XY positions (AU) onto a width × height character grid.
    ///
    /// The selected focus orbit is fit to 45% of the shorter grid side, then
    /// multiplied by the zoom factor. Screen Y grows downward, so AU-space Y is
    /// inverted. The transform never clamps; callers drop off-grid cells.
    class Projection
    {
    public:
        /// Fraction of min(width, height) the focus orbit radius spans at zoom 1.
        static constexpr f64 kFitFraction = 0.45;

        /// Focus radii below this are treated as this, keeping the scale finite.
        static constexpr f64 kMinFocusAu = 0.1;

        /// @param width  Grid width in cells (values < 1 are treated as 1).
        /// @param height Grid height in cells (values < 1 are treated as 1).
        /// @param focus_au Orbit radius fit to the panel.
        /// @param zoom Multiplicative zoom, expected > 0 (clamped by the caller).
        Projection(i32 width, i32 height, f64 focus_au, f64 zoom);

        /// @brief Cells per AU for the given grid and view parameters.
        [[nodiscard]] static f64 compute_scale(i32 width, i32 height, f64 focus_au, f64 zoom);

        /// @brief Project a heliocentric position; z is ignored.
        [[nodiscard]] Vec2i to_screen(const Vec3d& position_au) const;

        /// @brief Length in cells of a radius given in AU.
        [[nodiscard]] f64 to_cells(f64 radius_au) const { return radius_au * m_scale; }

        [[nodiscard]] f64 scale() const { return m_scale; }
        [[nodiscard]] Vec2i center() const { return m_center; }

    private:
        Vec2i m_center;
        f64 m_scale;
    };

} // namespace orrery::rendering
