#pragma once

/// @file cell_grid.hpp
/// @brief Character-cell grid with priority compositing and ring rasterization.

#include "core/types.hpp"
#include "rendering/color.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace orrery::rendering
{
    /// @brief One drawn cell. @c glyph must point at static storage.
    struct Pixel
    {
        std::string_view glyph;     ///< UTF-8, one terminal column wide
        Color color = Color::Default;
        u8 priority = 0;
    };

    /// Draw priorities. Higher wins a contested cell.
    namespace priority
    {
        constexpr u8 kRing   = 1;
        constexpr u8 kSun    = 10;
        constexpr u8 kPlanet = 20;
    }

    /// @brief One styled cell of serialized output.
    struct Span
    {
        std::string_view text;
        std::optional<Color> color;     ///< std::nullopt = unstyled blank
    };

    using SpanRow = std::vector<Span>;

    /// @brief Fixed-size grid of optional pixels, rebuilt from scratch every frame.
    ///
    /// put() is the only way to write a cell. It silently drops coordinates
    /// outside the grid and keeps the existing pixel unless the new one has a
    /// strictly higher priority, so among equal priorities the first write wins.
    class CellGrid
    {
    public:
        static constexpr std::string_view kRingGlyph = "·";   // middle dot
        static constexpr std::string_view kBlankGlyph = " ";

        static constexpr i32 kMinRingSteps = 64;
        static constexpr i32 kMaxRingSteps = 720;
        static constexpr f64 kRingStepsPerCell = 6.0;

        /// @brief Create an empty grid. Dimensions below 1 are floored to 1.
        CellGrid(i32 width, i32 height);

        [[nodiscard]] i32 width() const { return m_width; }
        [[nodiscard]] i32 height() const { return m_height; }

        [[nodiscard]] bool in_bounds(i32 x, i32 y) const;

        /// @brief Composite @p pixel into (x, y). Returns true if the cell changed.
        bool put(i32 x, i32 y, const Pixel& pixel);

        /// @brief Cell content, or std::nullopt if empty or out of range.
        [[nodiscard]] std::optional<Pixel> at(i32 x, i32 y) const;

        /// @brief Number of non-empty cells.
        [[nodiscard]] std::size_t filled_count() const;

        /// @brief Draw a sampled circle of ring pixels around @p center.
        ///
        /// Radii below one cell draw nothing. The sample count is
        /// clamp(radius × 6, 64, 720), evenly spaced in angle.
        /// @return Number of samples taken (0 if the ring was too small).
        i32 draw_ring(Vec2i center, f64 radius_cells);

        /// @brief Sample count draw_ring() uses for @p radius_cells.
        [[nodiscard]] static i32 ring_steps(f64 radius_cells);

        /// @brief Rows of styled spans, one span per cell.
        [[nodiscard]] std::vector<SpanRow> serialize() const;

    private:
        [[nodiscard]] std::size_t index(i32 x, i32 y) const;

        i32 m_width;
        i32 m_height;
        std::vector<std::optional<Pixel>> m_cells;
    };

} // namespace orrery::rendering
