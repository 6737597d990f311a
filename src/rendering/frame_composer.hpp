#pragma once

/// @file frame_composer.hpp
/// @brief Screen layout and text for the header, the vector table and the map panel.

#include "core/types.hpp"
#include "rendering/cell_grid.hpp"
#include "rendering/color.hpp"
#include "solar/body_catalog.hpp"
#include "solar/view_state.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::rendering
{
    /// @brief Where each panel goes on a cols × rows screen.
    struct FrameLayout
    {
        static constexpr i32 kHeaderHeight = 3;
        static constexpr i32 kTablePercent = 40;

        Rect header;
        Rect table;
        Rect map;

        /// @brief Header on top, the rest split 40 % / 60 % left to right.
        [[nodiscard]] static FrameLayout compute(i32 cols, i32 rows);

        /// @brief Drawable area inside a bordered panel, at least 1 × 1.
        [[nodiscard]] static Rect interior(const Rect& panel);
    };

    /// @brief One line of the vector table, ready to draw.
    struct ReadoutRow
    {
        std::string_view icon;
        Color color = Color::Default;
        std::string_view name;
        std::string x;
        std::string y;
        std::string z;
        std::string r;      ///< In-plane distance sqrt(x² + y²)
    };

    /// @brief Pure formatting for one frame. Drawing is the caller's job.
    class FrameComposer
    {
    public:
        FrameComposer() = delete;

        static constexpr std::string_view kHeaderTitle = "Solar System";
        static constexpr std::string_view kTableTitle = "Heliocentric vectors (AU)";
        static constexpr std::string_view kMapTitle = "Orbits + positions";
        static constexpr std::string_view kUnknown = "—";

        /// Column widths: icon, body, X, Y, Z, R. One space between columns.
        static constexpr std::array<i32, 6> kColumnWidths = {3, 10, 14, 14, 14, 12};
        static constexpr std::array<std::string_view, 6> kColumnHeaders = {"", "Body", "X", "Y", "Z", "R"};
        static constexpr i32 kColumnSpacing = 1;

        /// @brief Status line shown inside the header box.
        [[nodiscard]] static std::string format_header(const solar::ViewState& view);

        [[nodiscard]] static ReadoutRow format_readout_row(const solar::BodyInfo& body,
                                                           const solar::ViewState& view);

        /// @brief One readout row per body, in catalog order.
        [[nodiscard]] static std::vector<ReadoutRow> readout_rows(const solar::ViewState& view);

        /// @brief Table header line padded to the column widths.
        [[nodiscard]] static std::string format_column_headers();

        /// @brief Left edge of column @p index relative to the table interior.
        [[nodiscard]] static i32 column_offset(std::size_t index);
    };

} // namespace orrery::rendering
