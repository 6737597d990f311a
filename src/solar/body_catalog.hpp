#pragma once

/// @file body_catalog.hpp
/// @brief Static registry of the Sun and planets, plus the focus-level table.

#include "core/types.hpp"
#include "rendering/color.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace orrery::solar
{
    /// @brief Closed set of bodies shown by the map. Order is the table order.
    enum class BodyId : u8
    {
        Sun = 0,
        Mercury,
        Venus,
        Earth,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,

        Count
    };

    inline constexpr std::size_t kBodyCount = static_cast<std::size_t>(BodyId::Count);

    /// @brief Which of the two glyph sets is drawn.
    enum class IconStyle : u8
    {
        NerdFont,   ///< Private-use glyphs from a patched Nerd Font
        Unicode,    ///< Standard astronomical symbols
    };

    /// @brief Immutable display metadata for one body.
    struct BodyInfo
    {
        BodyId id;
        std::string_view name;
        std::string_view horizons_command;      ///< Horizons COMMAND parameter
        std::string_view nerd_icon;             ///< UTF-8
        std::string_view unicode_icon;          ///< UTF-8
        rendering::Color color;
        std::optional<f64> orbit_au;            ///< Nominal circular orbit, none for the Sun
    };

    /// @brief One discrete "fit this orbit to the panel" choice.
    struct FocusLevel
    {
        std::string_view name;
        f64 orbit_au;
    };

    /// @brief Lookup helpers over the fixed body table.
    ///
    /// The per-frame path only indexes by BodyId. Name lookup exists for the
    /// command line and tests.
    class BodyCatalog
    {
    public:
        BodyCatalog() = delete;

        /// @brief All bodies, Sun first, then planets outward.
        [[nodiscard]] static std::span<const BodyInfo, kBodyCount> all();

        [[nodiscard]] static const BodyInfo& get(BodyId id);

        /// @brief Case-insensitive name lookup.
        [[nodiscard]] static std::optional<BodyId> find_by_name(std::string_view name);

        /// @brief Focus levels, innermost (Earth) to outermost (Neptune).
        [[nodiscard]] static std::span<const FocusLevel> focus_levels();

        /// @brief Focus level at @p index, clamped to the valid range.
        [[nodiscard]] static const FocusLevel& focus_level(std::size_t index);

        [[nodiscard]] static std::size_t outermost_focus_index();

        /// @brief Icon glyph for the given style.
        [[nodiscard]] static std::string_view icon(const BodyInfo& info, IconStyle style);
    };

    [[nodiscard]] constexpr std::size_t index_of(BodyId id)
    {
        return static_cast<std::size_t>(id);
    }

} // namespace orrery::solar
