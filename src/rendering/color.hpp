#pragma once

/// @file color.hpp
/// @brief Terminal foreground palette shared by the body table and the grid.

#include "core/types.hpp"

#include <cstddef>
#include <string_view>

namespace orrery::rendering
{
    /// @brief Named terminal colors. Light variants map to the bright half of the
    /// 16-color palette (or bold on 8-color terminals).
    enum class Color : u8
    {
        Default = 0,
        Red,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        DarkGray,
        LightRed,
        LightYellow,
        LightBlue,
        LightMagenta,

        Count
    };

    inline constexpr std::size_t kColorCount = static_cast<std::size_t>(Color::Count);

    [[nodiscard]] constexpr std::string_view color_name(Color color)
    {
        switch (color)
        {
            case Color::Red:          return "red";
            case Color::Yellow:       return "yellow";
            case Color::Blue:         return "blue";
            case Color::Magenta:      return "magenta";
            case Color::Cyan:         return "cyan";
            case Color::DarkGray:     return "dark-gray";
            case Color::LightRed:     return "light-red";
            case Color::LightYellow:  return "light-yellow";
            case Color::LightBlue:    return "light-blue";
            case Color::LightMagenta: return "light-magenta";
            default:                  return "default";
        }
    }

} // namespace orrery::rendering
