#pragma once

/// @file text.hpp
/// @brief UTF-8 column helpers for fixed-width terminal layout.
///
/// Every glyph this program draws is one column wide, so a column is
/// counted as one code point.

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace orrery::core
{
    /// @brief Number of code points in @p text (continuation bytes are skipped).
    [[nodiscard]] i32 utf8_columns(std::string_view text);

    /// @brief Longest prefix of @p text that fits in @p columns, never splitting a code point.
    [[nodiscard]] std::string_view utf8_truncate(std::string_view text, i32 columns);

    /// @brief @p text truncated or right-padded with spaces to exactly @p columns.
    [[nodiscard]] std::string utf8_pad(std::string_view text, i32 columns);

} // namespace orrery::core
