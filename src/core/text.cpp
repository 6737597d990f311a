/// @file text.cpp
/// @brief UTF-8 column helpers.

#include "core/text.hpp"

namespace orrery::core
{

namespace
{

constexpr bool is_continuation(char byte)
{
    return (static_cast<u8>(byte) & 0xC0) == 0x80;
}

} // anonymous namespace

i32 utf8_columns(std::string_view text)
{
    i32 columns = 0;
    for (const char byte : text)
    {
        if (!is_continuation(byte))
        {
            ++columns;
        }
    }
    return columns;
}

std::string_view utf8_truncate(std::string_view text, i32 columns)
{
    if (columns <= 0)
    {
        return {};
    }

    i32 seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (is_continuation(text[i]))
        {
            continue;
        }
        if (seen == columns)
        {
            return text.substr(0, i);
        }
        ++seen;
    }
    return text;
}

std::string utf8_pad(std::string_view text, i32 columns)
{
    const std::string_view fitted = utf8_truncate(text, columns);
    std::string result(fitted);
    const i32 missing = columns - utf8_columns(fitted);
    if (missing > 0)
    {
        result.append(static_cast<std::size_t>(missing), ' ');
    }
    return result;
}

} // namespace orrery::core
