/// @file body_catalog.cpp
/// @brief Body and focus-level tables.

#include "solar/body_catalog.hpp"

#include <algorithm>
#include <cctype>

namespace orrery::solar
{

namespace
{

using rendering::Color;

// Horizons major-body codes: 10 = Sun, n99 = planet n itself (not its barycentre).
// Nerd Font glyphs are Font Awesome 4 code points: f185 sun, f0ac globe, f111 circle.
constexpr std::array<BodyInfo, kBodyCount> kBodies = {{
    {BodyId::Sun,     "Sun",     "10",  "\uf185", "\u2609", Color::Yellow,       std::nullopt},
    {BodyId::Mercury, "Mercury", "199", "\uf111", "\u263f", Color::LightMagenta, 0.387098},
    {BodyId::Venus,   "Venus",   "299", "\uf111", "\u2640", Color::LightYellow,  0.723332},
    {BodyId::Earth,   "Earth",   "399", "\uf0ac", "\u2641", Color::LightBlue,    1.000000},
    {BodyId::Mars,    "Mars",    "499", "\uf111", "\u2642", Color::Red,          1.523679},
    {BodyId::Jupiter, "Jupiter", "599", "\uf111", "\u2643", Color::LightRed,     5.203800},
    {BodyId::Saturn,  "Saturn",  "699", "\uf111", "\u2644", Color::LightYellow,  9.537070},
    {BodyId::Uranus,  "Uranus",  "799", "\uf111", "\u2645", Color::Cyan,         19.19126},
    {BodyId::Neptune, "Neptune", "899", "\uf111", "\u2646", Color::Blue,         30.06896},
}};

constexpr std::array<FocusLevel, 6> kFocusLevels = {{
    {"Earth",   1.000000},
    {"Mars",    1.523679},
    {"Jupiter", 5.203800},
    {"Saturn",  9.537070},
    {"Uranus",  19.19126},
    {"Neptune", 30.06896},
}};

bool iequals(std::string_view a, std::string_view b)
{
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
            == std::tolower(static_cast<unsigned char>(y));
    });
}

} // anonymous namespace

std::span<const BodyInfo, kBodyCount> BodyCatalog::all()
{
    return kBodies;
}

const BodyInfo& BodyCatalog::get(BodyId id)
{
    return kBodies[index_of(id)];
}

std::optional<BodyId> BodyCatalog::find_by_name(std::string_view name)
{
    const auto it = std::ranges::find_if(kBodies, [name](const BodyInfo& info) {
        return iequals(info.name, name);
    });
    if (it == kBodies.end())
    {
        return std::nullopt;
    }
    return it->id;
}

std::span<const FocusLevel> BodyCatalog::focus_levels()
{
    return kFocusLevels;
}

const FocusLevel& BodyCatalog::focus_level(std::size_t index)
{
    return kFocusLevels[std::min(index, kFocusLevels.size() - 1)];
}

std::size_t BodyCatalog::outermost_focus_index()
{
    return kFocusLevels.size() - 1;
}

std::string_view BodyCatalog::icon(const BodyInfo& info, IconStyle style)
{
    return (style == IconStyle::Unicode) ? info.unicode_icon : info.nerd_icon;
}

} // namespace orrery::solar
