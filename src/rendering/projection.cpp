/// @file projection.cpp
/// @brief Scale derivation and AU → cell mapping.

#include "rendering/projection.hpp"

#include <algorithm>
#include <cmath>

namespace orrery::rendering
{

Projection::Projection(i32 width, i32 height, f64 focus_au, f64 zoom)
    : m_center{std::max(width, 1) / 2, std::max(height, 1) / 2}
    , m_scale{compute_scale(width, height, focus_au, zoom)}
{
}

// -----------------------------------------------------------------
// scale = min(w, h) × 0.45 / max(R_focus, 0.1) × zoom
// -----------------------------------------------------------------

f64 Projection::compute_scale(i32 width, i32 height, f64 focus_au, f64 zoom)
{
    const i32 short_side = std::min(std::max(width, 1), std::max(height, 1));
    const f64 base_scale = static_cast<f64>(short_side) * kFitFraction
                         / std::max(focus_au, kMinFocusAu);
    return base_scale * zoom;
}

Vec2i Projection::to_screen(const Vec3d& position_au) const
{
    const auto dx = static_cast<i32>(std::lround(position_au.x * m_scale));
    const auto dy = static_cast<i32>(std::lround(position_au.y * m_scale));
    return Vec2i{m_center.x + dx, m_center.y - dy};
}

} // namespace orrery::rendering
