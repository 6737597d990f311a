/// @file view_state.cpp
/// @brief ViewState mutations and the shared holder.

#include "solar/view_state.hpp"

#include <algorithm>
#include <utility>

namespace orrery::solar
{

// -----------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------

const FocusLevel& ViewState::focus() const
{
    return BodyCatalog::focus_level(focus_index);
}

const std::optional<Vec3d>& ViewState::position(BodyId id) const
{
    return positions[index_of(id)];
}

// -----------------------------------------------------------------
// Zoom: multiplicative steps, clamped
// -----------------------------------------------------------------

f64 ViewState::clamp_zoom(f64 value)
{
    return std::clamp(value, kMinZoom, kMaxZoom);
}

void ViewState::set_zoom(f64 value)
{
    zoom = clamp_zoom(value);
}

void ViewState::zoom_in()
{
    set_zoom(zoom * kZoomStep);
}

void ViewState::zoom_out()
{
    set_zoom(zoom / kZoomStep);
}

// -----------------------------------------------------------------
// Focus
// -----------------------------------------------------------------

void ViewState::focus_in()
{
    if (focus_index > 0)
    {
        --focus_index;
    }
}

void ViewState::focus_out()
{
    focus_index = std::min(focus_index + 1, BodyCatalog::outermost_focus_index());
}

void ViewState::reset_view()
{
    zoom = kDefaultZoom;
    focus_index = BodyCatalog::outermost_focus_index();
}

// -----------------------------------------------------------------
// Ephemeris merge
// -----------------------------------------------------------------

void ViewState::merge(const PositionUpdate& update)
{
    for (std::size_t i = 0; i < kBodyCount; ++i)
    {
        if (static_cast<BodyId>(i) == BodyId::Sun)
        {
            positions[i] = Vec3d{0.0};
            continue;
        }
        if (update.positions[i].has_value())
        {
            positions[i] = update.positions[i];
        }
    }

    last_update_utc = update.timestamp_utc;
    status = update.status;
}

PositionTable ViewState::initial_positions()
{
    PositionTable table{};
    table[index_of(BodyId::Sun)] = Vec3d{0.0};
    return table;
}

// -----------------------------------------------------------------
// SharedViewState
// -----------------------------------------------------------------

SharedViewState::SharedViewState(ViewState initial)
    : m_state(std::move(initial))
{
}

ViewState SharedViewState::snapshot() const
{
    std::lock_guard lock(m_mutex);
    return m_state;
}

void SharedViewState::apply(const PositionUpdate& update)
{
    std::lock_guard lock(m_mutex);
    m_state.merge(update);
}

} // namespace orrery::solar
