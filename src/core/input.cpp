/// @file input.cpp
/// @brief Keyboard state tracker implementation.

#include "core/input.hpp"

#include "core/terminal.hpp"

#include <algorithm>

namespace orrery::core
{

std::string_view to_string(ControlAction action)
{
    switch (action)
    {
        case ControlAction::ZoomIn:    return "zoom in";
        case ControlAction::ZoomOut:   return "zoom out";
        case ControlAction::ResetView: return "reset view";
        case ControlAction::FocusIn:   return "focus in";
        case ControlAction::FocusOut:  return "focus out";
        case ControlAction::Quit:      return "quit";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// new_frame — reset per-frame keys
// -----------------------------------------------------------------

void Input::new_frame()
{
    m_keys_pressed.clear();
}

void Input::process_key(i32 key)
{
    m_keys_pressed.push_back(key);
}

bool Input::is_key_pressed(i32 key) const
{
    return std::ranges::find(m_keys_pressed, key) != m_keys_pressed.end();
}

// -----------------------------------------------------------------
// Key bindings
// -----------------------------------------------------------------

std::optional<ControlAction> Input::action_for_key(i32 key)
{
    switch (key)
    {
        case '+':
        case '=':
            return ControlAction::ZoomIn;
        case '-':
            return ControlAction::ZoomOut;
        case '0':
            return ControlAction::ResetView;
        case '[':
            return ControlAction::FocusIn;
        case ']':
            return ControlAction::FocusOut;
        case 'q':
        case keys::kEscape:
            return ControlAction::Quit;
        default:
            return std::nullopt;
    }
}

std::vector<ControlAction> Input::actions() const
{
    std::vector<ControlAction> result;
    result.reserve(m_keys_pressed.size());
    for (const i32 key : m_keys_pressed)
    {
        if (auto action = action_for_key(key))
        {
            result.push_back(*action);
        }
    }
    return result;
}

} // namespace orrery::core
