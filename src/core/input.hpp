#pragma once

/// @file input.hpp
/// @brief Per-frame keyboard state tracker: key codes in, control actions out.
///
/// Input only tracks state. It does NOT modify the view or any other system.
/// The Application loop reads Input state and translates it to ViewState changes.

#include "core/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace orrery::core
{
    /// @brief Everything a key press can ask for.
    enum class ControlAction : u8
    {
        ZoomIn,
        ZoomOut,
        ResetView,
        FocusIn,
        FocusOut,
        Quit,
    };

    [[nodiscard]] std::string_view to_string(ControlAction action);

    /// @brief Tracks key presses received during the current frame.
    ///
    /// Usage pattern each frame:
    ///   1. Call new_frame() to drop last frame's keys
    ///   2. For each key from Terminal::poll_key(), call process_key()
    ///   3. Read actions() and apply them in order
    class Input
    {
    public:
        Input() = default;
        ~Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        /// @brief Record one key code. Call for each key polled this frame.
        void process_key(i32 key);

        /// @brief Reset per-frame state. Call at the start of each frame.
        void new_frame();

        /// @brief True if @p key was received THIS frame.
        [[nodiscard]] bool is_key_pressed(i32 key) const;

        /// @brief Actions for this frame's keys, in arrival order. Unbound keys are skipped.
        [[nodiscard]] std::vector<ControlAction> actions() const;

        /// @brief Key binding lookup.
        [[nodiscard]] static std::optional<ControlAction> action_for_key(i32 key);

    private:
        std::vector<i32> m_keys_pressed;    ///< This frame only, arrival order
    };

} // namespace orrery::core
