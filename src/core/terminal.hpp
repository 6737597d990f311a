#pragma once

/// @file terminal.hpp
/// @brief ncurses screen session: setup/teardown, key polling, colored drawing.

#include "core/types.hpp"
#include "rendering/cell_grid.hpp"
#include "rendering/color.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string_view>

struct screen;  // ncurses SCREEN

namespace orrery::core
{
    /// @brief Configuration for the curses session.
    struct TerminalConfig
    {
        std::chrono::milliseconds input_timeout{50};    ///< Upper bound on poll_key() blocking
        bool use_default_background = true;             ///< Keep the terminal's own background
    };

    /// @brief Key codes delivered by poll_key() that are not printable characters.
    namespace keys
    {
        constexpr i32 kEscape = 27;
    }

    /// @brief RAII wrapper around one ncurses screen on stdin/stdout.
    ///
    /// Owns the curses session lifetime. Resize events are consumed internally
    /// and reported through was_resized(); every other key is handed back to
    /// the caller. Non-copyable: exactly one terminal instance should exist.
    class Terminal
    {
    public:
        /// @brief Enter curses mode. Check ready() afterwards; failure is logged.
        explicit Terminal(const TerminalConfig& config = {});

        /// @brief Leave curses mode and restore the terminal.
        ~Terminal();

        Terminal(const Terminal&) = delete;
        Terminal& operator=(const Terminal&) = delete;
        Terminal(Terminal&&) = delete;
        Terminal& operator=(Terminal&&) = delete;

        /// @brief True if the screen was set up successfully.
        [[nodiscard]] bool ready() const { return m_screen != nullptr; }

        /// @brief Returns true if the session has been requested to close.
        [[nodiscard]] bool should_close() const;

        /// @brief Request the session to close (e.g., from the q key).
        void request_close();

        /// @brief Wait up to the configured timeout for one key.
        /// @return The key code, or std::nullopt on timeout or resize.
        [[nodiscard]] std::optional<i32> poll_key();

        [[nodiscard]] i32 get_width() const;
        [[nodiscard]] i32 get_height() const;

        /// @brief Returns true once after the terminal was resized, then resets.
        bool was_resized();

        // -----------------------------------------------------------------
        // Drawing
        // -----------------------------------------------------------------

        /// @brief Clear the back buffer for a new frame.
        void begin_frame();

        /// @brief Push the back buffer to the screen.
        void present();

        /// @brief Single-line border around @p area with @p title on the top edge.
        void draw_box(const Rect& area, std::string_view title);

        /// @brief Draw UTF-8 @p text at (row, col), clipped to @p max_columns and the screen.
        void draw_text(i32 row, i32 col, std::string_view text,
                       std::optional<rendering::Color> color = std::nullopt,
                       i32 max_columns = -1);

        /// @brief Draw one serialized grid row starting at (row, col).
        void draw_spans(i32 row, i32 col, const rendering::SpanRow& spans);

    private:
        struct ColorStyle
        {
            i16 pair = 0;
            bool bold = false;
            bool dim = false;
        };

        void init_colors();
        void set_style(std::optional<rendering::Color> color, bool enable);
        void refresh_size();

        TerminalConfig m_config;
        screen* m_screen = nullptr;
        std::array<ColorStyle, rendering::kColorCount> m_styles{};
        i32 m_width = 0;
        i32 m_height = 0;
        bool m_should_close = false;
        bool m_was_resized = false;
    };

} // namespace orrery::core
