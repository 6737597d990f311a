#pragma once

/// @file application.hpp
/// @brief Main application class: lifecycle, main loop, frame drawing.

#include "core/config.hpp"
#include "core/input.hpp"
#include "core/terminal.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_source.hpp"
#include "ephemeris/updater.hpp"
#include "solar/view_state.hpp"

#include <memory>

namespace orrery::core
{
    /// @brief Top-level application owning all subsystems.
    ///
    /// Lifecycle: construct → check ready() → run() → destruct.
    /// Owns the Terminal, Input, the shared view state, the ephemeris source
    /// and the background updater. The render loop only ever reads a snapshot
    /// of the shared state.
    class Application
    {
    public:
        /// @brief Initialize all subsystems against the live Horizons service.
        explicit Application(const AppConfig& config);

        /// @brief Initialize with a caller-supplied ephemeris source.
        Application(const AppConfig& config, std::unique_ptr<ephemeris::EphemerisSource> source);

        /// @brief Stop the updater, then restore the terminal.
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief False if the terminal could not be set up. run() must not be called then.
        [[nodiscard]] bool ready() const;

        /// @brief Enter the main loop. Returns when the user quits.
        void run();

        /// @brief Apply one control to a view. Quit is not a view change and returns false.
        static bool apply_control(solar::ViewState& view, ControlAction action);

    private:
        void init();
        void shutdown();
        void main_loop();

        /// @brief Translate this frame's keys into view changes.
        void process_input();

        /// @brief Draw header, vector table and map from one snapshot.
        void draw_frame();

        void draw_header(const Rect& panel, const solar::ViewState& view);
        void draw_table(const Rect& panel, const solar::ViewState& view);
        void draw_map(const Rect& panel, const solar::ViewState& view);

        AppConfig m_config;

        // -----------------------------------------------------------------
        // Subsystems (order matters: destroyed in reverse)
        // -----------------------------------------------------------------
        std::unique_ptr<Terminal> m_terminal;
        std::unique_ptr<Input> m_input;
        std::unique_ptr<solar::SharedViewState> m_state;
        std::unique_ptr<ephemeris::EphemerisSource> m_source;
        std::unique_ptr<ephemeris::EphemerisUpdater> m_updater;
    };

} // namespace orrery::core
