#pragma once

/// @file config.hpp
/// @brief Application configuration and command-line parsing.

#include "core/terminal.hpp"
#include "core/types.hpp"
#include "ephemeris/horizons_client.hpp"
#include "ephemeris/updater.hpp"
#include "solar/body_catalog.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace orrery::core
{
    /// @brief Everything main() needs to wire the application together.
    /// Use designated initializers in tests: AppConfig{.icon_style = IconStyle::Unicode}.
    struct AppConfig
    {
        static constexpr i32 kMinRefreshSeconds = 1;
        static constexpr i32 kMaxRefreshSeconds = 3600;
        static constexpr i32 kDefaultRefreshSeconds = 5;

        solar::IconStyle icon_style = solar::IconStyle::NerdFont;
        std::chrono::seconds refresh_interval{kDefaultRefreshSeconds};
        std::chrono::milliseconds request_delay{120};
        std::filesystem::path log_path = "orrery.log";
        std::string user_agent = "orrery/0.5 (curses)";
        std::chrono::seconds http_timeout{20};

        bool show_help = false;
        std::vector<std::string> unknown_args;      ///< Reported by main(), otherwise ignored

        [[nodiscard]] ephemeris::HorizonsConfig horizons_config() const;
        [[nodiscard]] ephemeris::UpdaterConfig updater_config() const;
        [[nodiscard]] TerminalConfig terminal_config() const;
    };

    /// @brief Parse argv. Out-of-range or missing values keep their defaults.
    [[nodiscard]] AppConfig parse_args(int argc, const char* const argv[]);

    /// @brief Print usage to stdout.
    void print_help(const char* prog);

} // namespace orrery::core
