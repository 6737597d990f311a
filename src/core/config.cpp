/// @file config.cpp
/// @brief Command-line parsing.

#include "core/config.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <cstring>

namespace orrery::core
{

namespace
{

i32 clamp_int(i32 value, i32 min_value, i32 max_value, i32 default_value)
{
    if (value < min_value || value > max_value)
    {
        return default_value;
    }
    return value;
}

} // anonymous namespace

ephemeris::HorizonsConfig AppConfig::horizons_config() const
{
    ephemeris::HorizonsConfig config;
    config.user_agent = user_agent;
    config.timeout = http_timeout;
    return config;
}

ephemeris::UpdaterConfig AppConfig::updater_config() const
{
    ephemeris::UpdaterConfig config;
    config.request_delay = request_delay;
    config.cycle_interval = std::chrono::duration_cast<std::chrono::milliseconds>(refresh_interval);
    return config;
}

TerminalConfig AppConfig::terminal_config() const
{
    return TerminalConfig{};
}

AppConfig parse_args(int argc, const char* const argv[])
{
    AppConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
        {
            config.show_help = true;
            return config;
        }

        if (std::strcmp(arg, "--unicode") == 0)
        {
            config.icon_style = solar::IconStyle::Unicode;
        }
        else if (std::strcmp(arg, "--refresh") == 0)
        {
            if (i + 1 < argc)
            {
                const i32 seconds = clamp_int(std::atoi(argv[++i]),
                                              AppConfig::kMinRefreshSeconds,
                                              AppConfig::kMaxRefreshSeconds,
                                              AppConfig::kDefaultRefreshSeconds);
                config.refresh_interval = std::chrono::seconds{seconds};
            }
        }
        else if (std::strcmp(arg, "--log") == 0)
        {
            if (i + 1 < argc && argv[i + 1][0] != '\0')
            {
                config.log_path = argv[++i];
            }
        }
        else
        {
            config.unknown_args.emplace_back(arg);
        }
    }

    return config;
}

void print_help(const char* prog)
{
    fmt::print("Usage: {} [OPTIONS]\n\n", prog);
    fmt::print("Live heliocentric map of the Sun and the eight planets (JPL Horizons).\n\n");
    fmt::print("OPTIONS:\n");
    fmt::print("      --unicode           Use standard astronomical symbols instead of Nerd Font icons\n");
    fmt::print("      --refresh <N>       Seconds between refresh cycles (default: {}, range: {}-{})\n",
               AppConfig::kDefaultRefreshSeconds, AppConfig::kMinRefreshSeconds,
               AppConfig::kMaxRefreshSeconds);
    fmt::print("      --log <FILE>        Log file (default: orrery.log)\n");
    fmt::print("  -h, --help              Show this help\n");
    fmt::print("\nINTERACTIVE CONTROLS:\n");
    fmt::print("  +/=                     Zoom in\n");
    fmt::print("  -                       Zoom out\n");
    fmt::print("  0                       Reset zoom and focus\n");
    fmt::print("  [ / ]                   Focus on a smaller / larger orbit\n");
    fmt::print("  q/Esc                   Quit\n");
}

} // namespace orrery::core
