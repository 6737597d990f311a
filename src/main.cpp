// src/main.cpp - Orrery entry point
//
//  1. Parse the command line
//  2. Start logging and libcurl
//  3. Run the curses application until the user quits

#include "core/application.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "ephemeris/horizons_client.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>

int main(int argc, char* argv[])
{
    using namespace orrery;

    const core::AppConfig config = core::parse_args(argc, argv);
    if (config.show_help)
    {
        core::print_help(argv[0]);
        return 0;
    }

    for (const auto& arg : config.unknown_args)
    {
        fmt::print(stderr, "orrery: ignoring unknown argument '{}'\n", arg);
    }

    try
    {
        core::Logger::init(core::LoggerConfig{.file_path = config.log_path, .console = false});
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        fmt::print(stderr, "orrery: cannot open log file {}: {}\n", config.log_path.string(), ex.what());
        return 1;
    }
    ORR_INFO("Orrery v0.5 starting");

    int exit_code = 0;
    {
        ephemeris::CurlGlobal curl;
        if (!curl.ok())
        {
            ORR_WARN("libcurl failed to initialize; every fetch will report an error");
        }

        core::Application app(config);
        if (app.ready())
        {
            app.run();
        }
        else
        {
            exit_code = 1;
        }
    }

    // Terminal is restored by now, so stderr is visible again
    if (exit_code != 0)
    {
        fmt::print(stderr, "orrery: could not initialize the terminal (see {})\n",
                   config.log_path.string());
    }

    ORR_INFO("Orrery exiting with code {}", exit_code);
    core::Logger::shutdown();
    return exit_code;
}
