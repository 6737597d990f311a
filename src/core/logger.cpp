/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers over a rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace orrery::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same file (and console)
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file_path.string(), kMaxFileSize, kMaxFiles);
    file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] [t%t] %v");
    sinks.push_back(file_sink);

    if (config.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("ORRERY")
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("ORRERY", sinks.begin(), sinks.end());
    s_core_logger->set_level(spdlog::level::debug);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP")
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(spdlog::level::info);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    if (s_core_logger)
    {
        s_core_logger->flush();
    }
    if (s_app_logger)
    {
        s_app_logger->flush();
    }

    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace orrery::core
