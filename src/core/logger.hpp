#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace orrery::core
{
    /// @brief Sink selection for Logger::init().
    struct LoggerConfig
    {
        std::filesystem::path file_path = "orrery.log";
        bool console = false;   ///< Must stay off while curses owns the screen
    };

    /// @brief Centralized logging facility for Orrery.
    ///
    /// Provides two separate loggers:
    /// - **ORRERY** (core): terminal session, ephemeris client, updater thread
    /// - **APP**: user-facing actions (zoom, focus, startup, shutdown)
    ///
    /// Both write to a rotating log file, and optionally to colored console output.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with a file sink (plus console if requested).
        /// Must be called once at startup before any ORR_ macros are used.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("ORRERY").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace orrery::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ORR_CORE_TRACE(...)    ::orrery::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ORR_CORE_DEBUG(...)    ::orrery::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ORR_CORE_INFO(...)     ::orrery::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ORR_CORE_WARN(...)     ::orrery::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ORR_CORE_ERROR(...)    ::orrery::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ORR_CORE_CRITICAL(...) ::orrery::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ORR_TRACE(...)         ::orrery::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ORR_DEBUG(...)         ::orrery::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define ORR_INFO(...)          ::orrery::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ORR_WARN(...)          ::orrery::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ORR_ERROR(...)         ::orrery::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ORR_CRITICAL(...)      ::orrery::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
