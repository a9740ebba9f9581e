#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cadence::core
{
    /// @brief Sink and level selection for Logger::init().
    /// Use designated initializers: Logger::init({.file_path = "run.log", .console = true});
    struct LogConfig
    {
        std::string file_path = "cadence.log";
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = false;   ///< Mirror output to stderr (off while the animation owns the tty)
    };

    /// @brief Centralized logging facility for Cadence.
    ///
    /// Provides two separate loggers:
    /// - **CADENCE** (core): canvas, layers, frame encoding, terminal
    /// - **APP**: scenes, audio, command line, user-facing messages
    ///
    /// Both write to a rotating log file and optionally to stderr.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with the configured sinks.
        /// Must be called once at startup before any CDN_ macros are used.
        static void init(const LogConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("CADENCE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace cadence::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CDN_CORE_TRACE(...)    ::cadence::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define CDN_CORE_DEBUG(...)    ::cadence::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define CDN_CORE_INFO(...)     ::cadence::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define CDN_CORE_WARN(...)     ::cadence::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define CDN_CORE_ERROR(...)    ::cadence::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define CDN_CORE_CRITICAL(...) ::cadence::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define CDN_TRACE(...)         ::cadence::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define CDN_DEBUG(...)         ::cadence::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define CDN_INFO(...)          ::cadence::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define CDN_WARN(...)          ::cadence::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define CDN_ERROR(...)         ::cadence::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define CDN_CRITICAL(...)      ::cadence::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
