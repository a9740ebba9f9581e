/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers over a rotating file sink
/// and an optional stderr sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace cadence::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const LogConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same file (and stderr)
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file_path, kMaxFileSize, kMaxFiles);
    file_sink->set_pattern("[%T.%e] [%n] [%l] %v");
    sinks.push_back(file_sink);

    // stdout belongs to the frame stream, so the console mirror goes to stderr
    if (config.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("CADENCE"): canvas, encoder, terminal
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("CADENCE", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): scenes, audio, command line
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
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

} // namespace cadence::core
