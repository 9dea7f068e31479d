/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace fluxconv::core
{

// ---- Static member definitions ----
// Sink-less until init(): messages are dropped instead of dereferencing null.
std::shared_ptr<spdlog::logger> Logger::s_core_logger = std::make_shared<spdlog::logger>("FLUXCONV");
std::shared_ptr<spdlog::logger> Logger::s_app_logger = std::make_shared<spdlog::logger>("APP");

void Logger::init(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.log_file.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size, config.max_files);
        file_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(file_sink);
    }

    // Re-init replaces previously registered loggers
    spdlog::drop("FLUXCONV");
    spdlog::drop("APP");

    // -----------------------------------------------------------------
    // Core logger ("FLUXCONV"): library internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("FLUXCONV", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): demo and user-facing
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);

    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=FLUXCONV=trace,APP=info
    spdlog::cfg::load_env_levels();
}

void Logger::shutdown()
{
    s_core_logger = std::make_shared<spdlog::logger>("FLUXCONV");
    s_app_logger = std::make_shared<spdlog::logger>("APP");
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

} // namespace fluxconv::core
