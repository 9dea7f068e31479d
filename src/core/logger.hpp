#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace fluxconv::core
{
    /// @brief Configuration for Logger::init().
    /// Use designated initializers: Logger::init({.level = spdlog::level::info});
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::trace;
        std::string log_file = "fluxconv.log";   ///< Empty disables the file sink
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
        bool console = true;
    };

    /// @brief Centralized logging facility for FluxConv.
    ///
    /// Provides two separate loggers:
    /// - **FLUXCONV** (core): unit conversions, spectral models, registry
    /// - **APP**: demo program and user-facing messages
    ///
    /// Before init() both loggers exist but have no sinks, so library code
    /// can log unconditionally. SPDLOG_LEVEL in the environment overrides
    /// the configured level after init().
    class Logger
    {
    public:
        /// @brief Attach console and/or rotating file sinks to both loggers.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library-internal logger ("FLUXCONV").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace fluxconv::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define FCV_CORE_TRACE(...)    ::fluxconv::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define FCV_CORE_DEBUG(...)    ::fluxconv::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define FCV_CORE_INFO(...)     ::fluxconv::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define FCV_CORE_WARN(...)     ::fluxconv::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define FCV_CORE_ERROR(...)    ::fluxconv::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define FCV_CORE_CRITICAL(...) ::fluxconv::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define FCV_TRACE(...)         ::fluxconv::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define FCV_DEBUG(...)         ::fluxconv::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define FCV_INFO(...)          ::fluxconv::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define FCV_WARN(...)          ::fluxconv::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define FCV_ERROR(...)         ::fluxconv::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define FCV_CRITICAL(...)      ::fluxconv::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
