#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace orrery::core
{
    /// @brief Sink and level settings for Logger::init().
    struct LogConfig
    {
        std::string file_path = "orrery.log";
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
        spdlog::level::level_enum level = spdlog::level::info;
        spdlog::level::level_enum flush_level = spdlog::level::warn;
        std::string pattern = "[%T.%e] [%n] [%^%l%$] %v";
    };

    /// @brief Level named by the ORRERY_LOG_LEVEL environment variable
    ///        ("trace", "debug", "info", ...), or @p fallback if unset or unknown.
    [[nodiscard]] spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback);

    /// @brief Centralized logging facility for Orrery.
    ///
    /// Provides two separate loggers:
    /// - **ORRERY** (core): simulation engine, render caches, Vulkan, window
    /// - **APP**: user-facing events (selection, pause, reset, time scale)
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Until then the
    /// accessors hand out spdlog's default logger, so the core library can
    /// be driven from tests without any setup.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init(const LogConfig& config = {});

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
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ORR_CORE_TRACE(...)    ::orrery::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ORR_CORE_INFO(...)     ::orrery::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ORR_CORE_WARN(...)     ::orrery::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ORR_CORE_ERROR(...)    ::orrery::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ORR_CORE_CRITICAL(...) ::orrery::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ORR_TRACE(...)         ::orrery::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ORR_INFO(...)          ::orrery::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ORR_WARN(...)          ::orrery::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ORR_ERROR(...)         ::orrery::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ORR_CRITICAL(...)      ::orrery::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
