/// @file logger.cpp
/// @brief Core and app spdlog loggers over a shared console sink and rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string_view>
#include <vector>

namespace orrery::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{
    std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                const std::vector<spdlog::sink_ptr>& sinks,
                                                const LogConfig& config)
    {
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(config.level);
        logger->flush_on(config.flush_level);
        spdlog::register_logger(logger);
        return logger;
    }
}

spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback)
{
    const char* value = std::getenv("ORRERY_LOG_LEVEL");
    if (value == nullptr)
    {
        return fallback;
    }
    // from_str maps unknown names to "off"
    const auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && std::string_view{value} != "off")
    {
        return fallback;
    }
    return level;
}

void Logger::init(const LogConfig& config)
{
    // -----------------------------------------------------------------
    // Both loggers write to the same console and file
    // -----------------------------------------------------------------
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(config.pattern);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file_path, config.max_file_size, config.max_files);
    file_sink->set_pattern(config.pattern);
    file_sink->set_level(spdlog::level::trace);

    const std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

    s_core_logger = make_logger("ORRERY", sinks, config);
    s_app_logger = make_logger("APP", sinks, config);

    ORR_CORE_INFO("Logging to {} at level {}", config.file_path,
                  spdlog::level::to_string_view(config.level));
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
    if (!s_core_logger)
    {
        s_core_logger = spdlog::default_logger();
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    if (!s_app_logger)
    {
        s_app_logger = spdlog::default_logger();
    }
    return s_app_logger;
}

} // namespace orrery::core
