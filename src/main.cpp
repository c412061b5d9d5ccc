/// @file main.cpp
/// @brief Orrery entry point: logging setup, application run, shutdown.

#include "core/application.hpp"
#include "core/logger.hpp"

#include <exception>

int main(int /*argc*/, char* /*argv*/[])
{
    orrery::core::Logger::init(orrery::core::LogConfig{
        .level = orrery::core::level_from_env(spdlog::level::info),
    });
    ORR_CORE_INFO("Orrery starting");

    int exit_code = 0;
    try
    {
        orrery::core::Application app;
        app.run();
    }
    catch (const std::exception& e)
    {
        ORR_CORE_CRITICAL("Unhandled exception: {}", e.what());
        exit_code = 1;
    }

    ORR_CORE_INFO("Orrery shut down");
    orrery::core::Logger::shutdown();
    return exit_code;
}
