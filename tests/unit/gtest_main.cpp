#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <paths.h>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        sw::paths::setPathsForTesting();
        std::filesystem::create_directories(sw::paths::getLogPath());
        std::filesystem::create_directories(sw::paths::getDataPath());
        std::filesystem::create_directories(sw::paths::getServicesPath());

        sw::config::Config cfg;
        cfg.paths.log_dir = sw::paths::getLogPath();
        cfg.paths.data_dir = sw::paths::getDataPath();
        cfg.paths.services_dir = sw::paths::getServicesPath();
        cfg.logging.levels.console_log_level = spdlog::level::off;
        cfg.logging.levels.file_log_level = spdlog::level::debug;

        sw::config::ConfigRegistry::init(cfg);
        sw::logging::LogRegistry::init(sw::paths::getLogPath());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize servicewarden test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();

    std::error_code ec;
    std::filesystem::remove_all(sw::paths::getDataPath().parent_path(), ec);
    return rc;
}
