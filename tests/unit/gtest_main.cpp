#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ib::config::Config cfg;
        cfg.logging.log_dir = fs::temp_directory_path() / "inkbridge-tests" / "log";
        cfg.logging.console_log_level = spdlog::level::warn;
        cfg.logging.subsystem_levels.epub = spdlog::level::debug;

        ib::config::ConfigRegistry::init(cfg);
        ib::log::Registry::init(ib::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize inkbridge test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
