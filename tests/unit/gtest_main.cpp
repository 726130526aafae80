#include <gtest/gtest.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        rcs::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::off;
        rcs::config::ConfigRegistry::init(cfg);
        rcs::log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize rcsync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
