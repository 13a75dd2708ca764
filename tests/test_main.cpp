#include <gtest/gtest.h>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; errors still reach the log file if one is open.
    setLogConsoleEcho(false);
    ErrorManager::loadFromJson(bootstrap_config::defaultErrors());

    return RUN_ALL_TESTS();
}
