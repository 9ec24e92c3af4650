/**
 * @file main.cpp
 * @brief GoogleTest entry for sandglass_tests; engine log lines go to ./sandglass_tests.log.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    Logger::init("sandglass_tests.log");
    Logger::setLevel(Logger::Level::Debug);

    int rc = RUN_ALL_TESTS();
    Logger::shutdown();
    return rc;
}
