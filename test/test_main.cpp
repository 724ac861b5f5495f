#include <gtest/gtest.h>

#include <cstdlib>

#include "util/Logger.hpp"

/**
 * @brief Main entry point for gitsync unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./gitsync_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep test output readable unless GITSYNC_LOG asks for more
    if (std::getenv("GITSYNC_LOG") == nullptr) {
        gitsync::Logger::instance().setLevel(gitsync::LogLevel::Error);
    }
    return RUN_ALL_TESTS();
}
