#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleMock(&argc, argv);

    // Orchestrator scenarios log heavily; keep test output to warnings
    modewarden::logging::Logger::set_level(modewarden::logging::Level::LVL_WARN);
    return RUN_ALL_TESTS();
}
