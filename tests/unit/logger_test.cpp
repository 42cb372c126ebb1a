#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace modewarden::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_level = Logger::level();
        Logger::set_sink([this](Level level, const std::string &line) { lines.emplace_back(level, line); });
    }

    void TearDown() override {
        Logger::set_sink(nullptr);
        Logger::set_instance("");
        Logger::set_level(base_level);
    }

    Level base_level = Level::LVL_INFO;
    std::vector<std::pair<Level, std::string>> lines;
};

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);

    LOG_INFO("[Test] hidden");
    LOG_WARN("[Test] shown " << 42);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].first, Level::LVL_WARN);
    EXPECT_NE(lines[0].second.find("[WARN] [Test] shown 42"), std::string::npos);
}

TEST_F(LoggerTest, DebugLinesCarrySourceLocation) {
    Logger::set_level(Level::LVL_DEBUG);

    LOG_DEBUG("[Test] detail");
    LOG_INFO("[Test] summary");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].second.find("logger_test.cpp:"), std::string::npos);
    EXPECT_EQ(lines[1].second.find("logger_test.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, InstanceLabelIsIncluded) {
    Logger::set_level(Level::LVL_INFO);
    Logger::set_instance("bench-1");

    LOG_INFO("[Test] hello");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].second.find("(bench-1) [Test] hello"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);
    LOG_ERROR("[Test] dropped");
    EXPECT_TRUE(lines.empty());
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("WARN"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("Error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("bogus"), Level::LVL_INFO);
    EXPECT_STREQ(level_to_string(Level::LVL_INFO), "INFO");
}
