#include "metacache/util/logger.hpp"

#include <gtest/gtest.h>

namespace metacache::util::test {

TEST(LoggerTest, DefaultLevelIsInfo) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST(LoggerTest, SetLevel) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);

    // reset to default
    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, LogMethods) {
    // output goes to stdout/stderr, these only check nothing blows up
    Logger::instance().set_level(LogLevel::Debug);

    Logger::instance().debug("debug message");
    Logger::instance().info("info message");
    Logger::instance().warn("warn message");
    Logger::instance().error("error message");

    LOG_DEBUG("macro debug");
    LOG_INFO("macro info");
    LOG_WARN("macro warn");
    LOG_ERROR("macro error");

    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::Warn);

    testing::internal::CaptureStdout();
    Logger::instance().debug("filtered debug");
    Logger::instance().info("filtered info");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    testing::internal::CaptureStderr();
    Logger::instance().warn("visible warn");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[WARN ] visible warn"), std::string::npos);

    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, NoneSilencesEverything) {
    Logger::instance().set_level(LogLevel::None);

    testing::internal::CaptureStderr();
    Logger::instance().error("hidden");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");

    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("none"), LogLevel::None);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::Info);
}

}  // namespace metacache::util::test
