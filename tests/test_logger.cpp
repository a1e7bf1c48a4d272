#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "logger.h"

using namespace bridgelink;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::getInstance();
        saved_level_ = logger.get_log_level();
        logger.set_colors_enabled(false);
        logger.set_timestamps_enabled(false);
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.set_log_level(saved_level_);
        logger.set_colors_enabled(true);
        logger.set_timestamps_enabled(true);
    }

    LogLevel saved_level_;
};

TEST_F(LoggerTest, ParseLogLevelAcceptsKnownNames) {
    LogLevel level = LogLevel::ERROR;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("INFO", level));
    EXPECT_EQ(level, LogLevel::INFO);
    EXPECT_TRUE(parse_log_level("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, ParseLogLevelLeavesLevelOnUnknownName) {
    LogLevel level = LogLevel::WARN;
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_FALSE(parse_log_level("", level));
    EXPECT_EQ(level, LogLevel::WARN);
}

TEST_F(LoggerTest, MinimumLevelFiltersMessages) {
    Logger::getInstance().set_log_level(LogLevel::WARN);
    EXPECT_FALSE(Logger::getInstance().is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::getInstance().is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::getInstance().is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::getInstance().is_enabled(LogLevel::ERROR));

    ::testing::internal::CaptureStdout();
    LOG_INFO("test", "hidden message");
    LOG_WARN("test", "visible " << 42);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_THAT(output, Not(HasSubstr("hidden message")));
    EXPECT_THAT(output, HasSubstr("[WARN ] [test] visible 42"));
}

TEST_F(LoggerTest, ErrorsGoToStderr) {
    Logger::getInstance().set_log_level(LogLevel::DEBUG);

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    LOG_ERROR("pairing", "connect failed");
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_THAT(out, Not(HasSubstr("connect failed")));
    EXPECT_THAT(err, HasSubstr("[ERROR] [pairing] connect failed"));
}

TEST_F(LoggerTest, DebugMessageIsNotEvaluatedWhenDisabled) {
    Logger::getInstance().set_log_level(LogLevel::INFO);

    int evaluations = 0;
    auto counted = [&evaluations]() {
        ++evaluations;
        return "x";
    };
    ::testing::internal::CaptureStdout();
    LOG_DEBUG("test", counted());
    ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(evaluations, 0);
}
