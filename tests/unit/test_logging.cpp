#include <gtest/gtest.h>
#include "utils/logging.hpp"

using namespace affectrt::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = Logger::getLevel();
    }

    void TearDown() override {
        Logger::setLevel(saved_);
    }

    LogLevel saved_ = LogLevel::INFO;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelFromString("off"), LogLevel::OFF);
    EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
}

TEST_F(LoggerTest, PrefixesAndRoutesByLevel) {
    Logger::setLevel(LogLevel::DEBUG);

    ::testing::internal::CaptureStdout();
    Logger::info("session opened");
    Logger::debug("scored turn");
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("[INFO] session opened\n"), std::string::npos);
    EXPECT_NE(out.find("[DEBUG] scored turn\n"), std::string::npos);

    ::testing::internal::CaptureStderr();
    Logger::error("stage failed");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[ERROR] stage failed\n");
}

TEST_F(LoggerTest, MinimumLevelFiltersOutput) {
    Logger::setLevel(LogLevel::WARN);

    ::testing::internal::CaptureStdout();
    Logger::info("hidden");
    Logger::debug("hidden");
    Logger::warn("drift detected");
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[WARN] drift detected\n");

    Logger::setLevel(LogLevel::OFF);
    ::testing::internal::CaptureStderr();
    Logger::error("silenced");
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}
