/**
 * @file test_logger.cpp
 * @brief Unit tests for log routing and thresholds
 */

#include <gtest/gtest.h>
#include <utils/logger.hpp>

using namespace RdfPg;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::level(); }
    void TearDown() override { Logger::set_level(saved_); }

    Logger::Level saved_ = Logger::Level::Info;
};

} // namespace

// rdfpg_admin writes dump data to stdout, so diagnostics must stay off it
TEST_F(LoggerTest, MessagesGoToStderrOnly) {
    Logger::set_level(Logger::Level::Debug);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::warn("partition scan slow");
    Logger::error("statement failed");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("partition scan slow"), std::string::npos);
    EXPECT_NE(err.find("statement failed"), std::string::npos);
}

TEST_F(LoggerTest, BelowThresholdIsDropped) {
    Logger::set_level(Logger::Level::Warning);

    testing::internal::CaptureStderr();
    Logger::debug("hidden debug");
    Logger::info("hidden info");
    Logger::warn("shown");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.find("hidden"), std::string::npos);
    EXPECT_NE(err.find("shown"), std::string::npos);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
}
