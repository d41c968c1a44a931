/**
 * @file LoggerTest.cpp
 * @brief Unit tests for Logger console routing and file rotation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <unistd.h>

class LoggerTest : public LogCaptureFixture {
protected:
    std::filesystem::path log_dir;

    void SetUp() override {
        LogCaptureFixture::SetUp();
        log_dir = std::filesystem::temp_directory_path() /
                  std::format("hdsentinel-mqtt-logs-{}", getpid());
    }

    void TearDown() override {
        LogCaptureFixture::TearDown();
        std::error_code ec;
        std::filesystem::remove_all(log_dir, ec);
    }
};

// Test: DEBUG goes to the debug stream, everything else to the info stream
TEST_F(LoggerTest, Log_RoutesDebugSeparately) {
    LOG_DEBUG("Test", "debug line");
    LOG_INFO("Test", "info line");
    LOG_WARNING("Test", "warning line");
    LOG_ERROR("Test", "error line");

    EXPECT_EQ(debug_output.str(), "[DEBUG] [Test] debug line\n");
    EXPECT_EQ(info_output.str(),
              "[INFO ] [Test] info line\n[WARN ] [Test] warning line\n[ERROR] [Test] error line\n");
}

TEST_F(LoggerTest, Log_DropsLinesBelowMinimumLevel) {
    util::Logger::instance().set_min_level(util::LogLevel::INFO);

    LOG_DEBUG("Test", "hidden");
    LOG_INFO("Test", "shown");

    EXPECT_TRUE(debug_output.str().empty());
    EXPECT_THAT(info_output.str(), testing::HasSubstr("shown"));
    EXPECT_EQ(util::Logger::instance().get_min_level(), util::LogLevel::INFO);
}

TEST_F(LoggerTest, EnableFileOutput_AppendsTimestampedLines) {
    ASSERT_TRUE(util::Logger::instance().enable_file_output(log_dir, "agent"));

    LOG_INFO("Test", "to file");
    util::Logger::instance().shutdown();

    std::ifstream file{log_dir / "agent.log"};
    std::string line;
    ASSERT_TRUE(std::getline(file, line));
    EXPECT_THAT(line, testing::EndsWith("Z [INFO ] [Test] to file"));
}

TEST_F(LoggerTest, EnableFileOutput_RotatesWhenFull) {
    ASSERT_TRUE(util::Logger::instance().enable_file_output(
        log_dir, "agent", util::LogRotationPolicy{.max_file_size_bytes = 64, .max_files = 2}));

    for (int i = 0; i < 10; ++i) {
        LOG_INFO("Test", std::format("line number {} with some padding", i));
    }
    util::Logger::instance().shutdown();

    EXPECT_TRUE(std::filesystem::exists(log_dir / "agent.log"));
    EXPECT_TRUE(std::filesystem::exists(log_dir / "agent.1.log"));
    EXPECT_TRUE(std::filesystem::exists(log_dir / "agent.2.log"));
    EXPECT_FALSE(std::filesystem::exists(log_dir / "agent.3.log"));
}
