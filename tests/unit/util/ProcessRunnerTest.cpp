/**
 * @file ProcessRunnerTest.cpp
 * @brief Unit tests for the child process runner
 */

#include <gtest/gtest.h>

#include "util/ProcessRunner.hpp"

using namespace std::chrono_literals;

TEST(ProcessRunnerTest, RunProcess_CapturesStdout) {
    auto output = util::run_process({"/bin/echo", "HDD Serial No : ABC"}, 5s);

    ASSERT_TRUE(output.has_value()) << output.error().message;
    EXPECT_EQ(output->exit_code, 0);
    EXPECT_EQ(output->stdout_text, "HDD Serial No : ABC\n");
}

TEST(ProcessRunnerTest, RunProcess_ReportsNonZeroExit) {
    auto output = util::run_process({"/bin/sh", "-c", "exit 3"}, 5s);

    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(output->exit_code, 3);
}

TEST(ProcessRunnerTest, RunProcess_MissingBinaryIsError) {
    auto output = util::run_process({"/nonexistent/hdsentinel"}, 5s);

    EXPECT_FALSE(output.has_value());
}

TEST(ProcessRunnerTest, RunProcess_EmptyCommandIsError) {
    EXPECT_FALSE(util::run_process({}, 5s).has_value());
}

TEST(ProcessRunnerTest, RunProcess_KillsChildOnTimeout) {
    const auto start = std::chrono::steady_clock::now();

    auto output = util::run_process({"/bin/sleep", "10"}, 200ms);

    EXPECT_FALSE(output.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s) << "Child should be killed promptly";
}
