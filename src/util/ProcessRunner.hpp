/**
 * @file ProcessRunner.hpp
 * @brief Run an external program and capture its standard output
 */

#pragma once

#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace util {

/**
 * @struct ProcessOutput
 * @brief Result of a finished child process
 */
struct ProcessOutput {
    int exit_code = -1;        ///< Exit status, -1 if terminated by a signal
    std::string stdout_text;   ///< Everything the child wrote to stdout
};

/**
 * @brief Spawn @p argv, collect stdout and wait for the child to exit
 * @param argv Program path followed by its arguments
 * @param timeout Child is killed with SIGKILL once this elapses
 * @return Output and exit status, or an error if spawning failed or timed out
 *
 * stderr is discarded. A non-zero exit status is not an error here; the
 * caller decides what it means.
 */
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout)
    -> std::expected<ProcessOutput, Error>;

}  // namespace util
