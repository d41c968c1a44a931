/**
 * @file Error.hpp
 * @brief Error value used with std::expected throughout the agent
 */

#pragma once

#include <string>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Broad category of an error, used to pick the recovery policy
 */
enum class ErrorKind {
    GENERIC,        ///< Uncategorised failure
    CONFIGURATION,  ///< Missing/invalid setting or unreadable template store (fatal at startup)
    SNAPSHOT,       ///< Diagnostic source unavailable or output malformed (cycle skipped)
    TRANSPORT       ///< Broker connection or publish failure (disk skipped)
};

/**
 * @struct Error
 * @brief Represents an error with a message, a category and optional code
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::GENERIC;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}
};

}  // namespace util
