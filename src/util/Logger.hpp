/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with console routing and optional file rotation
 *
 * Console output is split by severity: DEBUG lines go to stderr, everything
 * else goes to stdout, so a supervisor can keep the two streams apart.
 * When a log directory is configured, every line is also appended to a
 * size-rotated log file with an ISO 8601 timestamp.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information
    INFO,     ///< General operational information
    WARNING,  ///< Warning conditions
    ERROR     ///< Error conditions
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Max size before rotation (10MB default)
    int max_files = 7;                               ///< Number of rotated files to keep
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.set_min_level(util::LogLevel::DEBUG);
 * log.enable_file_output("/var/log/hdsentinel-mqtt", "hdsentinel-mqtt");
 * LOG_INFO("PublishLoop", std::format("Publishing {} sensors for {}", n, alias));
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to the global logger
     */
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Start appending to {log_dir}/{app_name}.log
     * @param log_dir Directory for log files (created if it doesn't exist)
     * @param app_name Application name used in log filename
     * @param policy Rotation policy (default: 10MB, 7 files)
     * @return true if the file sink is ready
     */
    auto enable_file_output(const std::filesystem::path& log_dir, const std::string& app_name,
                            LogRotationPolicy policy = {}) -> bool;

    /**
     * @brief Log a message with specified level and component
     * @param level Log level
     * @param component Component/module name (e.g., "PublishLoop")
     * @param message Log message
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Redirect console output (tests capture lines this way)
     * @param info_stream Receives INFO, WARNING and ERROR lines
     * @param debug_stream Receives DEBUG lines
     */
    void set_console_streams(std::ostream& info_stream, std::ostream& debug_stream);

    /**
     * @brief Flush and close the file sink, restore console defaults
     */
    void shutdown();

private:
    Logger();
    ~Logger();

    [[nodiscard]] static auto get_timestamp() -> std::string;
    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    void rotate_logs();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool file_output_ = false;
    std::ostream* info_stream_;
    std::ostream* debug_stream_;
    size_t current_file_size_ = 0;
};

// Convenience macros for component-based logging
#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
