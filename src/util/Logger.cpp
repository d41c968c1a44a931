/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

Logger::Logger() : info_stream_(&std::cout), debug_stream_(&std::cerr) {}

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::enable_file_output(const std::filesystem::path& log_dir, const std::string& app_name,
                                LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    file_output_ = false;

    log_dir_ = log_dir;
    app_name_ = app_name;
    policy_ = policy;
    current_file_size_ = 0;

    std::error_code ec;
    if (!std::filesystem::exists(log_dir_, ec)) {
        if (!std::filesystem::create_directories(log_dir_, ec)) {
            std::cerr << "Logger: Failed to create log directory: " << log_dir_ << " - "
                      << ec.message() << std::endl;
            return false;
        }
    }

    if (!open_log_file()) {
        return false;
    }

    file_output_ = true;
    return true;
}

auto Logger::open_log_file() -> bool {
    auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: Failed to open log file: " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }

    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const auto line = std::format("[{}] [{}] {}\n", level_to_string(level), component, message);

    auto& stream = level == LogLevel::DEBUG ? *debug_stream_ : *info_stream_;
    stream << line;
    stream.flush();

    if (file_output_ && file_.is_open()) {
        if (current_file_size_ >= policy_.max_file_size_bytes) {
            rotate_logs();
        }
        const auto file_line = get_timestamp() + line;
        file_ << file_line;
        file_.flush();
        current_file_size_ += file_line.size();
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_streams(std::ostream& info_stream, std::ostream& debug_stream) {
    std::lock_guard lock(mutex_);
    info_stream_ = &info_stream;
    debug_stream_ = &debug_stream;
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    file_output_ = false;
    info_stream_ = &std::cout;
    debug_stream_ = &std::cerr;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << "Z ";

    return oss.str();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_logs() {
    if (file_.is_open()) {
        file_.close();
    }

    auto base_path = log_dir_ / (app_name_ + ".log");
    std::error_code ec;

    // Shift existing rotated files (n-1 -> n, ...); the oldest is overwritten
    std::filesystem::remove(log_dir_ / std::format("{}.{}.log", app_name_, policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        auto old_path = log_dir_ / std::format("{}.{}.log", app_name_, i);
        if (std::filesystem::exists(old_path, ec)) {
            std::filesystem::rename(old_path, log_dir_ / std::format("{}.{}.log", app_name_, i + 1),
                                    ec);
        }
    }
    std::filesystem::rename(base_path, log_dir_ / std::format("{}.1.log", app_name_), ec);

    if (!open_log_file()) {
        file_output_ = false;
    }
}

}  // namespace util
