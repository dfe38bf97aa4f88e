#ifndef FRAGXFER_LOGGER_HPP
#define FRAGXFER_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <atomic>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    void init(const std::string& filename);
    void set_level(LogLevel level);
    LogLevel level() const;
    void log(LogLevel level, const std::string& message);

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (level < level_.load()) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

    // Parses "debug", "info", "warn"/"warning", "error". Throws std::invalid_argument otherwise.
    static LogLevel parse_level(const std::string& name);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) ::Logger::instance().log_args(::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) ::Logger::instance().log_args(::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  ::Logger::instance().log_args(::LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) ::Logger::instance().log_args(::LogLevel::DEBUG, __VA_ARGS__)

#endif // FRAGXFER_LOGGER_HPP
