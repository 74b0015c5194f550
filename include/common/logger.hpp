#ifndef WZB_LOGGER_HPP
#define WZB_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

// Ordered by verbosity; messages below the configured minimum are dropped.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();

    // Opens (appends to) a log file. An empty filename closes the current sink.
    void init(const std::string& filename);
    void set_min_level(LogLevel level);
    void set_console(bool enabled);
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (!enabled(level)) {
            return;
        }
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    mutable std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_ = true;

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Replacement text for secrets in log lines.
constexpr const char* MASKED = "***masked***";

#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // WZB_LOGGER_HPP
