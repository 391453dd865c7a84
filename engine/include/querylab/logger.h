#pragma once
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace querylab {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

// "debug", "INFO", "warning", ... -> level; unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
private:
    LogLevel level_;
    std::ofstream log_file_;
    std::mutex mutex_;
    bool console_output_;

    std::string levelToString(LogLevel level) const;

public:
    Logger(LogLevel level = LogLevel::INFO, const std::string& filename = "", bool console = true);
    ~Logger();

    void setLevel(LogLevel level);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
};

} // namespace querylab
