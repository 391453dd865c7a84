#include "querylab/logger.h"
#include "querylab/utils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace querylab {

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_upper(trim(name));
    if (n == "DEBUG") return LogLevel::DEBUG;
    if (n == "WARN" || n == "WARNING") return LogLevel::WARN;
    if (n == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

Logger::Logger(LogLevel level, const std::string& filename, bool console)
    : level_(level), console_output_(console) {
    if (!filename.empty()) {
        log_file_.open(filename, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "Cannot open log file " << filename << ", logging to console only" << std::endl;
            console_output_ = true;
        }
    }
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << levelToString(level) << "] " << message << '\n';

    // Console lines go to stderr so they never interleave with result tables.
    if (console_output_) {
        std::cerr << oss.str();
    }
    if (log_file_.is_open()) {
        log_file_ << oss.str();
        log_file_.flush();
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

} // namespace querylab
