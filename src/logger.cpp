#include "demo-microservice/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace demo {

Result<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") {
        return Result<LogLevel>::ok(LogLevel::Debug);
    }
    if (name == "info") {
        return Result<LogLevel>::ok(LogLevel::Info);
    }
    if (name == "warn") {
        return Result<LogLevel>::ok(LogLevel::Warn);
    }
    if (name == "error") {
        return Result<LogLevel>::ok(LogLevel::Error);
    }
    return Result<LogLevel>::error(ErrorCode::InvalidArgument,
                                   "Unknown log level: " + std::string(name));
}

Logger::Logger(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void Logger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::level() const {
    return min_level_;
}

bool Logger::enabled(LogLevel level) const {
    return level >= min_level_;
}

void Logger::debug(std::string_view msg) {
    log(LogLevel::Debug, msg);
}

void Logger::info(std::string_view msg) {
    log(LogLevel::Info, msg);
}

void Logger::warn(std::string_view msg) {
    log(LogLevel::Warn, msg);
}

void Logger::error(std::string_view msg) {
    log(LogLevel::Error, msg);
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(LogLevel level, std::string_view msg) {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    // Format the whole line first so the critical section is a single write.
    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count()
         << " [" << level_to_string(level) << "] "
         << msg << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
    out_.flush();
}

} // namespace demo
