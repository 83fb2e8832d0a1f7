#include "common/log.hpp"
#include <iostream>

namespace buspro {

const char* level_to_string(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void Logger::set_log_callback(LogCallback cb)
{
    std::lock_guard<std::mutex> lock(mutex_);
    log_callback_ = std::move(cb);
}

void Logger::set_min_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg)
{
    LogCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;
        cb = log_callback_;
    }

    if (cb) {
        cb(level, msg);
        return;
    }
    std::cerr << "[" << level_to_string(level) << "] " << msg << "\n";
}

} // namespace buspro
