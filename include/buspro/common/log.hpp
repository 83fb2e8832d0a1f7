#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <sstream>

namespace buspro {

enum class LogLevel
{
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

const char* level_to_string(LogLevel level);

// Shared by every component of one Gateway. Without a callback lines go to std::cerr.
class Logger
{
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LogLevel min_level = LogLevel::INFO) : min_level_(min_level) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_callback(LogCallback cb);
    void set_min_level(LogLevel level);
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    LogCallback log_callback_;
};

} // namespace buspro
