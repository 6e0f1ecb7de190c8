
#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace dasim {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Accepts "trace".."error" (case-insensitive). Leaves lvl untouched on failure.
bool parse_log_level(const std::string& s, LogLevel& lvl);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

} // namespace dasim
