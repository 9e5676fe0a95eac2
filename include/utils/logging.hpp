#pragma once

#include <mutex>
#include <string>

namespace printvoice {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Accepts "debug", "info", "warn"/"warning", "error" in any case.
    // Unknown names fall back to INFO.
    static LogLevel parseLevel(const std::string& name);

private:
    static void log(LogLevel level, const std::string& message);
    static const char* levelTag(LogLevel level);

    static bool initialized_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace printvoice
