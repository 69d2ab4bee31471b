#pragma once

#include <string>

namespace affectrt {
namespace utils {

/**
 * Minimum severity written by the Logger
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

class Logger {
public:
    static void initialize();
    static void initialize(LogLevel level);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    /**
     * Parse "debug", "INFO", "warn", ... Unknown names map to INFO.
     */
    static LogLevel levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);

private:
    static void write(LogLevel level, const char* prefix, const std::string& message);

    static bool initialized_;
};

} // namespace utils
} // namespace affectrt
