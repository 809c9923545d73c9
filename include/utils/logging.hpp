#pragma once

#include <atomic>
#include <string>

namespace voicegate {
namespace utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
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
    static bool isEnabled(LogLevel level);

    /**
     * Parse a level name ("debug", "INFO", "warning", ...)
     * @param name Level name, case-insensitive
     * @param fallback Level returned for unrecognised names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
    static std::string levelToString(LogLevel level);

private:
    // Shared by every engine in the process; changed from any thread
    static std::atomic<bool> initialized_;
    static std::atomic<LogLevel> level_;
};

} // namespace utils
} // namespace voicegate
