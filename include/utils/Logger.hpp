#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace reading_service {
namespace utils {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Process-wide logger. Debug/Info lines go to stdout, Warning/Error to stderr.
class Logger {
public:
    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

    // Accepts "debug", "info", "warning"/"warn", "error" in any case.
    static std::optional<LogLevel> ParseLevel(const std::string& name);

    static void Debug(const std::string& message);
    static void Info(const std::string& message);
    static void Warning(const std::string& message);
    static void Error(const std::string& message);

    static void Log(LogLevel level, const std::string& message);

private:
    static std::string GetTimestamp();
    static std::string LevelToString(LogLevel level);

    static LogLevel s_level;
    static std::mutex s_mutex;
};

} // namespace utils
} // namespace reading_service
