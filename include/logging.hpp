#pragma once

#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Leveled logging for headless operation.
 * Every line is written to stderr as "[LEVEL] message" in a single write,
 * so lines from concurrent transfers never interleave.
 */
enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Set the minimum level that gets printed (default: Info).
 */
void setLogLevel(LogLevel level);

LogLevel logLevel();

/**
 * Write one already-formatted line if its level passes the threshold.
 */
void logLine(LogLevel level, const std::string &message);

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args &&...args)
{
    if (logLevel() <= LogLevel::Debug)
        logLine(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args &&...args)
{
    if (logLevel() <= LogLevel::Info)
        logLine(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logWarning(fmt::format_string<Args...> format, Args &&...args)
{
    if (logLevel() <= LogLevel::Warning)
        logLine(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args &&...args)
{
    logLine(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
}
