#include "logging.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace
{
    std::atomic<LogLevel> currentLevel{LogLevel::Info};
    std::mutex outputMutex;

    const char *levelTag(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        }
        return "INFO";
    }
}

void setLogLevel(LogLevel level)
{
    currentLevel.store(level);
}

LogLevel logLevel()
{
    return currentLevel.load();
}

void logLine(LogLevel level, const std::string &message)
{
    if (level < currentLevel.load())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    fmt::print(stderr, "[{}] {}\n", levelTag(level), message);
}
