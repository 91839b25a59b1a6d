#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "progress_sink.hpp"

/**
 * Line-oriented progress output for the command-line tool.
 * Several transfers run at once, so each update is a full line prefixed
 * with the task label instead of an in-place bar.
 */
class ConsoleProgressSink : public ProgressSink
{
public:
    /**
     * @param updateInterval Minimum time between two byte-progress lines of one task
     */
    explicit ConsoleProgressSink(std::chrono::milliseconds updateInterval = std::chrono::milliseconds(1000));

    void onByteProgress(const std::string &taskLabel,
                        std::uint64_t bytesThisChunk,
                        std::optional<std::uint64_t> totalBytes) override;
    void onTaskStatus(const std::string &taskLabel, const std::string &phaseLabel) override;
    void onBatchProgress(std::size_t completedCount, std::size_t totalCount) override;

private:
    struct TaskProgress
    {
        std::uint64_t downloaded = 0;
        std::optional<std::uint64_t> total;
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point lastPrinted;
    };

    std::string renderLine(const std::string &label, const TaskProgress &progress) const;

    std::chrono::milliseconds updateInterval_;
    bool isTerminalOutput_;

    std::mutex mutex_;
    std::map<std::string, TaskProgress> tasks_;
};
