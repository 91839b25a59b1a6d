#include "console_progress_sink.hpp"
#include "format_utils.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

ConsoleProgressSink::ConsoleProgressSink(std::chrono::milliseconds updateInterval)
    : updateInterval_(updateInterval)
{
    // Detect if stdout is a terminal to decide whether to draw a bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ConsoleProgressSink::onByteProgress(const std::string &taskLabel,
                                         std::uint64_t bytesThisChunk,
                                         std::optional<std::uint64_t> totalBytes)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    TaskProgress &progress = tasks_[taskLabel];
    if (progress.startTime == std::chrono::steady_clock::time_point{})
    {
        progress.startTime = now;
        progress.lastPrinted = now;
    }
    progress.downloaded += bytesThisChunk;
    progress.total = totalBytes;

    bool isComplete = totalBytes && progress.downloaded >= *totalBytes;
    if (!isComplete && now - progress.lastPrinted < updateInterval_)
    {
        return;
    }

    progress.lastPrinted = now;
    fmt::print("{}\n", renderLine(taskLabel, progress));
    std::fflush(stdout);
}

void ConsoleProgressSink::onTaskStatus(const std::string &taskLabel, const std::string &phaseLabel)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Each attempt re-reports the bytes already on disk, so the count restarts on connect
    if (phaseLabel == "Connecting")
    {
        tasks_[taskLabel] = TaskProgress{};
    }

    fmt::print("{}: {}\n", taskLabel, phaseLabel);
    std::fflush(stdout);
}

void ConsoleProgressSink::onBatchProgress(std::size_t completedCount, std::size_t totalCount)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fmt::print("[{}/{} Files]\n", completedCount, totalCount);
    std::fflush(stdout);
}

std::string ConsoleProgressSink::renderLine(const std::string &label, const TaskProgress &progress) const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::steady_clock::now() - progress.startTime)
                       .count();
    double speed = (elapsed > 0) ? static_cast<double>(progress.downloaded) / elapsed : 0.0;
    std::string speedStr = fmt::format("{}/s", formatBytes(static_cast<std::uint64_t>(speed)));

    // If we don't know the total size, show basic progress
    if (!progress.total || *progress.total == 0)
    {
        return fmt::format("{}: {} | {} | Elapsed: {}",
                           label, formatBytes(progress.downloaded), speedStr,
                           formatDuration(static_cast<long>(elapsed)));
    }

    std::uint64_t total = *progress.total;
    double percentage = (static_cast<double>(progress.downloaded) / total) * 100.0;
    if (percentage > 100.0)
    {
        percentage = 100.0;
    }
    long eta = (speed > 0 && total > progress.downloaded)
                   ? static_cast<long>((total - progress.downloaded) / speed)
                   : 0;

    std::string bar;
    if (isTerminalOutput_)
    {
        // Create progress bar (30 characters wide)
        int barWidth = 30;
        int filled = static_cast<int>((percentage / 100.0) * barWidth);
        bar = "[";
        for (int i = 0; i < barWidth; ++i)
        {
            bar += (i < filled) ? "=" : (i == filled ? ">" : " ");
        }
        bar += "] ";
    }

    return fmt::format("{}: {}{:.1f}% | {} / {} | {} | ETA: {}",
                       label, bar, percentage,
                       formatBytes(progress.downloaded), formatBytes(total),
                       speedStr, formatDuration(eta));
}
