#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/**
 * Receiver of transfer progress events. All calls are fire-and-forget.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    /**
     * @param taskLabel Display name of the transfer
     * @param bytesThisChunk Bytes written since the previous event
     * @param totalBytes Expected size, empty when the server did not say
     */
    virtual void onByteProgress(const std::string &taskLabel,
                                std::uint64_t bytesThisChunk,
                                std::optional<std::uint64_t> totalBytes) = 0;

    virtual void onTaskStatus(const std::string &taskLabel, const std::string &phaseLabel) = 0;

    virtual void onBatchProgress(std::size_t completedCount, std::size_t totalCount) = 0;
};

/**
 * Decorator that moves event delivery onto a dispatcher thread.
 * Events go into a bounded queue; when it is full they are dropped, so a
 * slow sink never blocks the caller. Pending events are delivered before
 * the destructor returns.
 */
class AsyncProgressSink : public ProgressSink
{
public:
    static constexpr std::size_t DEFAULT_QUEUE_CAPACITY = 4096;

    explicit AsyncProgressSink(std::shared_ptr<ProgressSink> target,
                               std::size_t queueCapacity = DEFAULT_QUEUE_CAPACITY);
    ~AsyncProgressSink() override;

    AsyncProgressSink(const AsyncProgressSink &) = delete;
    AsyncProgressSink &operator=(const AsyncProgressSink &) = delete;

    void onByteProgress(const std::string &taskLabel,
                        std::uint64_t bytesThisChunk,
                        std::optional<std::uint64_t> totalBytes) override;
    void onTaskStatus(const std::string &taskLabel, const std::string &phaseLabel) override;
    void onBatchProgress(std::size_t completedCount, std::size_t totalCount) override;

    /**
     * Block until every queued event has been delivered.
     */
    void flush();

    std::uint64_t droppedEvents() const;

private:
    struct Event
    {
        enum class Kind
        {
            Bytes,
            Status,
            Batch
        };

        Kind kind;
        std::string label;
        std::string phase;
        std::uint64_t bytes = 0;
        std::optional<std::uint64_t> total;
        std::size_t completed = 0;
        std::size_t count = 0;
    };

    void enqueue(Event event);
    void dispatchLoop();

    std::shared_ptr<ProgressSink> target_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable wakeDispatcher_;
    std::condition_variable drained_;
    std::deque<Event> queue_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::uint64_t dropped_ = 0;

    std::thread dispatcher_;
};
