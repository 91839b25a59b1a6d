#include "progress_sink.hpp"
#include "logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

AsyncProgressSink::AsyncProgressSink(std::shared_ptr<ProgressSink> target, std::size_t queueCapacity)
    : target_(std::move(target)), capacity_(queueCapacity > 0 ? queueCapacity : 1)
{
    if (!target_)
    {
        throw std::invalid_argument("AsyncProgressSink needs a target sink");
    }
    dispatcher_ = std::thread(&AsyncProgressSink::dispatchLoop, this);
}

AsyncProgressSink::~AsyncProgressSink()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wakeDispatcher_.notify_all();
    dispatcher_.join();

    if (dropped_ > 0)
    {
        logDebug("Progress sink dropped {} events", dropped_);
    }
}

void AsyncProgressSink::onByteProgress(const std::string &taskLabel,
                                       std::uint64_t bytesThisChunk,
                                       std::optional<std::uint64_t> totalBytes)
{
    Event event{Event::Kind::Bytes, taskLabel, {}, bytesThisChunk, totalBytes};
    enqueue(std::move(event));
}

void AsyncProgressSink::onTaskStatus(const std::string &taskLabel, const std::string &phaseLabel)
{
    Event event{Event::Kind::Status, taskLabel, phaseLabel};
    enqueue(std::move(event));
}

void AsyncProgressSink::onBatchProgress(std::size_t completedCount, std::size_t totalCount)
{
    Event event{Event::Kind::Batch};
    event.completed = completedCount;
    event.count = totalCount;
    enqueue(std::move(event));
}

void AsyncProgressSink::flush()
{
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]
                  { return queue_.empty() && !delivering_; });
}

std::uint64_t AsyncProgressSink::droppedEvents() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void AsyncProgressSink::enqueue(Event event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            ++dropped_;
            return;
        }
        queue_.push_back(std::move(event));
    }
    wakeDispatcher_.notify_one();
}

void AsyncProgressSink::dispatchLoop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        wakeDispatcher_.wait(lock, [this]
                             { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
        {
            // stopping_ with nothing left to deliver
            break;
        }

        Event event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        try
        {
            switch (event.kind)
            {
            case Event::Kind::Bytes:
                target_->onByteProgress(event.label, event.bytes, event.total);
                break;
            case Event::Kind::Status:
                target_->onTaskStatus(event.label, event.phase);
                break;
            case Event::Kind::Batch:
                target_->onBatchProgress(event.completed, event.count);
                break;
            }
        }
        catch (const std::exception &e)
        {
            logWarning("Progress sink threw: {}", e.what());
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty())
        {
            drained_.notify_all();
        }
    }

    delivering_ = false;
    drained_.notify_all();
}
