#include "cancellation.hpp"

#include <utility>

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> lock(listenersMutex_);
    for (auto &entry : listeners_)
    {
        entry.second();
    }
}

void CancellationToken::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(false, std::memory_order_release);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]
                        { return cancelled_.load(std::memory_order_acquire); });
}

std::size_t CancellationToken::subscribe(std::function<void()> listener)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    std::size_t id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void CancellationToken::unsubscribe(std::size_t id)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(id);
}
