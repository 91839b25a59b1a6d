#include "concurrency_gate.hpp"

#include <algorithm>
#include <stdexcept>

ConcurrencyGate::ConcurrencyGate(std::size_t capacity, CancellationToken &cancel)
    : cancel_(cancel), capacity_(capacity)
{
    if (capacity == 0)
    {
        throw std::invalid_argument("ConcurrencyGate capacity must be at least 1");
    }

    // Lock before notifying so a waiter between its predicate check and wait() cannot miss the wakeup
    listenerId_ = cancel_.subscribe([this]()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });
}

ConcurrencyGate::~ConcurrencyGate()
{
    cancel_.unsubscribe(listenerId_);
}

bool ConcurrencyGate::acquire()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancel_.isCancelled())
    {
        return false;
    }

    const std::uint64_t ticket = nextTicket_++;
    queue_.push_back(ticket);

    cv_.wait(lock, [this, ticket]
             { return cancel_.isCancelled() ||
                      (queue_.front() == ticket && inUse_ < capacity_); });

    if (cancel_.isCancelled())
    {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        cv_.notify_all();
        return false;
    }

    queue_.pop_front();
    ++inUse_;

    // The next ticket may also fit if capacity allows
    cv_.notify_all();
    return true;
}

void ConcurrencyGate::release()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inUse_ > 0)
        {
            --inUse_;
        }
    }
    cv_.notify_all();
}

void ConcurrencyGate::setCapacity(std::size_t capacity)
{
    if (capacity == 0)
    {
        throw std::invalid_argument("ConcurrencyGate capacity must be at least 1");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity;
    }
    cv_.notify_all();
}

std::size_t ConcurrencyGate::capacity() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

std::size_t ConcurrencyGate::inUse() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return inUse_;
}

std::size_t ConcurrencyGate::waiting() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
