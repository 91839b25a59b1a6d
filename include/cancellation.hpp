#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>

/**
 * Thrown by long-running helpers (hashing) when cancellation fires.
 */
class OperationCancelled : public std::runtime_error
{
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

/**
 * Broadcast cancellation signal shared by every task of a batch.
 * Once cancelled, every suspension point that checks the token aborts.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /**
     * Set the flag, wake sleepers and run every subscribed listener.
     */
    void cancel();

    /**
     * Clear the flag so the token can serve a new batch.
     */
    void reset();

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /**
     * Sleep for the given duration unless cancelled first.
     *
     * @return true if the token was cancelled before or during the wait
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * Register a callback invoked from cancel().
     * Listeners must not call back into this token.
     *
     * @return Id to pass to unsubscribe()
     */
    std::size_t subscribe(std::function<void()> listener);

    /**
     * Remove a listener. Blocks while cancel() is running listeners, so the
     * callback is guaranteed not to run after this returns.
     */
    void unsubscribe(std::size_t id);

private:
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    std::mutex listenersMutex_;
    std::map<std::size_t, std::function<void()>> listeners_;
    std::size_t nextListenerId_ = 0;
};
