#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "cancellation.hpp"

/**
 * Counting admission controller bounding how many transfers run at once.
 *
 * Waiters are admitted in strict FIFO order: a later arrival never overtakes
 * an earlier one, even if capacity grows. Cancelling the bound token wakes
 * every waiter, which then returns without taking a slot.
 */
class ConcurrencyGate
{
public:
    /**
     * @param capacity Maximum number of concurrent holders (at least 1)
     * @param cancel Token whose cancellation aborts pending acquisitions.
     *               Must outlive the gate.
     * @throws std::invalid_argument if capacity is 0
     */
    ConcurrencyGate(std::size_t capacity, CancellationToken &cancel);
    ~ConcurrencyGate();

    ConcurrencyGate(const ConcurrencyGate &) = delete;
    ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

    /**
     * Block until a slot is free.
     *
     * @return true if a slot was taken, false if cancelled (no slot held)
     */
    bool acquire();

    /**
     * Return a slot and wake the next waiter.
     */
    void release();

    /**
     * Change capacity for future acquisitions. Current holders keep their slots.
     * @throws std::invalid_argument if capacity is 0
     */
    void setCapacity(std::size_t capacity);

    std::size_t capacity() const;
    std::size_t inUse() const;
    std::size_t waiting() const;

    /**
     * RAII holder: acquires in the constructor, releases in the destructor
     * if the acquisition succeeded.
     */
    class Slot
    {
    public:
        explicit Slot(ConcurrencyGate &gate) : gate_(gate), held_(gate.acquire()) {}
        ~Slot()
        {
            if (held_)
                gate_.release();
        }

        Slot(const Slot &) = delete;
        Slot &operator=(const Slot &) = delete;

        bool acquired() const { return held_; }

    private:
        ConcurrencyGate &gate_;
        bool held_;
    };

private:
    CancellationToken &cancel_;
    std::size_t listenerId_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t capacity_;
    std::size_t inUse_ = 0;

    // Tickets of waiting acquirers, oldest first
    std::deque<std::uint64_t> queue_;
    std::uint64_t nextTicket_ = 0;
};
