#include "concurrency_gate.hpp"
#include "test_support.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace testing_support;

namespace
{
    void test_rejects_zero_capacity(TestContext &t)
    {
        CancellationToken cancel;
        bool threw = false;
        try
        {
            ConcurrencyGate gate(0, cancel);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        t.check(threw, "capacity 0 should be rejected");

        ConcurrencyGate gate(1, cancel);
        threw = false;
        try
        {
            gate.setCapacity(0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        t.check(threw, "setCapacity(0) should be rejected");
        t.check(gate.capacity() == 1, "capacity unchanged after rejected update");
    }

    void test_blocks_at_capacity(TestContext &t)
    {
        CancellationToken cancel;
        ConcurrencyGate gate(2, cancel);

        t.check(gate.acquire(), "first acquire succeeds");
        t.check(gate.acquire(), "second acquire succeeds");
        t.check(gate.inUse() == 2, "two slots in use");

        std::atomic<bool> admitted{false};
        std::thread waiter([&]()
                           { admitted = gate.acquire(); });

        t.check(waitUntil([&]()
                          { return gate.waiting() == 1; }),
                "third acquirer should queue");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        t.check(!admitted.load(), "third acquirer must not pass while the gate is full");

        gate.release();
        waiter.join();
        t.check(admitted.load(), "release should admit the waiter");
        t.check(gate.inUse() == 2, "waiter took the freed slot");

        gate.release();
        gate.release();
        t.check(gate.inUse() == 0, "all slots returned");
    }

    void test_admits_in_arrival_order(TestContext &t)
    {
        CancellationToken cancel;
        ConcurrencyGate gate(1, cancel);
        t.check(gate.acquire(), "holder acquires");

        std::mutex orderMutex;
        std::vector<int> order;
        std::vector<std::thread> waiters;

        for (int i = 0; i < 5; ++i)
        {
            waiters.emplace_back([&, i]()
                                 {
                if (gate.acquire())
                {
                    {
                        std::lock_guard<std::mutex> lock(orderMutex);
                        order.push_back(i);
                    }
                    gate.release();
                } });
            // Make sure waiter i is queued before i + 1 starts
            t.check(waitUntil([&]()
                              { return gate.waiting() == static_cast<std::size_t>(i + 1); }),
                    fmt::format("waiter {} should be queued", i));
        }

        gate.release();
        for (std::thread &waiter : waiters)
        {
            waiter.join();
        }

        t.check(order == std::vector<int>({0, 1, 2, 3, 4}), "waiters must be admitted FIFO");
    }

    void test_cancel_wakes_all_waiters(TestContext &t)
    {
        CancellationToken cancel;
        ConcurrencyGate gate(1, cancel);
        t.check(gate.acquire(), "holder acquires");

        std::atomic<int> refused{0};
        std::vector<std::thread> waiters;
        for (int i = 0; i < 3; ++i)
        {
            waiters.emplace_back([&]()
                                 {
                if (!gate.acquire())
                {
                    ++refused;
                } });
        }

        t.check(waitUntil([&]()
                          { return gate.waiting() == 3; }),
                "three waiters queued");
        cancel.cancel();

        for (std::thread &waiter : waiters)
        {
            waiter.join();
        }

        t.check(refused.load() == 3, "every waiter should return false after cancel");
        t.check(gate.waiting() == 0, "queue drained after cancel");
        t.check(gate.inUse() == 1, "holder keeps its slot");
        t.check(!gate.acquire(), "acquire after cancel returns immediately without a slot");

        gate.release();
        t.check(gate.inUse() == 0, "holder released");
    }

    void test_capacity_changes(TestContext &t)
    {
        CancellationToken cancel;
        ConcurrencyGate gate(1, cancel);
        t.check(gate.acquire(), "holder acquires");

        std::atomic<bool> admitted{false};
        std::thread waiter([&]()
                           { admitted = gate.acquire(); });
        t.check(waitUntil([&]()
                          { return gate.waiting() == 1; }),
                "waiter queued");

        gate.setCapacity(2);
        waiter.join();
        t.check(admitted.load(), "growing capacity admits the waiter");
        t.check(gate.inUse() == 2, "two holders");

        // Shrinking never evicts: holders keep their slots
        gate.setCapacity(1);
        t.check(gate.inUse() == 2, "shrink keeps current holders");

        std::atomic<bool> late{false};
        std::thread lateWaiter([&]()
                               { late = gate.acquire(); });
        t.check(waitUntil([&]()
                          { return gate.waiting() == 1; }),
                "late waiter queued");

        gate.release();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        t.check(!late.load(), "one holder left at capacity 1, late waiter still blocked");

        gate.release();
        lateWaiter.join();
        t.check(late.load(), "late waiter admitted once below the new capacity");
        gate.release();
    }

    void test_slot_releases_on_scope_exit(TestContext &t)
    {
        CancellationToken cancel;
        ConcurrencyGate gate(1, cancel);
        {
            ConcurrencyGate::Slot slot(gate);
            t.check(slot.acquired(), "slot acquired");
            t.check(gate.inUse() == 1, "slot counts as in use");
        }
        t.check(gate.inUse() == 0, "slot released at scope exit");

        cancel.cancel();
        {
            ConcurrencyGate::Slot slot(gate);
            t.check(!slot.acquired(), "slot not acquired once cancelled");
        }
        t.check(gate.inUse() == 0, "a refused slot releases nothing");
    }
}

int main()
{
    TestContext t;
    test_rejects_zero_capacity(t);
    test_blocks_at_capacity(t);
    test_admits_in_arrival_order(t);
    test_cancel_wakes_all_waiters(t);
    test_capacity_changes(t);
    test_slot_releases_on_scope_exit(t);
    return t.finish("concurrency_gate_tests");
}
