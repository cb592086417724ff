// Monotonic counter with broadcast wake-up.
//
// One process owns increment(); any number of processes may wait for the
// value to reach a target.  A waiter is one-shot: when the counter reaches
// its target the waiter is removed and its callback is queued as a
// zero-delay event, so the waker never re-enters the waiter's code.
//
// Waiters are kept sorted by target (FIFO among equal targets), so an
// increment only inspects the head of the list.

#pragma once

#include "sim/Simulator.h"

#include <cstdint>

namespace sim
{
    static constexpr std::uint8_t kMaxCounterWaiters = 8;

    class Counter
    {
    public:
        explicit Counter(Simulator &sim);

        std::uint64_t value() const;

        // Add one and wake every waiter whose target has been reached.
        void increment();

        // Call fn(arg) once value() >= target.  If already satisfied the
        // callback is queued immediately.  Returns false if the waiter
        // table is full or the event could not be queued.
        bool waitUntilAtLeast(std::uint64_t target, EventFn fn, void *arg);

        // Number of registered, not yet woken waiters
        std::uint8_t waiterCount() const;

    private:
        static constexpr std::uint8_t kNoWaiter = 0xFF;

        struct Waiter
        {
            std::uint64_t target;
            EventFn fn;
            void *arg;
            std::uint8_t next;
            bool active;
        };

        std::uint8_t allocateWaiter();
        void insertWaiter(std::uint8_t idx);
        void wakeReached();

        Simulator &m_sim;
        std::uint64_t m_value;
        Waiter m_waiters[kMaxCounterWaiters];
        std::uint8_t m_waitHead;
        std::uint8_t m_waiterCount;
    };

}  // namespace sim
