#pragma once

#include "sim/Time.h"

#include <cstdint>
#include <vector>

namespace sim
{
    using EventFn = void (*)(void *arg);
    using EventId = std::uint32_t;

    static constexpr EventId kInvalidEventId = 0xFFFFFFFF;

    // Simulation status codes
    static constexpr std::int32_t kSimOk         =  0;
    static constexpr std::int32_t kSimErrTimeout = -1;  // Run limit reached before condition
    static constexpr std::int32_t kSimErrIdle    = -2;  // Event list drained before condition
    static constexpr std::int32_t kSimErrFull    = -3;  // Fixed-capacity table exhausted

    class Simulator
    {
    public:
        Simulator();

        // Queue fn(arg) to run at now() + delay.  Events due at the same
        // time run in the order they were scheduled, so a zero-delay event
        // runs after everything already queued for the current instant.
        EventId schedule(SimTime delay, EventFn fn, void *arg);

        // Current simulation time
        SimTime now() const;

        // Dispatch every event due within [now, now + duration], then move
        // now() to the end of the window.  Returns kSimOk or the halt status.
        std::int32_t runFor(SimTime duration);

        // Dispatch events until done becomes true.
        // Returns kSimOk, the halt status, kSimErrIdle if no events remain,
        // or kSimErrTimeout if the next event lies beyond now + limit.
        std::int32_t runUntil(const bool &done, SimTime limit);

        // Terminate the run.  No further events are dispatched; every run
        // call returns the first halt status from now on.
        void halt(std::int32_t status);

        bool halted() const;
        std::int32_t haltStatus() const;

        std::uint32_t pendingEvents() const;
        std::uint64_t dispatchedEvents() const;

    private:
        struct EventSlot
        {
            SimTime time;
            EventFn fn;
            void *arg;
            EventId next;
        };

        EventId allocateSlot();
        void releaseSlot(EventId id);
        void insertSorted(EventId id);

        // Pop and run the head event
        void dispatchHead();

        std::vector<EventSlot> m_slots;

        // Time-ordered singly-linked list (head/tail for O(1) append)
        EventId m_head;
        EventId m_tail;
        EventId m_freeHead;

        SimTime m_now;
        std::uint32_t m_pending;
        std::uint64_t m_dispatched;
        bool m_halted;
        std::int32_t m_haltStatus;
    };

}  // namespace sim
