// Cooperative discrete-event scheduler.
//
// Events live in a slot table and are chained into a single list sorted by
// due time.  Insertion keeps FIFO order among equal times, which gives
// delta-cycle ordering for zero-delay events.  Freed slots are chained into
// a free list and reused.
//
// There is no preemption: an event callback runs to completion, and any
// "suspension" is the callback registering a follow-up (event, counter
// wait, clock subscription) and returning.

#include "sim/Simulator.h"

namespace sim
{
    Simulator::Simulator()
        : m_head(kInvalidEventId),
          m_tail(kInvalidEventId),
          m_freeHead(kInvalidEventId),
          m_now(0),
          m_pending(0),
          m_dispatched(0),
          m_halted(false),
          m_haltStatus(kSimOk)
    {
    }

    // ---- Private helpers ----

    EventId Simulator::allocateSlot()
    {
        if (m_freeHead != kInvalidEventId)
        {
            EventId id = m_freeHead;
            m_freeHead = m_slots[id].next;
            return id;
        }

        if (m_slots.size() >= kInvalidEventId)
        {
            return kInvalidEventId;
        }

        m_slots.push_back(EventSlot{});
        return static_cast<EventId>(m_slots.size() - 1);
    }

    void Simulator::releaseSlot(EventId id)
    {
        EventSlot &slot = m_slots[id];
        slot.fn = nullptr;
        slot.arg = nullptr;
        slot.next = m_freeHead;
        m_freeHead = id;
    }

    void Simulator::insertSorted(EventId id)
    {
        EventSlot &slot = m_slots[id];
        slot.next = kInvalidEventId;

        // Empty list
        if (m_head == kInvalidEventId)
        {
            m_head = id;
            m_tail = id;
            return;
        }

        // Common case: due no earlier than the last event -- append
        if (m_slots[m_tail].time <= slot.time)
        {
            m_slots[m_tail].next = id;
            m_tail = id;
            return;
        }

        // Due strictly before the head
        if (slot.time < m_slots[m_head].time)
        {
            slot.next = m_head;
            m_head = id;
            return;
        }

        // Walk to the last event due at or before this one
        EventId prev = m_head;
        while (m_slots[prev].next != kInvalidEventId &&
               m_slots[m_slots[prev].next].time <= slot.time)
        {
            prev = m_slots[prev].next;
        }

        slot.next = m_slots[prev].next;
        m_slots[prev].next = id;
    }

    void Simulator::dispatchHead()
    {
        EventId id = m_head;
        EventSlot &slot = m_slots[id];

        m_head = slot.next;
        if (m_head == kInvalidEventId)
        {
            m_tail = kInvalidEventId;
        }
        --m_pending;

        m_now = slot.time;
        EventFn fn = slot.fn;
        void *arg = slot.arg;

        // Release before the call so the callback can reuse the slot
        releaseSlot(id);

        ++m_dispatched;
        if (fn != nullptr)
        {
            fn(arg);
        }
    }

    // ---- Public API ----

    EventId Simulator::schedule(SimTime delay, EventFn fn, void *arg)
    {
        if (fn == nullptr)
        {
            return kInvalidEventId;
        }

        EventId id = allocateSlot();
        if (id == kInvalidEventId)
        {
            return kInvalidEventId;
        }

        EventSlot &slot = m_slots[id];
        slot.time = m_now + delay;
        slot.fn = fn;
        slot.arg = arg;

        insertSorted(id);
        ++m_pending;
        return id;
    }

    SimTime Simulator::now() const
    {
        return m_now;
    }

    std::int32_t Simulator::runFor(SimTime duration)
    {
        SimTime deadline = m_now + duration;

        while (!m_halted && m_head != kInvalidEventId && m_slots[m_head].time <= deadline)
        {
            dispatchHead();
        }

        if (m_halted)
        {
            return m_haltStatus;
        }

        m_now = deadline;
        return kSimOk;
    }

    std::int32_t Simulator::runUntil(const bool &done, SimTime limit)
    {
        SimTime deadline = m_now + limit;

        while (!done)
        {
            if (m_halted)
            {
                return m_haltStatus;
            }
            if (m_head == kInvalidEventId)
            {
                return kSimErrIdle;
            }
            if (m_slots[m_head].time > deadline)
            {
                m_now = deadline;
                return kSimErrTimeout;
            }
            dispatchHead();
        }

        return m_halted ? m_haltStatus : kSimOk;
    }

    void Simulator::halt(std::int32_t status)
    {
        // The first halt wins
        if (m_halted)
        {
            return;
        }
        m_halted = true;
        m_haltStatus = status;
    }

    bool Simulator::halted() const
    {
        return m_halted;
    }

    std::int32_t Simulator::haltStatus() const
    {
        return m_haltStatus;
    }

    std::uint32_t Simulator::pendingEvents() const
    {
        return m_pending;
    }

    std::uint64_t Simulator::dispatchedEvents() const
    {
        return m_dispatched;
    }

}  // namespace sim
