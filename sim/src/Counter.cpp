#include "sim/Counter.h"

namespace sim
{
    Counter::Counter(Simulator &sim)
        : m_sim(sim),
          m_value(0),
          m_waiters{},
          m_waitHead(kNoWaiter),
          m_waiterCount(0)
    {
    }

    std::uint64_t Counter::value() const
    {
        return m_value;
    }

    void Counter::increment()
    {
        ++m_value;
        wakeReached();
    }

    bool Counter::waitUntilAtLeast(std::uint64_t target, EventFn fn, void *arg)
    {
        if (fn == nullptr)
        {
            return false;
        }

        if (m_value >= target)
        {
            return m_sim.schedule(0, fn, arg) != kInvalidEventId;
        }

        std::uint8_t idx = allocateWaiter();
        if (idx == kNoWaiter)
        {
            return false;
        }

        Waiter &w = m_waiters[idx];
        w.target = target;
        w.fn = fn;
        w.arg = arg;
        w.active = true;

        insertWaiter(idx);
        ++m_waiterCount;
        return true;
    }

    std::uint8_t Counter::waiterCount() const
    {
        return m_waiterCount;
    }

    // ---- Private helpers ----

    std::uint8_t Counter::allocateWaiter()
    {
        for (std::uint8_t i = 0; i < kMaxCounterWaiters; ++i)
        {
            if (!m_waiters[i].active)
            {
                return i;
            }
        }
        return kNoWaiter;
    }

    void Counter::insertWaiter(std::uint8_t idx)
    {
        Waiter &w = m_waiters[idx];
        w.next = kNoWaiter;

        // Empty list or strictly lower target than the head
        if (m_waitHead == kNoWaiter || w.target < m_waiters[m_waitHead].target)
        {
            w.next = m_waitHead;
            m_waitHead = idx;
            return;
        }

        // Walk past every waiter with target <= ours (FIFO among equals)
        std::uint8_t prev = m_waitHead;
        while (m_waiters[prev].next != kNoWaiter &&
               m_waiters[m_waiters[prev].next].target <= w.target)
        {
            prev = m_waiters[prev].next;
        }

        w.next = m_waiters[prev].next;
        m_waiters[prev].next = idx;
    }

    void Counter::wakeReached()
    {
        while (m_waitHead != kNoWaiter && m_waiters[m_waitHead].target <= m_value)
        {
            Waiter &w = m_waiters[m_waitHead];
            m_waitHead = w.next;
            w.active = false;
            w.next = kNoWaiter;
            --m_waiterCount;

            // A waiter that cannot be woken would stall forever
            if (m_sim.schedule(0, w.fn, w.arg) == kInvalidEventId)
            {
                m_sim.halt(kSimErrFull);
                return;
            }
        }
    }

}  // namespace sim
