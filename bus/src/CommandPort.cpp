#include "bus/CommandPort.h"

namespace bus
{
    CommandPort::CommandPort(sim::Simulator &sim)
        : m_sim(sim),
          m_requestFn(nullptr),
          m_requestArg(nullptr),
          m_pending{},
          m_replyFn(nullptr),
          m_replyArg(nullptr),
          m_busy(false),
          m_sequence(0),
          m_violationSequence(0)
    {
    }

    // ---- Caller side ----

    std::int32_t CommandPort::submit(const Command &command, ReplyFn fn, void *arg)
    {
        if (m_sim.halted())
        {
            return kBusErrHalted;
        }
        if (m_requestFn == nullptr)
        {
            return kBusErrNotStarted;
        }

        if (m_busy)
        {
            // Second driver on the port: the dispatcher decides what happens
            m_violationSequence = m_sequence + 1;
            if (m_sim.schedule(0, onViolation, this) == sim::kInvalidEventId)
            {
                m_sim.halt(sim::kSimErrFull);
            }
            return kBusErrMultipleDriver;
        }

        if (m_sim.schedule(0, onDeliver, this) == sim::kInvalidEventId)
        {
            m_sim.halt(sim::kSimErrFull);
            return sim::kSimErrFull;
        }

        m_pending = command;
        m_replyFn = fn;
        m_replyArg = arg;
        m_busy = true;
        ++m_sequence;
        return kBusOk;
    }

    bool CommandPort::busy() const
    {
        return m_busy;
    }

    std::uint32_t CommandPort::sequence() const
    {
        return m_sequence;
    }

    // ---- Dispatcher side ----

    void CommandPort::attach(RequestFn fn, void *arg)
    {
        m_requestFn = fn;
        m_requestArg = arg;
    }

    std::int32_t CommandPort::acknowledge(const Reply &reply)
    {
        if (!m_busy)
        {
            return kBusErrBusy;
        }

        // Clear first so the caller may submit again from its reply callback
        ReplyFn fn = m_replyFn;
        void *arg = m_replyArg;
        m_busy = false;
        m_replyFn = nullptr;
        m_replyArg = nullptr;

        if (fn != nullptr)
        {
            fn(arg, reply);
        }
        return kBusOk;
    }

    // ---- Delivery ----

    void CommandPort::onDeliver(void *arg)
    {
        CommandPort *self = static_cast<CommandPort *>(arg);
        self->m_requestFn(self->m_requestArg, self->m_pending);
    }

    void CommandPort::onViolation(void *arg)
    {
        CommandPort *self = static_cast<CommandPort *>(arg);
        self->m_requestFn(self->m_requestArg,
                          makeMultipleDriverDetected(self->m_violationSequence));
    }

}  // namespace bus
