#pragma once

// Command port: request/acknowledge channel between one command source and
// the Dispatcher.
//
//   Caller:     submit(cmd, replyFn, arg)   -- one request at a time
//   Dispatcher: attach(requestFn, arg)      -- receives each command
//   Dispatcher: acknowledge(reply)          -- completes the request
//
// Delivery happens in a zero-delay event, never inside submit().  A submit
// while a request is outstanding means two command streams drive the same
// port; the port reports MultipleDriverDetected to the Dispatcher and
// rejects the second request.

#include "bus/Command.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    using ReplyFn = void (*)(void *arg, const Reply &reply);
    using RequestFn = void (*)(void *arg, const Command &command);

    class CommandPort
    {
    public:
        explicit CommandPort(sim::Simulator &sim);

        // ---- Caller side ----

        // Returns kBusOk once queued for delivery, kBusErrMultipleDriver if
        // a request is already outstanding, kBusErrNotStarted if no
        // dispatcher is attached, kBusErrHalted after the run halted.
        std::int32_t submit(const Command &command, ReplyFn fn, void *arg);

        // True from submit() until the reply has been delivered
        bool busy() const;

        // Requests accepted so far
        std::uint32_t sequence() const;

        // ---- Dispatcher side ----

        void attach(RequestFn fn, void *arg);

        // Complete the outstanding request and hand the reply to the caller.
        // Returns kBusErrBusy if no request is outstanding.
        std::int32_t acknowledge(const Reply &reply);

    private:
        static void onDeliver(void *arg);
        static void onViolation(void *arg);

        sim::Simulator &m_sim;
        RequestFn m_requestFn;
        void *m_requestArg;

        Command m_pending;
        ReplyFn m_replyFn;
        void *m_replyArg;
        bool m_busy;
        std::uint32_t m_sequence;
        std::uint32_t m_violationSequence;
    };

}  // namespace bus
