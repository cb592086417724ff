#pragma once

#include "bus/ClockGenerator.h"
#include "bus/Command.h"
#include "bus/CommandPort.h"
#include "bus/ConfigurationState.h"
#include "bus/TransmitQueue.h"
#include "sim/Counter.h"
#include "sim/Diagnostics.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    struct ControllerIdentity
    {
        ControllerId id;
        const char *name;
    };

    // Number of clock edges WaitForClockCycles waits per requested cycle
    static constexpr std::uint32_t kEdgesPerWaitCycle = 3;

    // Command dispatcher.
    //
    // Takes one command at a time from the port.  Queries and SetOption are
    // answered within the same event; Send(blocking), WaitForTransaction and
    // WaitForClockCycles park the acknowledgement on a counter wait.  The
    // Dispatcher is the only writer of the queue tail, the request counter
    // and the configuration.
    //
    // Fatal conditions (unknown option, out-of-range value, multiple
    // drivers, unknown command) produce one FAILURE diagnostic, an error
    // reply, and a simulator halt with the error status.
    class Dispatcher
    {
    public:
        Dispatcher(sim::Simulator &sim, sim::Diagnostics &diag, CommandPort &port,
                   ConfigurationState &config, TransmitQueue &queue,
                   sim::Counter &requestCount, sim::Counter &doneCount,
                   sim::Counter &clockEdges);

        void start(const ControllerIdentity &identity);

        // True while an acknowledgement waits on a counter
        bool suspended() const;

        // Command currently being served (or last served)
        CommandType currentCommand() const;

    private:
        static void onRequest(void *arg, const Command &command);
        static void onWaitComplete(void *arg);

        void handle(const Command &command);

        std::int32_t handleSend(const Command &command);
        std::int32_t handleWaitForTransaction();
        std::int32_t handleWaitForClockCycles(const Command &command);
        std::int32_t handleSetOption(const Command &command);
        std::int32_t reportMultipleDriver(const Command &command);
        std::int32_t reportUnknown(const Command &command);

        // Park the acknowledgement until counter >= target
        std::int32_t suspendUntil(sim::Counter &counter, std::uint64_t target);

        void acknowledge(std::int32_t status);

        // Report a fatal condition and halt the run
        void fail(std::int32_t status, const char *message);

        sim::Simulator &m_sim;
        sim::Diagnostics &m_diag;
        CommandPort &m_port;
        ConfigurationState &m_config;
        TransmitQueue &m_queue;
        sim::Counter &m_requestCount;
        sim::Counter &m_doneCount;
        sim::Counter &m_clockEdges;

        ControllerIdentity m_identity;
        CommandType m_current;
        bool m_suspended;
    };

}  // namespace bus
