#pragma once

#include "bus/BusLines.h"
#include "bus/ClockGenerator.h"
#include "bus/ConfigurationState.h"
#include "bus/TransmitQueue.h"
#include "sim/Counter.h"
#include "sim/Diagnostics.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    enum class TransferState : std::uint8_t
    {
        Idle = 0,
        SelectAsserted,   // CSEL low, waiting for the first cell boundary
        Shifting,
        Complete
    };

    struct TransferEngineConfig
    {
        const char *name = "spi";
        sim::Level picoIdleLevel = sim::Level::HighZ;
    };

    // Per-byte transfer state machine.
    //
    //   Idle -> SelectAsserted -> Shifting(7..0) -> Complete -> Idle
    //
    // Each bit cell is one internal clock period: the leading edge is a
    // rising internal edge, the trailing edge the falling edge that follows,
    // and the cell ends at the next rising edge.  The engine is
    // the only writer of the queue head, the bus output lines and the done
    // counter.
    class TransferEngine
    {
    public:
        TransferEngine(sim::Simulator &sim, sim::Diagnostics &diag,
                       ClockGenerator &clock, ConfigurationState &config,
                       TransmitQueue &queue, sim::Counter &requestCount,
                       sim::Counter &doneCount, BusLines &lines);

        // Drive idle lines, subscribe to the clock and wait for work.
        // Returns false if a subscription table was full.
        bool start(const TransferEngineConfig &config);

        TransferState state() const;

        // Bit currently on the wire (7..0); meaningful while Shifting
        std::uint8_t bitIndex() const;

        // Byte being transferred; meaningful outside Idle
        std::uint8_t currentByte() const;

        // Configuration copied at the start of the current byte
        const BusConfig &snapshot() const;

    private:
        static void onClockEdge(void *arg, bool rising);
        static void onRequest(void *arg);
        static void onConfigCommitted(void *arg, const BusConfig &config);

        void handleEdge(bool rising);
        void handleRequest();
        void handleConfigCommitted();

        void driveIdleLines();
        void waitForRequest();
        void beginByte();
        void leadingEdge();
        void trailingEdge();
        void complete();
        void driveBit();

        sim::Simulator &m_sim;
        sim::Diagnostics &m_diag;
        ClockGenerator &m_clock;
        ConfigurationState &m_config;
        TransmitQueue &m_queue;
        sim::Counter &m_requestCount;
        sim::Counter &m_doneCount;
        BusLines &m_lines;

        TransferEngineConfig m_settings;
        BusConfig m_snapshot;
        TransferState m_state;
        std::uint8_t m_data;
        std::uint8_t m_bitIndex;
        bool m_lastCellOpen;      // Bit 0 trailing edge passed; next rising edge completes
        bool m_waitingForRequest;
        bool m_reselectPending;   // CSEL released between bytes; reassert on next falling edge
    };

    const char *transferStateName(TransferState state);

}  // namespace bus
