// SPI bus-master controller.
//
// Owns the four processes and the state they share:
//
//   CommandPort -> Dispatcher -> {ConfigurationState | TransmitQueue}
//                                 -> TransferEngine -> BusLines
//   ClockGenerator -> TransferEngine (edges), Dispatcher (edge counter)
//   done counter -> Dispatcher (blocking waits)
//
// Usage:
//   1. Construct with a simulator, diagnostics and a ControllerConfig
//   2. Call start() once (the one-shot initializer)
//   3. Submit commands through port() and run the simulator

#pragma once

#include "bus/BusLines.h"
#include "bus/ClockGenerator.h"
#include "bus/CommandPort.h"
#include "bus/ConfigurationState.h"
#include "bus/Dispatcher.h"
#include "bus/SpiMode.h"
#include "bus/TransferEngine.h"
#include "bus/TransmitQueue.h"
#include "sim/Counter.h"
#include "sim/Diagnostics.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    struct ControllerConfig
    {
        const char *name = "spi0";
        sim::SimTime sclkPeriod = kDefaultSclkPeriod;
        SpiMode mode = SpiMode::Mode0;
        bool burstMode = false;
        sim::Level picoIdleLevel = sim::Level::HighZ;
    };

    class Controller
    {
    public:
        Controller(sim::Simulator &sim, sim::Diagnostics &diag,
                   const ControllerConfig &config = ControllerConfig{});

        // Commit the initial configuration, assign the identity and start
        // the clock, the transfer engine and the dispatcher.
        // Returns kBusOk, kBusErrOutOfRange for an invalid configuration
        // (FAILURE reported, nothing started), or kBusErrBusy if already
        // started.
        std::int32_t start();
        bool started() const;

        ControllerId id() const;
        const char *name() const;

        CommandPort &port();
        BusLines &lines();
        ClockGenerator &clock();
        const ConfigurationState &configuration() const;
        const TransmitQueue &transmitQueue() const;
        const TransferEngine &engine() const;
        const Dispatcher &dispatcher() const;

        std::uint64_t transmitRequestCount() const;
        std::uint64_t transmitDoneCount() const;

        // Reserved for the peer side; the controller never changes it
        std::uint64_t receiveCount() const;

    private:
        sim::Diagnostics &m_diag;
        ControllerConfig m_settings;

        ConfigurationState m_config;
        TransmitQueue m_queue;
        sim::Counter m_requestCount;
        sim::Counter m_doneCount;
        sim::Counter m_receiveCount;
        BusLines m_lines;
        ClockGenerator m_clock;
        CommandPort m_port;
        TransferEngine m_engine;
        Dispatcher m_dispatcher;

        ControllerId m_id;
        bool m_started;
    };

    // Next process-wide controller identity (1, 2, ...)
    ControllerId allocateControllerId();

}  // namespace bus
