// Free-running bus clock.
//
// Toggles an internal clock every sclkPeriod / 2 from start() on and never
// stops.  The period is read from the configuration each time the next
// half-cycle is armed, so a period change applies from the next half-cycle
// boundary on; the half-cycle already in flight keeps its old length.
//
// Consumers do not poll the clock level.  They either subscribe to the
// edge stream or wait on the edge counter.

#pragma once

#include "bus/ConfigurationState.h"
#include "sim/Counter.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    using ClockEdgeFn = void (*)(void *arg, bool rising);

    static constexpr std::uint8_t kMaxClockSubscribers = 4;

    class ClockGenerator
    {
    public:
        ClockGenerator(sim::Simulator &sim, const ConfigurationState &config);

        // Arm the first half-cycle.  Calling start() twice has no effect.
        void start();
        bool running() const;

        // Internal clock level (true = high).  Starts low.
        bool level() const;

        // Edges produced since start()
        sim::Counter &edges();
        const sim::Counter &edges() const;

        // Subscribers run in registration order on every edge.
        // Returns false if the subscriber table is full.
        bool subscribe(ClockEdgeFn fn, void *arg);

        // Time of the most recent edge
        sim::SimTime lastEdgeTime() const;

    private:
        struct Subscriber
        {
            ClockEdgeFn fn;
            void *arg;
        };

        static void onToggle(void *arg);
        void toggle();
        void arm();

        sim::Simulator &m_sim;
        const ConfigurationState &m_config;
        sim::Counter m_edges;
        Subscriber m_subscribers[kMaxClockSubscribers];
        std::uint8_t m_subscriberCount;
        sim::SimTime m_lastEdge;
        bool m_level;
        bool m_running;
    };

}  // namespace bus
