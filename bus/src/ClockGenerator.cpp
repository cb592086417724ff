#include "bus/ClockGenerator.h"

namespace bus
{
    ClockGenerator::ClockGenerator(sim::Simulator &sim, const ConfigurationState &config)
        : m_sim(sim),
          m_config(config),
          m_edges(sim),
          m_subscribers{},
          m_subscriberCount(0),
          m_lastEdge(0),
          m_level(false),
          m_running(false)
    {
    }

    void ClockGenerator::start()
    {
        if (m_running)
        {
            return;
        }
        m_running = true;
        arm();
    }

    bool ClockGenerator::running() const
    {
        return m_running;
    }

    bool ClockGenerator::level() const
    {
        return m_level;
    }

    sim::Counter &ClockGenerator::edges()
    {
        return m_edges;
    }

    const sim::Counter &ClockGenerator::edges() const
    {
        return m_edges;
    }

    bool ClockGenerator::subscribe(ClockEdgeFn fn, void *arg)
    {
        if (fn == nullptr || m_subscriberCount >= kMaxClockSubscribers)
        {
            return false;
        }

        m_subscribers[m_subscriberCount].fn = fn;
        m_subscribers[m_subscriberCount].arg = arg;
        ++m_subscriberCount;
        return true;
    }

    sim::SimTime ClockGenerator::lastEdgeTime() const
    {
        return m_lastEdge;
    }

    // ---- Private helpers ----

    void ClockGenerator::onToggle(void *arg)
    {
        static_cast<ClockGenerator *>(arg)->toggle();
    }

    void ClockGenerator::toggle()
    {
        m_level = !m_level;
        m_lastEdge = m_sim.now();

        for (std::uint8_t i = 0; i < m_subscriberCount; ++i)
        {
            m_subscribers[i].fn(m_subscribers[i].arg, m_level);
        }

        m_edges.increment();
        arm();
    }

    void ClockGenerator::arm()
    {
        // Period is read here, at the half-cycle boundary
        sim::SimTime half = m_config.current().sclkPeriod / 2;
        if (half == 0)
        {
            half = 1;
        }

        if (m_sim.schedule(half, onToggle, this) == sim::kInvalidEventId)
        {
            m_sim.halt(sim::kSimErrFull);
        }
    }

}  // namespace bus
