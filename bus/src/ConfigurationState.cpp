#include "bus/ConfigurationState.h"
#include "bus/Command.h"

namespace bus
{
    ConfigurationState::ConfigurationState()
        : m_config{kDefaultSclkPeriod, SpiMode::Mode0, modeParameters(SpiMode::Mode0), false},
          m_watchFn(nullptr),
          m_watchArg(nullptr),
          m_generation(0)
    {
    }

    const BusConfig &ConfigurationState::current() const
    {
        return m_config;
    }

    std::int32_t ConfigurationState::setSclkPeriod(sim::SimTime period)
    {
        if (!sclkPeriodInRange(period))
        {
            return kBusErrOutOfRange;
        }

        BusConfig next = m_config;
        next.sclkPeriod = period;
        commit(next);
        return kBusOk;
    }

    std::int32_t ConfigurationState::setSpiMode(std::int64_t value)
    {
        SpiMode mode;
        if (!spiModeFromValue(value, mode))
        {
            return kBusErrOutOfRange;
        }

        BusConfig next = m_config;
        next.spiMode = mode;
        next.mode = modeParameters(mode);
        commit(next);
        return kBusOk;
    }

    void ConfigurationState::setBurstMode(bool enabled)
    {
        BusConfig next = m_config;
        next.burstMode = enabled;
        commit(next);
    }

    void ConfigurationState::watch(ConfigWatchFn fn, void *arg)
    {
        m_watchFn = fn;
        m_watchArg = arg;
    }

    std::uint32_t ConfigurationState::generation() const
    {
        return m_generation;
    }

    void ConfigurationState::commit(const BusConfig &next)
    {
        m_config = next;
        ++m_generation;

        if (m_watchFn != nullptr)
        {
            m_watchFn(m_watchArg, m_config);
        }
    }

    bool sclkPeriodInRange(sim::SimTime period)
    {
        return period >= kMinSclkPeriod && period <= kMaxSclkPeriod;
    }

}  // namespace bus
