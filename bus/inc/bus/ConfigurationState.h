// Committed bus configuration.
//
// Written only by the Dispatcher (SetOption) and by the Controller before
// start.  Every setter validates first and then replaces the whole record,
// so a reader never sees a mode without its matching polarity/phase.
// The Transfer Engine copies the record at the start of each byte and
// keeps its copy until the byte completes.

#pragma once

#include "bus/SpiMode.h"
#include "sim/Time.h"

#include <cstdint>

namespace bus
{
    static constexpr sim::SimTime kMinSclkPeriod = 40 * sim::kNanosecond;
    static constexpr sim::SimTime kMaxSclkPeriod = 1 * sim::kMillisecond;
    static constexpr sim::SimTime kDefaultSclkPeriod = 250 * sim::kNanosecond;

    struct BusConfig
    {
        sim::SimTime sclkPeriod;
        SpiMode spiMode;
        ModeParameters mode;   // Always modeParameters(spiMode)
        bool burstMode;
    };

    // Called after every commit
    using ConfigWatchFn = void (*)(void *arg, const BusConfig &config);

    class ConfigurationState
    {
    public:
        ConfigurationState();

        const BusConfig &current() const;

        // Returns kBusOk or kBusErrOutOfRange (nothing committed)
        std::int32_t setSclkPeriod(sim::SimTime period);
        std::int32_t setSpiMode(std::int64_t value);
        void setBurstMode(bool enabled);

        // Single watcher; a second call replaces the first
        void watch(ConfigWatchFn fn, void *arg);

        // Incremented on every commit
        std::uint32_t generation() const;

    private:
        void commit(const BusConfig &next);

        BusConfig m_config;
        ConfigWatchFn m_watchFn;
        void *m_watchArg;
        std::uint32_t m_generation;
    };

    bool sclkPeriodInRange(sim::SimTime period);

}  // namespace bus
