#include "bus/Controller.h"
#include "sim/TextBuffer.h"

namespace bus
{
namespace
{
    ControllerId s_nextControllerId = 1;

}  // namespace

    ControllerId allocateControllerId()
    {
        if (s_nextControllerId == kInvalidControllerId)
        {
            // Wrapped; skip the invalid handle
            ++s_nextControllerId;
        }
        return s_nextControllerId++;
    }

    Controller::Controller(sim::Simulator &sim, sim::Diagnostics &diag,
                           const ControllerConfig &config)
        : m_diag(diag),
          m_settings(config),
          m_config(),
          m_queue(),
          m_requestCount(sim),
          m_doneCount(sim),
          m_receiveCount(sim),
          m_lines(),
          m_clock(sim, m_config),
          m_port(sim),
          m_engine(sim, diag, m_clock, m_config, m_queue, m_requestCount, m_doneCount, m_lines),
          m_dispatcher(sim, diag, m_port, m_config, m_queue, m_requestCount, m_doneCount,
                       m_clock.edges()),
          m_id(kInvalidControllerId),
          m_started(false)
    {
        if (m_settings.name == nullptr)
        {
            m_settings.name = "spi";
        }
    }

    std::int32_t Controller::start()
    {
        if (m_started)
        {
            return kBusErrBusy;
        }

        sim::TextBuffer msg;
        msg.append(m_settings.name).append(": ");

        // Validate everything before committing anything
        SpiMode mode;
        if (!sclkPeriodInRange(m_settings.sclkPeriod))
        {
            msg.append("configured SCLK period ").appendTime(m_settings.sclkPeriod)
               .append(" outside [").appendTime(kMinSclkPeriod)
               .append(", ").appendTime(kMaxSclkPeriod).append(']');
            m_diag.failure(msg.c_str());
            return kBusErrOutOfRange;
        }
        if (!spiModeFromValue(static_cast<std::uint8_t>(m_settings.mode), mode))
        {
            msg.append("configured SPI mode ")
               .appendUint(static_cast<std::uint8_t>(m_settings.mode)).append(" outside [0, 3]");
            m_diag.failure(msg.c_str());
            return kBusErrOutOfRange;
        }

        if (m_config.setSclkPeriod(m_settings.sclkPeriod) != kBusOk ||
            m_config.setSpiMode(static_cast<std::uint8_t>(mode)) != kBusOk)
        {
            return kBusErrOutOfRange;
        }
        m_config.setBurstMode(m_settings.burstMode);

        m_id = allocateControllerId();

        TransferEngineConfig engineConfig{};
        engineConfig.name = m_settings.name;
        engineConfig.picoIdleLevel = m_settings.picoIdleLevel;
        if (!m_engine.start(engineConfig))
        {
            msg.append("clock subscriber table full");
            m_diag.failure(msg.c_str());
            return sim::kSimErrFull;
        }

        m_clock.start();
        m_dispatcher.start(ControllerIdentity{m_id, m_settings.name});
        m_started = true;

        const BusConfig &cfg = m_config.current();
        msg.append("controller ").appendUint(m_id).append(" started, SCLK period ")
           .appendTime(cfg.sclkPeriod).append(", mode ")
           .appendUint(static_cast<std::uint8_t>(cfg.spiMode))
           .append(cfg.burstMode ? ", burst" : "");
        m_diag.info(msg.c_str());
        return kBusOk;
    }

    bool Controller::started() const
    {
        return m_started;
    }

    ControllerId Controller::id() const
    {
        return m_id;
    }

    const char *Controller::name() const
    {
        return m_settings.name;
    }

    CommandPort &Controller::port()
    {
        return m_port;
    }

    BusLines &Controller::lines()
    {
        return m_lines;
    }

    ClockGenerator &Controller::clock()
    {
        return m_clock;
    }

    const ConfigurationState &Controller::configuration() const
    {
        return m_config;
    }

    const TransmitQueue &Controller::transmitQueue() const
    {
        return m_queue;
    }

    const TransferEngine &Controller::engine() const
    {
        return m_engine;
    }

    const Dispatcher &Controller::dispatcher() const
    {
        return m_dispatcher;
    }

    std::uint64_t Controller::transmitRequestCount() const
    {
        return m_requestCount.value();
    }

    std::uint64_t Controller::transmitDoneCount() const
    {
        return m_doneCount.value();
    }

    std::uint64_t Controller::receiveCount() const
    {
        return m_receiveCount.value();
    }

}  // namespace bus
