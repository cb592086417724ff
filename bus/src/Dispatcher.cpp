// Command dispatcher.
//
// Every handler returns a status.  kBusOk with m_suspended set means the
// acknowledgement is deferred to onWaitComplete(); any negative status is
// fatal and is turned into FAILURE + halt at the single exit point in
// handle().

#include "bus/Dispatcher.h"
#include "sim/TextBuffer.h"

namespace bus
{
    Dispatcher::Dispatcher(sim::Simulator &sim, sim::Diagnostics &diag, CommandPort &port,
                           ConfigurationState &config, TransmitQueue &queue,
                           sim::Counter &requestCount, sim::Counter &doneCount,
                           sim::Counter &clockEdges)
        : m_sim(sim),
          m_diag(diag),
          m_port(port),
          m_config(config),
          m_queue(queue),
          m_requestCount(requestCount),
          m_doneCount(doneCount),
          m_clockEdges(clockEdges),
          m_identity{kInvalidControllerId, "spi"},
          m_current(CommandType::Unknown),
          m_suspended(false)
    {
    }

    void Dispatcher::start(const ControllerIdentity &identity)
    {
        m_identity = identity;
        m_port.attach(onRequest, this);
    }

    bool Dispatcher::suspended() const
    {
        return m_suspended;
    }

    CommandType Dispatcher::currentCommand() const
    {
        return m_current;
    }

    // ---- Event trampolines ----

    void Dispatcher::onRequest(void *arg, const Command &command)
    {
        static_cast<Dispatcher *>(arg)->handle(command);
    }

    void Dispatcher::onWaitComplete(void *arg)
    {
        Dispatcher *self = static_cast<Dispatcher *>(arg);
        self->m_suspended = false;
        self->acknowledge(kBusOk);
    }

    // ---- Dispatch ----

    void Dispatcher::handle(const Command &command)
    {
        // A violation may arrive while a request is parked; it is fatal
        // regardless, so it does not touch m_current.
        if (command.type != CommandType::MultipleDriverDetected)
        {
            m_current = command.type;
        }

        std::int32_t status = kBusOk;

        switch (command.type)
        {
            case CommandType::Send:
                status = handleSend(command);
                break;

            case CommandType::WaitForTransaction:
                status = handleWaitForTransaction();
                break;

            case CommandType::WaitForClockCycles:
                status = handleWaitForClockCycles(command);
                break;

            case CommandType::GetControllerId:
            case CommandType::GetTransactionCount:
                // Reply fields are filled in acknowledge()
                break;

            case CommandType::SetOption:
                status = handleSetOption(command);
                break;

            case CommandType::MultipleDriverDetected:
                status = reportMultipleDriver(command);
                break;

            default:
                status = reportUnknown(command);
                break;
        }

        if (status != kBusOk)
        {
            // fail() has already reported; the caller learns the status
            acknowledge(status);
            return;
        }

        if (!m_suspended)
        {
            acknowledge(kBusOk);
        }
    }

    std::int32_t Dispatcher::handleSend(const Command &command)
    {
        m_queue.push(command.data);
        m_requestCount.increment();
        std::uint64_t position = m_requestCount.value();

        sim::TextBuffer msg;
        msg.append(m_identity.name).append(": send ").appendHex(command.data, 2)
           .append(command.blocking ? " (blocking" : " (non-blocking")
           .append(", request ").appendUint(position).append(')');
        m_diag.debug(msg.c_str());

        if (!command.blocking)
        {
            return kBusOk;
        }

        // Wait for this byte and everything queued ahead of it
        return suspendUntil(m_doneCount, position);
    }

    std::int32_t Dispatcher::handleWaitForTransaction()
    {
        if (m_doneCount.value() == m_requestCount.value())
        {
            return kBusOk;
        }
        return suspendUntil(m_doneCount, m_requestCount.value());
    }

    std::int32_t Dispatcher::handleWaitForClockCycles(const Command &command)
    {
        std::uint64_t edges = static_cast<std::uint64_t>(command.cycles) * kEdgesPerWaitCycle;
        if (edges == 0)
        {
            return kBusOk;
        }
        return suspendUntil(m_clockEdges, m_clockEdges.value() + edges);
    }

    std::int32_t Dispatcher::handleSetOption(const Command &command)
    {
        sim::TextBuffer msg;
        msg.append(m_identity.name).append(": ");

        switch (command.optionId)
        {
            case static_cast<std::int32_t>(OptionId::SclkPeriod):
            {
                if (command.optionValue <= 0 ||
                    m_config.setSclkPeriod(static_cast<sim::SimTime>(command.optionValue)) != kBusOk)
                {
                    msg.append("SCLK period ").appendInt(command.optionValue)
                       .append(" ps outside [").appendTime(kMinSclkPeriod)
                       .append(", ").appendTime(kMaxSclkPeriod).append(']');
                    fail(kBusErrOutOfRange, msg.c_str());
                    return kBusErrOutOfRange;
                }
                msg.append("SCLK period set to ").appendTime(m_config.current().sclkPeriod);
                m_diag.info(msg.c_str());
                return kBusOk;
            }

            case static_cast<std::int32_t>(OptionId::SpiMode):
            {
                if (m_config.setSpiMode(command.optionValue) != kBusOk)
                {
                    msg.append("SPI mode ").appendInt(command.optionValue)
                       .append(" outside [0, 3]");
                    fail(kBusErrOutOfRange, msg.c_str());
                    return kBusErrOutOfRange;
                }
                const BusConfig &cfg = m_config.current();
                msg.append("SPI mode set to ").appendUint(static_cast<std::uint8_t>(cfg.spiMode))
                   .append(" (CPOL=").appendUint(cfg.mode.clockPolarity)
                   .append(cfg.mode.outputOnLeadingEdge ? ", data on leading edge)"
                                                        : ", data on trailing edge)");
                m_diag.info(msg.c_str());
                return kBusOk;
            }

            case static_cast<std::int32_t>(OptionId::BurstMode):
            {
                m_config.setBurstMode(command.optionValue != 0);
                msg.append("burst mode ").append(command.optionValue != 0 ? "enabled" : "disabled");
                m_diag.info(msg.c_str());
                return kBusOk;
            }

            default:
                msg.append("SetOption: unknown option ").appendInt(command.optionId);
                fail(kBusErrInvalidOption, msg.c_str());
                return kBusErrInvalidOption;
        }
    }

    std::int32_t Dispatcher::reportMultipleDriver(const Command &command)
    {
        sim::TextBuffer msg;
        msg.append(m_identity.name).append(": multiple drivers on the command port (request ")
           .appendUint(command.sequence).append(')');
        fail(kBusErrMultipleDriver, msg.c_str());
        return kBusErrMultipleDriver;
    }

    std::int32_t Dispatcher::reportUnknown(const Command &command)
    {
        sim::TextBuffer msg;
        msg.append(m_identity.name).append(": unimplemented command ");
        if (command.type == CommandType::Unknown && command.label != nullptr)
        {
            msg.append(command.label);
        }
        else
        {
            msg.append(commandName(command.type));
        }
        fail(kBusErrUnimplemented, msg.c_str());
        return kBusErrUnimplemented;
    }

    // ---- Helpers ----

    std::int32_t Dispatcher::suspendUntil(sim::Counter &counter, std::uint64_t target)
    {
        if (!counter.waitUntilAtLeast(target, onWaitComplete, this))
        {
            sim::TextBuffer msg;
            msg.append(m_identity.name).append(": ").append(commandName(m_current))
               .append(": wait table full");
            fail(sim::kSimErrFull, msg.c_str());
            return sim::kSimErrFull;
        }
        m_suspended = true;
        return kBusOk;
    }

    void Dispatcher::acknowledge(std::int32_t status)
    {
        Reply reply{};
        reply.status = status;
        reply.controllerId = m_identity.id;
        reply.transactionCount = m_requestCount.value();

        // Nothing outstanding happens only for a violation raised after
        // the original request was already answered
        if (m_port.acknowledge(reply) != kBusOk && status == kBusOk)
        {
            m_diag.failure("dispatcher: acknowledge without an outstanding request");
            m_sim.halt(kBusErrBusy);
        }
    }

    void Dispatcher::fail(std::int32_t status, const char *message)
    {
        m_diag.failure(message);
        m_sim.halt(status);
    }

}  // namespace bus
