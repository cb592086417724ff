// Transfer engine.
//
// Suspension points are registrations, not loops:
//   - waiting for work: one-shot wait on the request counter
//   - waiting for a cell boundary: the clock edge subscription, filtered
//     by state
//
// A byte occupies eight cells; the rising edge after bit 0's trailing edge
// closes the last cell and completes the byte.
//
// Back-to-back bytes: with burst mode enabled CSEL stays low and that same
// rising edge opens the next byte's first cell.  Without burst mode every
// byte is framed on its own: CSEL is released at completion, reasserted on
// the following falling edge, and shifting starts on the rising edge after.

#include "bus/TransferEngine.h"
#include "sim/TextBuffer.h"

namespace bus
{
    TransferEngine::TransferEngine(sim::Simulator &sim, sim::Diagnostics &diag,
                                   ClockGenerator &clock, ConfigurationState &config,
                                   TransmitQueue &queue, sim::Counter &requestCount,
                                   sim::Counter &doneCount, BusLines &lines)
        : m_sim(sim),
          m_diag(diag),
          m_clock(clock),
          m_config(config),
          m_queue(queue),
          m_requestCount(requestCount),
          m_doneCount(doneCount),
          m_lines(lines),
          m_settings{},
          m_snapshot(config.current()),
          m_state(TransferState::Idle),
          m_data(0),
          m_bitIndex(0),
          m_lastCellOpen(false),
          m_waitingForRequest(false),
          m_reselectPending(false)
    {
    }

    bool TransferEngine::start(const TransferEngineConfig &config)
    {
        m_settings = config;
        m_snapshot = m_config.current();
        m_state = TransferState::Idle;

        if (!m_clock.subscribe(onClockEdge, this))
        {
            return false;
        }
        m_config.watch(onConfigCommitted, this);

        driveIdleLines();
        waitForRequest();
        return true;
    }

    TransferState TransferEngine::state() const
    {
        return m_state;
    }

    std::uint8_t TransferEngine::bitIndex() const
    {
        return m_bitIndex;
    }

    std::uint8_t TransferEngine::currentByte() const
    {
        return m_data;
    }

    const BusConfig &TransferEngine::snapshot() const
    {
        return m_snapshot;
    }

    // ---- Event trampolines ----

    void TransferEngine::onClockEdge(void *arg, bool rising)
    {
        static_cast<TransferEngine *>(arg)->handleEdge(rising);
    }

    void TransferEngine::onRequest(void *arg)
    {
        static_cast<TransferEngine *>(arg)->handleRequest();
    }

    void TransferEngine::onConfigCommitted(void *arg, const BusConfig &)
    {
        static_cast<TransferEngine *>(arg)->handleConfigCommitted();
    }

    // ---- State machine ----

    void TransferEngine::handleEdge(bool rising)
    {
        switch (m_state)
        {
            case TransferState::Idle:
                // Between unbatched bytes CSEL stays released for half a cycle
                if (!rising && m_reselectPending)
                {
                    m_reselectPending = false;
                    if (!m_queue.empty())
                    {
                        beginByte();
                    }
                    else
                    {
                        waitForRequest();
                    }
                }
                break;

            case TransferState::SelectAsserted:
                if (rising)
                {
                    m_state = TransferState::Shifting;
                    leadingEdge();
                }
                break;

            case TransferState::Shifting:
                if (!rising)
                {
                    trailingEdge();
                }
                else if (m_lastCellOpen)
                {
                    // The rising edge after bit 0 closes the eighth cell
                    complete();
                }
                else
                {
                    leadingEdge();
                }
                break;

            case TransferState::Complete:
                // Complete never outlives the edge that entered it
                break;
        }
    }

    void TransferEngine::handleRequest()
    {
        m_waitingForRequest = false;

        if (m_state != TransferState::Idle || m_reselectPending)
        {
            return;
        }

        if (m_queue.empty())
        {
            waitForRequest();
            return;
        }

        beginByte();
    }

    void TransferEngine::handleConfigCommitted()
    {
        // Idle lines follow the configuration; an active byte keeps its snapshot
        if (m_state == TransferState::Idle)
        {
            m_snapshot = m_config.current();
            driveIdleLines();
        }
    }

    void TransferEngine::driveIdleLines()
    {
        m_lines.csel.drive(sim::Level::High);
        m_lines.pico.drive(m_settings.picoIdleLevel);
        m_lines.sclk.drive(idleClockLevel(m_snapshot.mode));
    }

    void TransferEngine::waitForRequest()
    {
        if (m_waitingForRequest)
        {
            return;
        }

        // Any change of the request counter means a byte was queued
        if (!m_requestCount.waitUntilAtLeast(m_requestCount.value() + 1, onRequest, this))
        {
            m_diag.failure("transfer engine: request wait table full");
            m_sim.halt(sim::kSimErrFull);
            return;
        }
        m_waitingForRequest = true;
    }

    void TransferEngine::beginByte()
    {
        if (!m_queue.pop(m_data))
        {
            return;
        }

        m_snapshot = m_config.current();
        m_state = TransferState::SelectAsserted;
        m_bitIndex = 7;
        m_lastCellOpen = false;

        m_lines.sclk.drive(idleClockLevel(m_snapshot.mode));
        m_lines.csel.drive(sim::Level::Low);

        sim::TextBuffer msg;
        msg.append(m_settings.name).append(": transfer ").appendHex(m_data, 2)
           .append(" started (mode ").appendUint(static_cast<std::uint8_t>(m_snapshot.spiMode))
           .append(')');
        m_diag.debug(msg.c_str());
    }

    void TransferEngine::leadingEdge()
    {
        // PICO first so the bit is valid when SCLK moves
        if (m_snapshot.mode.outputOnLeadingEdge)
        {
            driveBit();
        }
        m_lines.sclk.drive(activeClockLevel(m_snapshot.mode));
    }

    void TransferEngine::trailingEdge()
    {
        if (!m_snapshot.mode.outputOnLeadingEdge)
        {
            driveBit();
        }
        m_lines.sclk.drive(idleClockLevel(m_snapshot.mode));

        if (m_bitIndex == 0)
        {
            m_lastCellOpen = true;
            return;
        }
        --m_bitIndex;
    }

    void TransferEngine::driveBit()
    {
        m_lines.pico.drive(sim::toLevel(((m_data >> m_bitIndex) & 0x01) != 0));
    }

    void TransferEngine::complete()
    {
        m_state = TransferState::Complete;
        m_lastCellOpen = false;
        m_doneCount.increment();

        sim::TextBuffer msg;
        msg.append(m_settings.name).append(": transfer ").appendHex(m_data, 2)
           .append(" complete (").appendUint(m_doneCount.value()).append(" done)");
        m_diag.debug(msg.c_str());

        // Burst: keep the frame open; this rising edge is the next byte's first cell.
        // A polarity change cannot take effect inside a frame, so it ends the burst.
        const BusConfig &next = m_config.current();
        if (next.burstMode && !m_queue.empty() &&
            next.mode.clockPolarity == m_snapshot.mode.clockPolarity)
        {
            beginByte();
            m_state = TransferState::Shifting;
            leadingEdge();
            return;
        }

        m_state = TransferState::Idle;
        m_snapshot = m_config.current();
        driveIdleLines();

        if (!m_queue.empty())
        {
            m_reselectPending = true;
        }
        else
        {
            waitForRequest();
        }
    }

    const char *transferStateName(TransferState state)
    {
        switch (state)
        {
            case TransferState::Idle:           return "Idle";
            case TransferState::SelectAsserted: return "SelectAsserted";
            case TransferState::Shifting:       return "Shifting";
            case TransferState::Complete:       return "Complete";
            default:                            return "???";
        }
    }

}  // namespace bus
