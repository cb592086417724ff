#include "bus/BusTrace.h"
#include "bus/Version.h"
#include "sim/TextBuffer.h"

namespace bus
{
namespace
{
    // VCD identifier characters, one per line
    constexpr char kVcdIds[kTraceLineCount] = {'!', '"', '#', '$'};

    sim::Line &lineFor(BusLines &lines, TraceLine line)
    {
        switch (line)
        {
            case TraceLine::Sclk: return lines.sclk;
            case TraceLine::Csel: return lines.csel;
            case TraceLine::Pico: return lines.pico;
            default:              return lines.poci;
        }
    }

}  // namespace

    BusTrace::BusTrace(sim::Simulator &sim, BusLines &lines)
        : m_sim(sim),
          m_lines(lines)
    {
        for (std::uint8_t i = 0; i < kTraceLineCount; ++i)
        {
            TraceLine line = static_cast<TraceLine>(i);
            sim::Line &l = lineFor(m_lines, line);
            m_initial[i] = l.level();
            m_watches[i].trace = this;
            m_watches[i].line = line;
            l.watch(onLineChange, &m_watches[i]);
        }
    }

    const std::vector<TraceEntry> &BusTrace::entries() const
    {
        return m_entries;
    }

    std::vector<TraceEntry> BusTrace::transitions(TraceLine line) const
    {
        std::vector<TraceEntry> result;
        for (const TraceEntry &e : m_entries)
        {
            if (e.line == line)
            {
                result.push_back(e);
            }
        }
        return result;
    }

    std::vector<std::uint8_t> BusTrace::decode(const ModeParameters &mode) const
    {
        std::vector<std::uint8_t> bytes;

        sim::Level csel = m_initial[static_cast<std::uint8_t>(TraceLine::Csel)];
        sim::Level pico = m_initial[static_cast<std::uint8_t>(TraceLine::Pico)];
        sim::Level idle = idleClockLevel(mode);

        std::uint8_t shift = 0;
        std::uint8_t bits = 0;

        for (const TraceEntry &e : m_entries)
        {
            switch (e.line)
            {
                case TraceLine::Csel:
                    csel = e.level;
                    // Every frame starts from an empty shift register
                    shift = 0;
                    bits = 0;
                    break;

                case TraceLine::Pico:
                    pico = e.level;
                    break;

                case TraceLine::Sclk:
                {
                    if (csel != sim::Level::Low)
                    {
                        break;
                    }
                    bool leading = (e.level != idle);
                    if (leading != mode.outputOnLeadingEdge)
                    {
                        break;
                    }
                    // PICO is driven before SCLK, so it already holds the bit
                    shift = static_cast<std::uint8_t>((shift << 1) | (pico == sim::Level::High ? 1 : 0));
                    if (++bits == 8)
                    {
                        bytes.push_back(shift);
                        shift = 0;
                        bits = 0;
                    }
                    break;
                }

                default:
                    break;
            }
        }

        return bytes;
    }

    void BusTrace::writeVcd(TraceWriteFn fn, void *arg) const
    {
        if (fn == nullptr)
        {
            return;
        }

        sim::TextBuffer buf;
        buf.append("$version ").append(version::kString).append(" $end\n");
        fn(arg, buf.c_str());
        fn(arg, "$timescale 1ps $end\n");
        fn(arg, "$scope module spi $end\n");

        for (std::uint8_t i = 0; i < kTraceLineCount; ++i)
        {
            buf.clear();
            buf.append("$var wire 1 ").append(kVcdIds[i]).append(' ')
               .append(traceLineName(static_cast<TraceLine>(i))).append(" $end\n");
            fn(arg, buf.c_str());
        }

        fn(arg, "$upscope $end\n$enddefinitions $end\n$dumpvars\n");
        for (std::uint8_t i = 0; i < kTraceLineCount; ++i)
        {
            buf.clear();
            buf.append(sim::levelChar(m_initial[i])).append(kVcdIds[i]).append('\n');
            fn(arg, buf.c_str());
        }
        fn(arg, "$end\n");

        bool first = true;
        sim::SimTime lastTime = 0;
        for (const TraceEntry &e : m_entries)
        {
            buf.clear();
            if (first || e.time != lastTime)
            {
                buf.append('#').appendUint(e.time).append('\n');
                first = false;
                lastTime = e.time;
            }
            buf.append(sim::levelChar(e.level))
               .append(kVcdIds[static_cast<std::uint8_t>(e.line)]).append('\n');
            fn(arg, buf.c_str());
        }
    }

    void BusTrace::clear()
    {
        m_entries.clear();
        for (std::uint8_t i = 0; i < kTraceLineCount; ++i)
        {
            m_initial[i] = lineFor(m_lines, static_cast<TraceLine>(i)).level();
        }
    }

    // ---- Recording ----

    void BusTrace::onLineChange(void *arg, sim::Level level)
    {
        Watch *w = static_cast<Watch *>(arg);
        w->trace->record(w->line, level);
    }

    void BusTrace::record(TraceLine line, sim::Level level)
    {
        m_entries.push_back(TraceEntry{m_sim.now(), line, level});
    }

    const char *traceLineName(TraceLine line)
    {
        switch (line)
        {
            case TraceLine::Sclk: return "SCLK";
            case TraceLine::Csel: return "CSEL";
            case TraceLine::Pico: return "PICO";
            case TraceLine::Poci: return "POCI";
            default:              return "???";
        }
    }

}  // namespace bus
