#pragma once

// Bus line recorder.
//
// Watches the four lines and records every transition with its time.
// The recording can be decoded back into the bytes presented on PICO and
// written out as a value change dump (VCD, 1 ps timescale) for a waveform
// viewer.

#include "bus/BusLines.h"
#include "bus/SpiMode.h"
#include "sim/Line.h"
#include "sim/Simulator.h"

#include <cstdint>
#include <vector>

namespace bus
{
    enum class TraceLine : std::uint8_t
    {
        Sclk = 0,
        Csel,
        Pico,
        Poci
    };

    static constexpr std::uint8_t kTraceLineCount = 4;

    struct TraceEntry
    {
        sim::SimTime time;
        TraceLine line;
        sim::Level level;
    };

    // Output function for writeVcd (writes a null-terminated string)
    using TraceWriteFn = void (*)(void *arg, const char *str);

    class BusTrace
    {
    public:
        // Starts recording immediately.  The initial levels are the lines'
        // levels at construction.
        BusTrace(sim::Simulator &sim, BusLines &lines);

        const std::vector<TraceEntry> &entries() const;

        // Transitions of one line, in time order
        std::vector<TraceEntry> transitions(TraceLine line) const;

        // Bytes presented on PICO: one bit per designated output edge of
        // SCLK while CSEL is low, MSB first.  A frame that ends before
        // eight bits contributes nothing.
        std::vector<std::uint8_t> decode(const ModeParameters &mode) const;

        void writeVcd(TraceWriteFn fn, void *arg) const;

        // Forget recorded transitions; the current levels become the new
        // initial levels.
        void clear();

    private:
        struct Watch
        {
            BusTrace *trace;
            TraceLine line;
        };

        static void onLineChange(void *arg, sim::Level level);
        void record(TraceLine line, sim::Level level);

        sim::Simulator &m_sim;
        BusLines &m_lines;
        Watch m_watches[kTraceLineCount];
        sim::Level m_initial[kTraceLineCount];
        std::vector<TraceEntry> m_entries;
    };

    const char *traceLineName(TraceLine line);

}  // namespace bus
