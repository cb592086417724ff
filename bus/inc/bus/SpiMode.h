// SPI mode table.
//
//   Mode  CPOL  Data changes on
//   0     0     leading edge
//   1     0     trailing edge
//   2     1     leading edge
//   3     1     trailing edge
//
// The leading edge of a bit cell is the clock leaving its idle level.

#pragma once

#include "sim/Line.h"

#include <cstdint>

namespace bus
{
    enum class SpiMode : std::uint8_t
    {
        Mode0 = 0,  // CPOL=0, leading edge
        Mode1,      // CPOL=0, trailing edge
        Mode2,      // CPOL=1, leading edge
        Mode3       // CPOL=1, trailing edge
    };

    struct ModeParameters
    {
        std::uint8_t clockPolarity;  // Idle level of SCLK (0 or 1)
        bool outputOnLeadingEdge;    // PICO changes on the leading edge of each cell
    };

    constexpr ModeParameters modeParameters(SpiMode mode)
    {
        return ModeParameters{
            static_cast<std::uint8_t>((mode == SpiMode::Mode2 || mode == SpiMode::Mode3) ? 1 : 0),
            !(mode == SpiMode::Mode1 || mode == SpiMode::Mode3),
        };
    }

    // Range-check a raw mode value.  Returns false (mode untouched) if the
    // value is not 0-3.
    bool spiModeFromValue(std::int64_t value, SpiMode &mode);

    inline sim::Level idleClockLevel(const ModeParameters &params)
    {
        return sim::toLevel(params.clockPolarity != 0);
    }

    inline sim::Level activeClockLevel(const ModeParameters &params)
    {
        return sim::toLevel(params.clockPolarity == 0);
    }

}  // namespace bus
