#pragma once

#include <cstdint>

namespace sim
{
    // Simulation time in picoseconds.
    using SimTime = std::uint64_t;

    static constexpr SimTime kPicosecond = 1;
    static constexpr SimTime kNanosecond = 1000 * kPicosecond;
    static constexpr SimTime kMicrosecond = 1000 * kNanosecond;
    static constexpr SimTime kMillisecond = 1000 * kMicrosecond;

}  // namespace sim
