#pragma once

#include "sim/Line.h"

namespace bus
{
    // The four bus lines.  CSEL is active-low.  POCI belongs to the peer
    // and is never driven by the controller.
    struct BusLines
    {
        sim::Line sclk{"SCLK", sim::Level::Low};
        sim::Line csel{"CSEL", sim::Level::High};
        sim::Line pico{"PICO", sim::Level::HighZ};
        sim::Line poci{"POCI", sim::Level::HighZ};
    };

}  // namespace bus
