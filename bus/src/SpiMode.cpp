#include "bus/SpiMode.h"

namespace bus
{
    bool spiModeFromValue(std::int64_t value, SpiMode &mode)
    {
        switch (value)
        {
            case 0: mode = SpiMode::Mode0; return true;
            case 1: mode = SpiMode::Mode1; return true;
            case 2: mode = SpiMode::Mode2; return true;
            case 3: mode = SpiMode::Mode3; return true;
            default: return false;
        }
    }

}  // namespace bus
