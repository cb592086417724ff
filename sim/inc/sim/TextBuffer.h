// Fixed-capacity message builder.
//
// Diagnostics and console output are assembled here instead of with
// printf-style formatting.  Appends that would overflow are truncated;
// the buffer is always null-terminated.

#pragma once

#include "sim/Time.h"

#include <cstddef>
#include <cstdint>

namespace sim
{
    class TextBuffer
    {
    public:
        static constexpr std::size_t kCapacity = 160;

        TextBuffer();

        TextBuffer &append(const char *str);
        TextBuffer &append(char c);
        TextBuffer &appendUint(std::uint64_t value);
        TextBuffer &appendInt(std::int64_t value);

        // "0x" followed by at least minDigits lowercase hex digits
        TextBuffer &appendHex(std::uint32_t value, std::uint8_t minDigits = 1);

        // Largest unit that represents the value exactly: "250 ns", "1 ms", "20500 ps"
        TextBuffer &appendTime(SimTime time);

        // Pad with spaces up to the given column
        TextBuffer &padTo(std::size_t column);

        const char *c_str() const;
        std::size_t length() const;
        void clear();

    private:
        char m_data[kCapacity + 1];
        std::size_t m_length;
    };

}  // namespace sim
