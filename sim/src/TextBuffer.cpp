// Message builder.  Number conversion follows the shell helpers:
// digits are produced least-significant first into a scratch buffer
// and copied out reversed.

#include "sim/TextBuffer.h"

namespace sim
{
    TextBuffer::TextBuffer()
        : m_length(0)
    {
        m_data[0] = '\0';
    }

    TextBuffer &TextBuffer::append(const char *str)
    {
        if (str == nullptr)
        {
            return *this;
        }
        while (*str != '\0' && m_length < kCapacity)
        {
            m_data[m_length++] = *str++;
        }
        m_data[m_length] = '\0';
        return *this;
    }

    TextBuffer &TextBuffer::append(char c)
    {
        if (m_length < kCapacity)
        {
            m_data[m_length++] = c;
            m_data[m_length] = '\0';
        }
        return *this;
    }

    TextBuffer &TextBuffer::appendUint(std::uint64_t value)
    {
        char tmp[21];
        std::size_t len = 0;
        do
        {
            tmp[len++] = static_cast<char>('0' + (value % 10));
            value /= 10;
        } while (value > 0 && len < sizeof(tmp));

        while (len > 0)
        {
            append(tmp[--len]);
        }
        return *this;
    }

    TextBuffer &TextBuffer::appendInt(std::int64_t value)
    {
        if (value < 0)
        {
            append('-');
            // Negate in unsigned space so INT64_MIN is handled
            return appendUint(0 - static_cast<std::uint64_t>(value));
        }
        return appendUint(static_cast<std::uint64_t>(value));
    }

    TextBuffer &TextBuffer::appendHex(std::uint32_t value, std::uint8_t minDigits)
    {
        static constexpr char kHex[] = "0123456789abcdef";

        if (minDigits == 0)
        {
            minDigits = 1;
        }
        if (minDigits > 8)
        {
            minDigits = 8;
        }

        // Find first non-zero nibble, but keep at least minDigits
        int start = 28;
        while (start > 0 && ((value >> start) & 0xF) == 0 && start >= minDigits * 4)
        {
            start -= 4;
        }

        append("0x");
        for (int shift = start; shift >= 0; shift -= 4)
        {
            append(kHex[(value >> shift) & 0xF]);
        }
        return *this;
    }

    TextBuffer &TextBuffer::appendTime(SimTime time)
    {
        if (time != 0 && time % kMillisecond == 0)
        {
            return appendUint(time / kMillisecond).append(" ms");
        }
        if (time != 0 && time % kMicrosecond == 0)
        {
            return appendUint(time / kMicrosecond).append(" us");
        }
        if (time != 0 && time % kNanosecond == 0)
        {
            return appendUint(time / kNanosecond).append(" ns");
        }
        return appendUint(time).append(" ps");
    }

    TextBuffer &TextBuffer::padTo(std::size_t column)
    {
        while (m_length < column && m_length < kCapacity)
        {
            append(' ');
        }
        return *this;
    }

    const char *TextBuffer::c_str() const
    {
        return m_data;
    }

    std::size_t TextBuffer::length() const
    {
        return m_length;
    }

    void TextBuffer::clear()
    {
        m_length = 0;
        m_data[0] = '\0';
    }

}  // namespace sim
