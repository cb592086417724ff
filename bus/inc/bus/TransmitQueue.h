#pragma once

#include <cstdint>
#include <deque>

namespace bus
{
    // FIFO of bytes awaiting transfer.
    // The Dispatcher is the only caller of push(), the Transfer Engine the
    // only caller of pop().
    class TransmitQueue
    {
    public:
        TransmitQueue();

        void push(std::uint8_t data);

        // Remove the oldest byte.  Returns false if the queue is empty.
        bool pop(std::uint8_t &data);

        bool empty() const;
        std::uint32_t size() const;

        std::uint32_t pushedCount() const;
        std::uint32_t poppedCount() const;

    private:
        std::deque<std::uint8_t> m_bytes;
        std::uint32_t m_pushed;
        std::uint32_t m_popped;
    };

}  // namespace bus
