#include "bus/TransmitQueue.h"

namespace bus
{
    TransmitQueue::TransmitQueue()
        : m_pushed(0),
          m_popped(0)
    {
    }

    void TransmitQueue::push(std::uint8_t data)
    {
        m_bytes.push_back(data);
        ++m_pushed;
    }

    bool TransmitQueue::pop(std::uint8_t &data)
    {
        if (m_bytes.empty())
        {
            return false;
        }

        data = m_bytes.front();
        m_bytes.pop_front();
        ++m_popped;
        return true;
    }

    bool TransmitQueue::empty() const
    {
        return m_bytes.empty();
    }

    std::uint32_t TransmitQueue::size() const
    {
        return static_cast<std::uint32_t>(m_bytes.size());
    }

    std::uint32_t TransmitQueue::pushedCount() const
    {
        return m_pushed;
    }

    std::uint32_t TransmitQueue::poppedCount() const
    {
        return m_popped;
    }

}  // namespace bus
