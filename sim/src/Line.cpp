#include "sim/Line.h"

namespace sim
{
    Line::Line(const char *name, Level initial)
        : m_name(name),
          m_level(initial),
          m_watchers{},
          m_watcherCount(0),
          m_transitions(0)
    {
    }

    Level Line::level() const
    {
        return m_level;
    }

    const char *Line::name() const
    {
        return m_name;
    }

    bool Line::drive(Level level)
    {
        if (level == m_level)
        {
            return false;
        }

        m_level = level;
        ++m_transitions;

        for (std::uint8_t i = 0; i < m_watcherCount; ++i)
        {
            m_watchers[i].fn(m_watchers[i].arg, level);
        }
        return true;
    }

    bool Line::watch(LineWatchFn fn, void *arg)
    {
        if (fn == nullptr || m_watcherCount >= kMaxLineWatchers)
        {
            return false;
        }

        m_watchers[m_watcherCount].fn = fn;
        m_watchers[m_watcherCount].arg = arg;
        ++m_watcherCount;
        return true;
    }

    std::uint32_t Line::transitions() const
    {
        return m_transitions;
    }

    char levelChar(Level level)
    {
        switch (level)
        {
            case Level::Low:  return '0';
            case Level::High: return '1';
            default:          return 'z';
        }
    }

}  // namespace sim
