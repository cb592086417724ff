#pragma once

#include <cstdint>

namespace sim
{
    enum class Level : std::uint8_t
    {
        Low = 0,
        High = 1,
        HighZ = 2  // Not driven
    };

    // Called synchronously from drive() when the level changes
    using LineWatchFn = void (*)(void *arg, Level level);

    static constexpr std::uint8_t kMaxLineWatchers = 4;

    // A named single-bit bus line with exactly one driver.
    class Line
    {
    public:
        Line(const char *name, Level initial);

        Level level() const;
        const char *name() const;

        // Set the level.  Watchers run only on an actual change.
        // Returns true if the level changed.
        bool drive(Level level);

        // Register a watcher.  Returns false if the watcher table is full.
        bool watch(LineWatchFn fn, void *arg);

        // Number of level changes since construction
        std::uint32_t transitions() const;

    private:
        struct Watcher
        {
            LineWatchFn fn;
            void *arg;
        };

        const char *m_name;
        Level m_level;
        Watcher m_watchers[kMaxLineWatchers];
        std::uint8_t m_watcherCount;
        std::uint32_t m_transitions;
    };

    inline Level toLevel(bool high)
    {
        return high ? Level::High : Level::Low;
    }

    // '0', '1' or 'z'
    char levelChar(Level level);

}  // namespace sim
