// Controller console: line-oriented command source for one Controller.
//
// Each command line becomes one Command on the controller's port; the
// console then runs the simulator until the command is acknowledged and
// prints the outcome.  Between command lines simulated time only moves
// through the "run" command.
//
// Usage:
//   1. Construct with the simulator and a started Controller
//   2. Call init() with an output function
//   3. Call prompt() once, then processChar() for each input character
//
// The console does not own any I/O -- it writes through a function pointer,
// so it can be driven from a terminal or from a test.

#pragma once

#include "bus/Command.h"
#include "bus/Controller.h"
#include "sim/Simulator.h"

#include <cstdint>

namespace bus
{
    // Function type for console output (writes a null-terminated string)
    using ConsoleWriteFn = void (*)(void *arg, const char *str);

    struct ConsoleConfig
    {
        ConsoleWriteFn writeFn = nullptr;
        void *arg = nullptr;

        // Longest simulated time a single command may take before the
        // console gives up waiting for its acknowledgement
        sim::SimTime commandTimeout = 1000 * sim::kMillisecond;
    };

    class Console
    {
    public:
        static constexpr std::uint8_t kMaxLineLength = 80;
        static constexpr std::uint8_t kMaxArgs = 2;

        Console(sim::Simulator &sim, Controller &controller);

        void init(const ConsoleConfig &config);

        // Handles line editing (backspace, enter) and command dispatch.
        void processChar(char c);

        void prompt();

        // Submit one command and run until it is acknowledged.
        // Returns the reply status, kBusErrHalted once the run has halted,
        // kBusErrBusy if an earlier command is still unacknowledged, or the
        // simulator status if the acknowledgement never came.
        std::int32_t execute(const Command &command, Reply &reply);

    private:
        using Handler = void (Console::*)(const std::int64_t *args);

        struct Entry
        {
            const char *name;
            std::uint8_t argCount;
            Handler handler;
            const char *usage;
        };

        static const Entry kCommands[];
        static const std::uint8_t kCommandCount;

        static void onReply(void *arg, const Reply &reply);

        void write(const char *str);
        void writeLine(const char *str);
        void executeLine(char *line);
        void report(std::int32_t status);
        void submitAndReport(const Command &command);

        void cmdHelp(const std::int64_t *args);
        void cmdVersion(const std::int64_t *args);
        void cmdSend(const std::int64_t *args);
        void cmdPost(const std::int64_t *args);
        void cmdWait(const std::int64_t *args);
        void cmdCycles(const std::int64_t *args);
        void cmdId(const std::int64_t *args);
        void cmdCount(const std::int64_t *args);
        void cmdPeriod(const std::int64_t *args);
        void cmdMode(const std::int64_t *args);
        void cmdBurst(const std::int64_t *args);
        void cmdOption(const std::int64_t *args);
        void cmdRun(const std::int64_t *args);
        void cmdStatus(const std::int64_t *args);

        sim::Simulator &m_sim;
        Controller &m_controller;
        ConsoleConfig m_config;

        char m_line[kMaxLineLength + 1];
        std::uint8_t m_linePos;

        Reply m_reply;
        bool m_replied;
        bool m_awaitingReply;
    };

    // Parse a decimal or 0x-prefixed hex number with an optional leading '-'.
    // Returns false if the text is empty, malformed or does not fit.
    bool parseNumber(const char *text, std::int64_t &value);

}  // namespace bus
