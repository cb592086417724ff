// Controller console implementation.
//
// All I/O goes through a function pointer; all timing comes from running
// the simulator, so the console behaves the same on a terminal and in a
// test.

#include "bus/Console.h"
#include "bus/Version.h"
#include "sim/TextBuffer.h"

#include <cstring>
#include <limits>

namespace bus
{
    const Console::Entry Console::kCommands[] =
    {
        {"help",    0, &Console::cmdHelp,    "help"},
        {"version", 0, &Console::cmdVersion, "version"},
        {"send",    1, &Console::cmdSend,    "send <byte>"},
        {"post",    1, &Console::cmdPost,    "post <byte>"},
        {"wait",    0, &Console::cmdWait,    "wait"},
        {"cycles",  1, &Console::cmdCycles,  "cycles <n>"},
        {"id",      0, &Console::cmdId,      "id"},
        {"count",   0, &Console::cmdCount,   "count"},
        {"period",  1, &Console::cmdPeriod,  "period <ns>"},
        {"mode",    1, &Console::cmdMode,    "mode <0-3>"},
        {"burst",   1, &Console::cmdBurst,   "burst <0|1>"},
        {"option",  2, &Console::cmdOption,  "option <id> <value>"},
        {"run",     1, &Console::cmdRun,     "run <ns>"},
        {"status",  0, &Console::cmdStatus,  "status"},
    };

    const std::uint8_t Console::kCommandCount =
        sizeof(Console::kCommands) / sizeof(Console::kCommands[0]);

    Console::Console(sim::Simulator &sim, Controller &controller)
        : m_sim(sim),
          m_controller(controller),
          m_config{},
          m_line{},
          m_linePos(0),
          m_reply{},
          m_replied(false),
          m_awaitingReply(false)
    {
    }

    void Console::init(const ConsoleConfig &config)
    {
        m_config = config;
        m_linePos = 0;
        m_line[0] = '\0';
    }

    void Console::processChar(char c)
    {
        // Enter (CR or LF)
        if (c == '\r' || c == '\n')
        {
            write("\r\n");
            m_line[m_linePos] = '\0';
            executeLine(m_line);
            m_linePos = 0;
            prompt();
            return;
        }

        // Backspace (0x08) or DEL (0x7F)
        if (c == '\b' || c == 0x7F)
        {
            if (m_linePos > 0)
            {
                --m_linePos;
                write("\b \b");
            }
            return;
        }

        if (c >= ' ' && c < 0x7F)
        {
            if (m_linePos < kMaxLineLength)
            {
                m_line[m_linePos++] = c;
                char echo[2] = {c, '\0'};
                write(echo);
            }
        }
    }

    void Console::prompt()
    {
        write("spi-sim> ");
    }

    std::int32_t Console::execute(const Command &command, Reply &reply)
    {
        // A command that timed out earlier still owns the port
        if (m_awaitingReply)
        {
            std::int32_t status = m_sim.runUntil(m_replied, m_config.commandTimeout);
            if (!m_replied)
            {
                return (status == sim::kSimErrTimeout) ? kBusErrBusy : status;
            }
            m_awaitingReply = false;
        }

        if (m_sim.halted())
        {
            return kBusErrHalted;
        }

        m_replied = false;
        std::int32_t status = m_controller.port().submit(command, onReply, this);
        if (status != kBusOk)
        {
            return status;
        }

        status = m_sim.runUntil(m_replied, m_config.commandTimeout);
        if (!m_replied)
        {
            m_awaitingReply = true;
            return status;
        }

        reply = m_reply;
        return reply.status;
    }

    void Console::onReply(void *arg, const Reply &reply)
    {
        Console *self = static_cast<Console *>(arg);
        self->m_reply = reply;
        self->m_replied = true;
    }

    // ---- Output ----

    void Console::write(const char *str)
    {
        if (m_config.writeFn != nullptr)
        {
            m_config.writeFn(m_config.arg, str);
        }
    }

    void Console::writeLine(const char *str)
    {
        write(str);
        write("\r\n");
    }

    void Console::report(std::int32_t status)
    {
        if (status == kBusOk)
        {
            writeLine("ok");
            return;
        }
        if (status == kBusErrHalted)
        {
            writeLine("halted");
            return;
        }

        sim::TextBuffer buf;
        buf.append("error: ").append(statusName(status));
        if (m_sim.halted())
        {
            buf.append(" (halted)");
        }
        writeLine(buf.c_str());
    }

    void Console::submitAndReport(const Command &command)
    {
        Reply reply{};
        report(execute(command, reply));
    }

    // ---- Parsing ----

    void Console::executeLine(char *line)
    {
        char *tokens[1 + kMaxArgs];
        std::uint8_t tokenCount = 0;
        bool extra = false;

        char *p = line;
        while (*p != '\0')
        {
            while (*p == ' ')
            {
                *p++ = '\0';
            }
            if (*p == '\0')
            {
                break;
            }
            if (tokenCount < 1 + kMaxArgs)
            {
                tokens[tokenCount++] = p;
            }
            else
            {
                extra = true;
            }
            while (*p != '\0' && *p != ' ')
            {
                ++p;
            }
        }

        // Empty line
        if (tokenCount == 0)
        {
            return;
        }

        for (std::uint8_t i = 0; i < kCommandCount; ++i)
        {
            const Entry &entry = kCommands[i];
            if (std::strcmp(tokens[0], entry.name) != 0)
            {
                continue;
            }

            std::int64_t args[kMaxArgs] = {};
            bool valid = !extra && (tokenCount - 1 == entry.argCount);
            for (std::uint8_t a = 0; valid && a < entry.argCount; ++a)
            {
                valid = parseNumber(tokens[1 + a], args[a]);
            }

            if (!valid)
            {
                write("usage: ");
                writeLine(entry.usage);
                return;
            }

            (this->*entry.handler)(args);
            return;
        }

        write("unknown command: ");
        writeLine(tokens[0]);
    }

    bool parseNumber(const char *text, std::int64_t &value)
    {
        if (text == nullptr)
        {
            return false;
        }

        bool negative = false;
        if (*text == '-')
        {
            negative = true;
            ++text;
        }

        std::uint64_t base = 10;
        if (text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        {
            base = 16;
            text += 2;
        }

        if (*text == '\0')
        {
            return false;
        }

        static constexpr std::uint64_t kLimit =
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

        std::uint64_t magnitude = 0;
        for (; *text != '\0'; ++text)
        {
            char c = *text;
            std::uint64_t digit;
            if (c >= '0' && c <= '9')
            {
                digit = static_cast<std::uint64_t>(c - '0');
            }
            else if (base == 16 && c >= 'a' && c <= 'f')
            {
                digit = static_cast<std::uint64_t>(c - 'a' + 10);
            }
            else if (base == 16 && c >= 'A' && c <= 'F')
            {
                digit = static_cast<std::uint64_t>(c - 'A' + 10);
            }
            else
            {
                return false;
            }

            if (magnitude > (kLimit - digit) / base)
            {
                return false;
            }
            magnitude = magnitude * base + digit;
        }

        value = negative ? -static_cast<std::int64_t>(magnitude)
                         : static_cast<std::int64_t>(magnitude);
        return true;
    }

    // ---- Commands ----

    void Console::cmdHelp(const std::int64_t *)
    {
        writeLine("commands:");
        writeLine("  help                - show this message");
        writeLine("  version             - show version");
        writeLine("  send <byte>         - transmit a byte and wait for it");
        writeLine("  post <byte>         - queue a byte without waiting");
        writeLine("  wait                - wait until every queued byte is sent");
        writeLine("  cycles <n>          - wait for n clock cycles");
        writeLine("  id                  - controller identity");
        writeLine("  count               - transfers accepted so far");
        writeLine("  period <ns>         - set the SCLK period");
        writeLine("  mode <0-3>          - set the SPI mode");
        writeLine("  burst <0|1>         - hold CSEL across queued bytes");
        writeLine("  option <id> <value> - raw SetOption");
        writeLine("  run <ns>            - advance simulated time");
        writeLine("  status              - controller and bus state");
    }

    void Console::cmdVersion(const std::int64_t *)
    {
        writeLine(version::kString);
    }

    void Console::cmdSend(const std::int64_t *args)
    {
        submitAndReport(makeSend(static_cast<std::uint8_t>(args[0] & 0xFF), true));
    }

    void Console::cmdPost(const std::int64_t *args)
    {
        submitAndReport(makeSend(static_cast<std::uint8_t>(args[0] & 0xFF), false));
    }

    void Console::cmdWait(const std::int64_t *)
    {
        submitAndReport(makeWaitForTransaction());
    }

    void Console::cmdCycles(const std::int64_t *args)
    {
        if (args[0] < 0 || args[0] > std::numeric_limits<std::uint32_t>::max())
        {
            writeLine("usage: cycles <n>");
            return;
        }
        submitAndReport(makeWaitForClockCycles(static_cast<std::uint32_t>(args[0])));
    }

    void Console::cmdId(const std::int64_t *)
    {
        Reply reply{};
        std::int32_t status = execute(makeGetControllerId(), reply);
        if (status != kBusOk)
        {
            report(status);
            return;
        }

        sim::TextBuffer buf;
        buf.append("controller ").appendUint(reply.controllerId)
           .append(" (").append(m_controller.name()).append(')');
        writeLine(buf.c_str());
    }

    void Console::cmdCount(const std::int64_t *)
    {
        Reply reply{};
        std::int32_t status = execute(makeGetTransactionCount(), reply);
        if (status != kBusOk)
        {
            report(status);
            return;
        }

        sim::TextBuffer buf;
        buf.append("transactions: ").appendUint(reply.transactionCount);
        writeLine(buf.c_str());
    }

    void Console::cmdPeriod(const std::int64_t *args)
    {
        static constexpr std::int64_t kMaxNs =
            std::numeric_limits<std::int64_t>::max() / static_cast<std::int64_t>(sim::kNanosecond);

        if (args[0] < 0 || args[0] > kMaxNs)
        {
            writeLine("usage: period <ns>");
            return;
        }
        submitAndReport(makeSetOption(OptionId::SclkPeriod,
                                      args[0] * static_cast<std::int64_t>(sim::kNanosecond)));
    }

    void Console::cmdMode(const std::int64_t *args)
    {
        submitAndReport(makeSetOption(OptionId::SpiMode, args[0]));
    }

    void Console::cmdBurst(const std::int64_t *args)
    {
        submitAndReport(makeSetOption(OptionId::BurstMode, args[0] != 0 ? 1 : 0));
    }

    void Console::cmdOption(const std::int64_t *args)
    {
        if (args[0] < std::numeric_limits<std::int32_t>::min() ||
            args[0] > std::numeric_limits<std::int32_t>::max())
        {
            writeLine("usage: option <id> <value>");
            return;
        }
        submitAndReport(makeSetOption(static_cast<std::int32_t>(args[0]), args[1]));
    }

    void Console::cmdRun(const std::int64_t *args)
    {
        static constexpr std::int64_t kMaxNs =
            std::numeric_limits<std::int64_t>::max() / static_cast<std::int64_t>(sim::kNanosecond);

        if (args[0] < 0 || args[0] > kMaxNs)
        {
            writeLine("usage: run <ns>");
            return;
        }
        if (m_sim.halted())
        {
            writeLine("halted");
            return;
        }

        std::int32_t status = m_sim.runFor(static_cast<sim::SimTime>(args[0]) * sim::kNanosecond);
        if (status != sim::kSimOk)
        {
            report(status);
            return;
        }

        sim::TextBuffer buf;
        buf.append("time: ").appendTime(m_sim.now());
        writeLine(buf.c_str());
    }

    void Console::cmdStatus(const std::int64_t *)
    {
        const BusConfig &config = m_controller.configuration().current();
        BusLines &lines = m_controller.lines();
        sim::TextBuffer buf;

        buf.append("time:").padTo(11).appendTime(m_sim.now());
        writeLine(buf.c_str());

        buf.clear();
        buf.append("state:").padTo(11).append(transferStateName(m_controller.engine().state()));
        if (m_sim.halted())
        {
            buf.append(" (halted: ").append(statusName(m_sim.haltStatus())).append(')');
        }
        writeLine(buf.c_str());

        buf.clear();
        buf.append("period:").padTo(11).appendTime(config.sclkPeriod);
        writeLine(buf.c_str());

        buf.clear();
        buf.append("mode:").padTo(11).appendUint(static_cast<std::uint8_t>(config.spiMode))
           .append(" (CPOL=").appendUint(config.mode.clockPolarity)
           .append(", data on ").append(config.mode.outputOnLeadingEdge ? "leading" : "trailing")
           .append(" edge)");
        writeLine(buf.c_str());

        buf.clear();
        buf.append("burst:").padTo(11).append(config.burstMode ? "on" : "off");
        writeLine(buf.c_str());

        buf.clear();
        buf.append("requests:").padTo(11).appendUint(m_controller.transmitRequestCount());
        writeLine(buf.c_str());

        buf.clear();
        buf.append("done:").padTo(11).appendUint(m_controller.transmitDoneCount());
        writeLine(buf.c_str());

        buf.clear();
        buf.append("queued:").padTo(11).appendUint(m_controller.transmitQueue().size());
        writeLine(buf.c_str());

        buf.clear();
        buf.append("lines:").padTo(11)
           .append("SCLK=").append(sim::levelChar(lines.sclk.level()))
           .append(" CSEL=").append(sim::levelChar(lines.csel.level()))
           .append(" PICO=").append(sim::levelChar(lines.pico.level()))
           .append(" POCI=").append(sim::levelChar(lines.poci.level()));
        writeLine(buf.c_str());
    }

}  // namespace bus
