// Console tests.
//
// Tests line editing, command parsing and the command round trip through
// a real controller, using a string buffer for output.

#include "bus/Console.h"
#include "bus/Version.h"
#include "BusBench.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace
{
    std::string g_output;

    void mockWrite(void *arg, const char *str)
    {
        (void)arg;
        g_output += str;
    }

}  // namespace

class ConsoleTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        g_output.clear();
        ASSERT_EQ(m_bench.controller.start(), bus::kBusOk);

        bus::ConsoleConfig config{};
        config.writeFn = mockWrite;
        m_console.init(config);
    }

    void sendLine(const char *cmd)
    {
        for (const char *p = cmd; *p != '\0'; ++p)
        {
            m_console.processChar(*p);
        }
        m_console.processChar('\r');
    }

    // Output of one command line, without the echo and the next prompt
    std::string run(const char *cmd)
    {
        g_output.clear();
        sendLine(cmd);
        std::string out = g_output;
        std::string echo = std::string(cmd) + "\r\n";
        if (out.compare(0, echo.size(), echo) == 0)
        {
            out.erase(0, echo.size());
        }
        static const std::string kPrompt = "spi-sim> ";
        if (out.size() >= kPrompt.size() &&
            out.compare(out.size() - kPrompt.size(), kPrompt.size(), kPrompt) == 0)
        {
            out.erase(out.size() - kPrompt.size());
        }
        return out;
    }

    test::BusBench m_bench;
    bus::Console m_console{m_bench.simulator, m_bench.controller};
};

// ---- Prompt and line editing ----

TEST_F(ConsoleTest, Prompt_PrintsExpectedString)
{
    m_console.prompt();
    EXPECT_EQ(g_output, "spi-sim> ");
}

TEST_F(ConsoleTest, Echo_PrintableCharsEchoed)
{
    m_console.processChar('a');
    m_console.processChar('b');
    EXPECT_EQ(g_output, "ab");
}

TEST_F(ConsoleTest, Echo_ControlCharsNotEchoed)
{
    m_console.processChar('\x01');
    EXPECT_EQ(g_output, "");
}

TEST_F(ConsoleTest, Enter_EmptyLineShowsPrompt)
{
    m_console.processChar('\r');
    EXPECT_EQ(g_output, "\r\nspi-sim> ");
}

TEST_F(ConsoleTest, Backspace_ErasesLastChar)
{
    m_console.processChar('x');
    m_console.processChar('\b');
    EXPECT_EQ(g_output, "x\b \b");

    // "idx" with the x erased by DEL runs "id"
    g_output.clear();
    m_console.processChar('i');
    m_console.processChar('d');
    m_console.processChar('x');
    m_console.processChar(0x7F);
    m_console.processChar('\r');
    EXPECT_NE(g_output.find("controller "), std::string::npos);
}

TEST_F(ConsoleTest, Backspace_OnEmptyLineIgnored)
{
    m_console.processChar('\b');
    EXPECT_EQ(g_output, "");
}

TEST_F(ConsoleTest, LongLine_Truncated)
{
    for (int i = 0; i < bus::Console::kMaxLineLength + 10; ++i)
    {
        m_console.processChar('a');
    }
    EXPECT_EQ(g_output.size(), static_cast<std::size_t>(bus::Console::kMaxLineLength));
}

// ---- Parsing ----

TEST_F(ConsoleTest, Unknown_CommandReported)
{
    EXPECT_EQ(run("frobnicate"), "unknown command: frobnicate\r\n");
}

TEST_F(ConsoleTest, Usage_WrongArgumentCount)
{
    EXPECT_EQ(run("send"), "usage: send <byte>\r\n");
    EXPECT_EQ(run("send 1 2"), "usage: send <byte>\r\n");
    EXPECT_EQ(run("option 1"), "usage: option <id> <value>\r\n");
}

TEST_F(ConsoleTest, Usage_MalformedNumber)
{
    EXPECT_EQ(run("send 0xZZ"), "usage: send <byte>\r\n");
    EXPECT_EQ(run("cycles -1"), "usage: cycles <n>\r\n");
}

TEST_F(ConsoleTest, Parse_ExtraSpacesIgnored)
{
    EXPECT_EQ(run("   count  "), "transactions: 0\r\n");
}

TEST(ConsoleParseTest, Numbers_DecimalAndHex)
{
    std::int64_t value = 0;
    EXPECT_TRUE(bus::parseNumber("250", value));
    EXPECT_EQ(value, 250);
    EXPECT_TRUE(bus::parseNumber("0x50", value));
    EXPECT_EQ(value, 0x50);
    EXPECT_TRUE(bus::parseNumber("0XfF", value));
    EXPECT_EQ(value, 0xFF);
    EXPECT_TRUE(bus::parseNumber("-3", value));
    EXPECT_EQ(value, -3);
}

TEST(ConsoleParseTest, Numbers_Rejected)
{
    std::int64_t value = 7;
    EXPECT_FALSE(bus::parseNumber("", value));
    EXPECT_FALSE(bus::parseNumber("0x", value));
    EXPECT_FALSE(bus::parseNumber("12a", value));
    EXPECT_FALSE(bus::parseNumber("99999999999999999999", value));
    EXPECT_EQ(value, 7);
}

// ---- Commands ----

TEST_F(ConsoleTest, Help_ListsCommands)
{
    std::string out = run("help");
    EXPECT_NE(out.find("commands:"), std::string::npos);
    EXPECT_NE(out.find("send <byte>"), std::string::npos);
    EXPECT_NE(out.find("option <id> <value>"), std::string::npos);
}

TEST_F(ConsoleTest, Version_PrintsString)
{
    EXPECT_EQ(run("version"), std::string(bus::version::kString) + "\r\n");
}

TEST_F(ConsoleTest, Send_BlocksUntilDone)
{
    EXPECT_EQ(run("send 0x50"), "ok\r\n");
    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 1u);

    std::vector<std::uint8_t> bytes =
        m_bench.trace.decode(bus::modeParameters(bus::SpiMode::Mode0));
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], 0x50);
}

TEST_F(ConsoleTest, Send_ValueTruncatedToByte)
{
    EXPECT_EQ(run("send 0x1A5"), "ok\r\n");

    std::vector<std::uint8_t> bytes =
        m_bench.trace.decode(bus::modeParameters(bus::SpiMode::Mode0));
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], 0xA5);
}

TEST_F(ConsoleTest, Post_ThenWait)
{
    EXPECT_EQ(run("post 1"), "ok\r\n");
    EXPECT_EQ(run("post 2"), "ok\r\n");
    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 0u);

    EXPECT_EQ(run("count"), "transactions: 2\r\n");
    EXPECT_EQ(run("wait"), "ok\r\n");
    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 2u);
}

TEST_F(ConsoleTest, Cycles_WaitsForEdges)
{
    EXPECT_EQ(run("cycles 2"), "ok\r\n");
    EXPECT_EQ(m_bench.controller.clock().edges().value(), 6u);
}

TEST_F(ConsoleTest, Id_ShowsControllerAndName)
{
    std::string expected = "controller " + std::to_string(m_bench.controller.id()) + " (spi0)\r\n";
    EXPECT_EQ(run("id"), expected);
}

TEST_F(ConsoleTest, Period_InNanoseconds)
{
    EXPECT_EQ(run("period 100"), "ok\r\n");
    EXPECT_EQ(m_bench.controller.configuration().current().sclkPeriod, 100 * sim::kNanosecond);
}

TEST_F(ConsoleTest, ModeAndBurst)
{
    EXPECT_EQ(run("mode 2"), "ok\r\n");
    EXPECT_EQ(run("burst 1"), "ok\r\n");

    const bus::BusConfig &cfg = m_bench.controller.configuration().current();
    EXPECT_EQ(cfg.spiMode, bus::SpiMode::Mode2);
    EXPECT_TRUE(cfg.burstMode);
}

TEST_F(ConsoleTest, Run_AdvancesTime)
{
    EXPECT_EQ(run("run 1000"), "time: 1 us\r\n");
    EXPECT_EQ(m_bench.simulator.now(), 1 * sim::kMicrosecond);
}

TEST_F(ConsoleTest, Status_ShowsBusState)
{
    std::string out = run("status");
    EXPECT_NE(out.find("state:     Idle\r\n"), std::string::npos);
    EXPECT_NE(out.find("period:    250 ns\r\n"), std::string::npos);
    EXPECT_NE(out.find("mode:      0 (CPOL=0, data on leading edge)\r\n"), std::string::npos);
    EXPECT_NE(out.find("lines:     SCLK=0 CSEL=1 PICO=z POCI=z\r\n"), std::string::npos);
}

// ---- Errors ----

TEST_F(ConsoleTest, BadOption_ReportsErrorThenHalted)
{
    EXPECT_EQ(run("option 99 1"), "error: invalid option (halted)\r\n");
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure, "99"));

    EXPECT_EQ(run("send 1"), "halted\r\n");
    EXPECT_EQ(run("run 100"), "halted\r\n");

    // Local commands still answer
    EXPECT_EQ(run("version"), std::string(bus::version::kString) + "\r\n");
    EXPECT_NE(run("status").find("(halted: invalid option)"), std::string::npos);
}

TEST_F(ConsoleTest, OutOfRangeMode_IsFatal)
{
    EXPECT_EQ(run("mode 7"), "error: value out of range (halted)\r\n");
}

TEST_F(ConsoleTest, Timeout_PortStaysOwned)
{
    bus::ConsoleConfig config{};
    config.writeFn = mockWrite;
    config.commandTimeout = 1 * sim::kMicrosecond;
    m_console.init(config);

    // 1000 cycles at 250 ns cannot finish within 1 us
    EXPECT_EQ(run("cycles 1000"), "error: timeout\r\n");
    EXPECT_TRUE(m_bench.controller.port().busy());

    // The next command waits for the old one first instead of colliding
    EXPECT_EQ(run("count"), "error: port busy\r\n");
    EXPECT_FALSE(m_bench.simulator.halted());
}
