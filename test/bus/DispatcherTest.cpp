// Dispatcher tests.
//
// Command semantics seen from the port: queries, blocking behaviour, clock
// cycle waits, SetOption and the fatal conditions.

#include "BusBench.h"

#include <gtest/gtest.h>
#include <cstdint>

using sim::kNanosecond;

class DispatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(m_bench.controller.start(), bus::kBusOk);
    }

    test::BusBench m_bench{bus::ControllerConfig{}, true};
};

// ---- Queries ----

TEST_F(DispatcherTest, GetControllerId_ReturnsAssignedId)
{
    bus::Reply reply{};
    ASSERT_EQ(m_bench.submit(bus::makeGetControllerId(), &reply), bus::kBusOk);

    EXPECT_NE(reply.controllerId, bus::kInvalidControllerId);
    EXPECT_EQ(reply.controllerId, m_bench.controller.id());
}

TEST_F(DispatcherTest, GetTransactionCount_CountsAcceptedSends)
{
    bus::Reply reply{};
    ASSERT_EQ(m_bench.submit(bus::makeGetTransactionCount(), &reply), bus::kBusOk);
    EXPECT_EQ(reply.transactionCount, 0u);

    ASSERT_EQ(m_bench.submit(bus::makeSend(1, false)), bus::kBusOk);
    ASSERT_EQ(m_bench.submit(bus::makeSend(2, false)), bus::kBusOk);

    // Accepted, not necessarily on the wire yet
    ASSERT_EQ(m_bench.submit(bus::makeGetTransactionCount(), &reply), bus::kBusOk);
    EXPECT_EQ(reply.transactionCount, 2u);
    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 0u);
}

// ---- Send ----

TEST_F(DispatcherTest, Send_BlockingReturnsAfterCompletion)
{
    ASSERT_EQ(m_bench.submit(bus::makeSend(0x01, true)), bus::kBusOk);

    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 1u);
    EXPECT_EQ(m_bench.simulator.now(), 2125 * kNanosecond);
}

TEST_F(DispatcherTest, Send_NonBlockingReturnsImmediately)
{
    for (std::uint8_t i = 0; i < 5; ++i)
    {
        ASSERT_EQ(m_bench.submit(bus::makeSend(i, false)), bus::kBusOk);
    }

    EXPECT_EQ(m_bench.simulator.now(), 0u);
    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 0u);
    EXPECT_EQ(m_bench.controller.transmitRequestCount(), 5u);
}

TEST_F(DispatcherTest, Send_BlockingWaitsForBytesAheadOfIt)
{
    ASSERT_EQ(m_bench.submit(bus::makeSend(0xAA, false)), bus::kBusOk);
    ASSERT_EQ(m_bench.submit(bus::makeSend(0xBB, false)), bus::kBusOk);
    ASSERT_EQ(m_bench.submit(bus::makeSend(0xCC, true)), bus::kBusOk);

    EXPECT_EQ(m_bench.controller.transmitDoneCount(), 3u);
    EXPECT_TRUE(m_bench.controller.transmitQueue().empty());
}

TEST_F(DispatcherTest, Send_PendingUntilDone)
{
    ASSERT_EQ(m_bench.post(bus::makeSend(0x77, true)), bus::kBusOk);

    m_bench.simulator.runFor(1 * sim::kMicrosecond);
    EXPECT_FALSE(m_bench.replied());
    EXPECT_TRUE(m_bench.controller.dispatcher().suspended());
    EXPECT_TRUE(m_bench.controller.port().busy());

    EXPECT_EQ(m_bench.finish(), bus::kBusOk);
    EXPECT_FALSE(m_bench.controller.dispatcher().suspended());
}

TEST_F(DispatcherTest, Send_DebugMessage)
{
    ASSERT_EQ(m_bench.submit(bus::makeSend(0x5A, false)), bus::kBusOk);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Debug,
                                      "spi0: send 0x5a (non-blocking, request 1)"));
}

// ---- WaitForTransaction ----

TEST_F(DispatcherTest, WaitForTransaction_NothingQueuedReturnsAtOnce)
{
    ASSERT_EQ(m_bench.submit(bus::makeWaitForTransaction()), bus::kBusOk);
    EXPECT_EQ(m_bench.simulator.now(), 0u);
}

// ---- WaitForClockCycles ----

TEST_F(DispatcherTest, WaitForClockCycles_OneCycleIsThreeEdges)
{
    std::uint64_t before = m_bench.controller.clock().edges().value();
    ASSERT_EQ(m_bench.submit(bus::makeWaitForClockCycles(1)), bus::kBusOk);
    EXPECT_EQ(m_bench.controller.clock().edges().value() - before, 3u);
}

TEST_F(DispatcherTest, WaitForClockCycles_FiveCyclesIsFifteenEdges)
{
    // Start from a non-zero edge count
    m_bench.simulator.runFor(300 * kNanosecond);

    std::uint64_t before = m_bench.controller.clock().edges().value();
    ASSERT_EQ(m_bench.submit(bus::makeWaitForClockCycles(5)), bus::kBusOk);
    EXPECT_EQ(m_bench.controller.clock().edges().value() - before, 15u);
}

TEST_F(DispatcherTest, WaitForClockCycles_ZeroReturnsAtOnce)
{
    ASSERT_EQ(m_bench.submit(bus::makeWaitForClockCycles(0)), bus::kBusOk);
    EXPECT_EQ(m_bench.controller.clock().edges().value(), 0u);
}

TEST_F(DispatcherTest, WaitForClockCycles_LargeCountSuspends)
{
    // 4.5e9 edges: past what 32 bits can count
    ASSERT_EQ(m_bench.post(bus::makeWaitForClockCycles(1500000000u)), bus::kBusOk);
    m_bench.simulator.runFor(10 * kNanosecond);

    EXPECT_FALSE(m_bench.simulator.halted());
    EXPECT_FALSE(m_bench.replied());
    EXPECT_EQ(m_bench.controller.clock().edges().waiterCount(), 1u);
    EXPECT_EQ(m_bench.sink.count(sim::Severity::Failure), 0u);
}

// ---- SetOption ----

TEST_F(DispatcherTest, SetOption_PeriodCommitted)
{
    ASSERT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::SclkPeriod,
                                                static_cast<std::int64_t>(100 * kNanosecond))),
              bus::kBusOk);

    EXPECT_EQ(m_bench.controller.configuration().current().sclkPeriod, 100 * kNanosecond);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Info, "spi0: SCLK period set to 100 ns"));
}

TEST_F(DispatcherTest, SetOption_ModeReportsPolarityAndPhase)
{
    ASSERT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::SpiMode, 3)), bus::kBusOk);

    EXPECT_EQ(m_bench.controller.configuration().current().spiMode, bus::SpiMode::Mode3);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Info,
                                      "spi0: SPI mode set to 3 (CPOL=1, data on trailing edge)"));
}

TEST_F(DispatcherTest, SetOption_BurstMode)
{
    ASSERT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::BurstMode, 1)), bus::kBusOk);
    EXPECT_TRUE(m_bench.controller.configuration().current().burstMode);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Info, "spi0: burst mode enabled"));

    ASSERT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::BurstMode, 0)), bus::kBusOk);
    EXPECT_FALSE(m_bench.controller.configuration().current().burstMode);
}

// ---- Fatal conditions ----

TEST_F(DispatcherTest, BadOption_FailureCitesIdentifierAndHalts)
{
    std::uint32_t generation = m_bench.controller.configuration().generation();
    bus::BusConfig before = m_bench.controller.configuration().current();

    EXPECT_EQ(m_bench.submit(bus::makeSetOption(99, 5)), bus::kBusErrInvalidOption);

    ASSERT_EQ(m_bench.sink.count(sim::Severity::Failure), 1u);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure, "99"));
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure,
                                      "spi0: SetOption: unknown option 99"));

    const bus::BusConfig &after = m_bench.controller.configuration().current();
    EXPECT_EQ(m_bench.controller.configuration().generation(), generation);
    EXPECT_EQ(after.sclkPeriod, before.sclkPeriod);
    EXPECT_EQ(after.spiMode, before.spiMode);
    EXPECT_EQ(after.burstMode, before.burstMode);

    EXPECT_TRUE(m_bench.simulator.halted());
    EXPECT_EQ(m_bench.simulator.haltStatus(), bus::kBusErrInvalidOption);
}

TEST_F(DispatcherTest, OutOfRange_ModeIsFatal)
{
    EXPECT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::SpiMode, 4)),
              bus::kBusErrOutOfRange);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure, "spi0: SPI mode 4 outside [0, 3]"));
    EXPECT_EQ(m_bench.controller.configuration().current().spiMode, bus::SpiMode::Mode0);
    EXPECT_EQ(m_bench.simulator.haltStatus(), bus::kBusErrOutOfRange);
}

TEST_F(DispatcherTest, OutOfRange_PeriodIsFatal)
{
    EXPECT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::SclkPeriod,
                                                static_cast<std::int64_t>(10 * kNanosecond))),
              bus::kBusErrOutOfRange);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure,
                                      "spi0: SCLK period 10000 ps outside [40 ns, 1 ms]"));
    EXPECT_EQ(m_bench.controller.configuration().current().sclkPeriod, bus::kDefaultSclkPeriod);
    EXPECT_TRUE(m_bench.simulator.halted());
}

TEST_F(DispatcherTest, OutOfRange_NegativePeriodIsFatal)
{
    EXPECT_EQ(m_bench.submit(bus::makeSetOption(bus::OptionId::SclkPeriod, -1)),
              bus::kBusErrOutOfRange);
    EXPECT_TRUE(m_bench.simulator.halted());
}

TEST_F(DispatcherTest, Unknown_CommandIsFatal)
{
    EXPECT_EQ(m_bench.submit(bus::makeUnknown("Reset")), bus::kBusErrUnimplemented);

    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure,
                                      "spi0: unimplemented command Reset"));
    EXPECT_EQ(m_bench.simulator.haltStatus(), bus::kBusErrUnimplemented);
}

TEST_F(DispatcherTest, MultipleDriver_DetectedAndFatal)
{
    ASSERT_EQ(m_bench.post(bus::makeSend(0x10, true)), bus::kBusOk);
    m_bench.simulator.runFor(500 * kNanosecond);
    ASSERT_TRUE(m_bench.controller.port().busy());

    // A second command stream on the same port
    EXPECT_EQ(m_bench.controller.port().submit(bus::makeSend(0x20, true), nullptr, nullptr),
              bus::kBusErrMultipleDriver);

    // The outstanding request is answered with the violation
    EXPECT_EQ(m_bench.finish(), bus::kBusErrMultipleDriver);

    ASSERT_EQ(m_bench.sink.count(sim::Severity::Failure), 1u);
    EXPECT_TRUE(m_bench.sink.contains(sim::Severity::Failure,
                                      "spi0: multiple drivers on the command port (request 2)"));
    EXPECT_EQ(m_bench.simulator.haltStatus(), bus::kBusErrMultipleDriver);

    // The second byte never reached the queue
    EXPECT_EQ(m_bench.controller.transmitRequestCount(), 1u);
}

TEST_F(DispatcherTest, Halted_FurtherCommandsRejected)
{
    EXPECT_EQ(m_bench.submit(bus::makeSetOption(99, 0)), bus::kBusErrInvalidOption);
    EXPECT_EQ(m_bench.submit(bus::makeGetControllerId()), bus::kBusErrHalted);
}
