#pragma once

// Controller commands and replies.
//
// A Command is built by the command source, crosses the CommandPort once
// and is consumed by the Dispatcher.  Only the fields of its variant are
// meaningful; the builders below zero the rest.

#include <cstdint>

namespace bus
{
    // Controller status codes.  Kept clear of the sim::kSimErr* range
    // because a halt status is returned through the simulator run calls.
    static constexpr std::int32_t kBusOk                 =   0;
    static constexpr std::int32_t kBusErrInvalidOption   = -10;  // Unknown SetOption identifier
    static constexpr std::int32_t kBusErrOutOfRange      = -11;  // Option value outside its range
    static constexpr std::int32_t kBusErrMultipleDriver  = -12;  // Concurrent command streams
    static constexpr std::int32_t kBusErrUnimplemented   = -13;  // Unrecognized command
    static constexpr std::int32_t kBusErrBusy            = -14;  // Port already has a request in flight
    static constexpr std::int32_t kBusErrNotStarted      = -15;  // Controller not started
    static constexpr std::int32_t kBusErrHalted          = -16;  // Simulation already halted

    using ControllerId = std::uint32_t;
    static constexpr ControllerId kInvalidControllerId = 0;

    enum class CommandType : std::uint8_t
    {
        Send = 1,
        WaitForTransaction,
        WaitForClockCycles,
        GetControllerId,
        GetTransactionCount,
        SetOption,
        MultipleDriverDetected,
        Unknown,
    };

    // SetOption identifiers
    enum class OptionId : std::int32_t
    {
        SclkPeriod = 1,  // value: period in picoseconds
        SpiMode    = 2,  // value: 0-3
        BurstMode  = 3,  // value: non-zero enables
    };

    struct Command
    {
        CommandType type;
        std::uint8_t data;          // Send: the byte to transmit
        bool blocking;              // Send: wait for completion
        std::uint32_t cycles;       // WaitForClockCycles
        std::int32_t optionId;      // SetOption
        std::int64_t optionValue;   // SetOption
        std::uint32_t sequence;     // MultipleDriverDetected
        const char *label;          // Unknown: name of the unrecognized operation
    };

    struct Reply
    {
        std::int32_t status;
        ControllerId controllerId;        // GetControllerId
        std::uint64_t transactionCount;   // GetTransactionCount
    };

    Command makeSend(std::uint8_t data, bool blocking = true);
    Command makeWaitForTransaction();
    Command makeWaitForClockCycles(std::uint32_t cycles);
    Command makeGetControllerId();
    Command makeGetTransactionCount();
    Command makeSetOption(std::int32_t optionId, std::int64_t value);
    Command makeSetOption(OptionId optionId, std::int64_t value);
    Command makeMultipleDriverDetected(std::uint32_t sequence);
    Command makeUnknown(const char *label);

    // "Send", "WaitForTransaction", ...
    const char *commandName(CommandType type);

    // "ok", "invalid option", ... (also names the sim::kSimErr* codes)
    const char *statusName(std::int32_t status);

}  // namespace bus
