#include "bus/Command.h"
#include "sim/Simulator.h"

namespace bus
{
namespace
{
    Command blank(CommandType type)
    {
        Command cmd{};
        cmd.type = type;
        cmd.label = nullptr;
        return cmd;
    }

}  // namespace

    Command makeSend(std::uint8_t data, bool blocking)
    {
        Command cmd = blank(CommandType::Send);
        cmd.data = data;
        cmd.blocking = blocking;
        return cmd;
    }

    Command makeWaitForTransaction()
    {
        return blank(CommandType::WaitForTransaction);
    }

    Command makeWaitForClockCycles(std::uint32_t cycles)
    {
        Command cmd = blank(CommandType::WaitForClockCycles);
        cmd.cycles = cycles;
        return cmd;
    }

    Command makeGetControllerId()
    {
        return blank(CommandType::GetControllerId);
    }

    Command makeGetTransactionCount()
    {
        return blank(CommandType::GetTransactionCount);
    }

    Command makeSetOption(std::int32_t optionId, std::int64_t value)
    {
        Command cmd = blank(CommandType::SetOption);
        cmd.optionId = optionId;
        cmd.optionValue = value;
        return cmd;
    }

    Command makeSetOption(OptionId optionId, std::int64_t value)
    {
        return makeSetOption(static_cast<std::int32_t>(optionId), value);
    }

    Command makeMultipleDriverDetected(std::uint32_t sequence)
    {
        Command cmd = blank(CommandType::MultipleDriverDetected);
        cmd.sequence = sequence;
        return cmd;
    }

    Command makeUnknown(const char *label)
    {
        Command cmd = blank(CommandType::Unknown);
        cmd.label = label;
        return cmd;
    }

    const char *commandName(CommandType type)
    {
        switch (type)
        {
            case CommandType::Send:                   return "Send";
            case CommandType::WaitForTransaction:     return "WaitForTransaction";
            case CommandType::WaitForClockCycles:     return "WaitForClockCycles";
            case CommandType::GetControllerId:        return "GetControllerId";
            case CommandType::GetTransactionCount:    return "GetTransactionCount";
            case CommandType::SetOption:              return "SetOption";
            case CommandType::MultipleDriverDetected: return "MultipleDriverDetected";
            case CommandType::Unknown:                return "Unknown";
            default:                                  return "???";
        }
    }

    const char *statusName(std::int32_t status)
    {
        switch (status)
        {
            case kBusOk:                return "ok";
            case kBusErrInvalidOption:  return "invalid option";
            case kBusErrOutOfRange:     return "value out of range";
            case kBusErrMultipleDriver: return "multiple drivers";
            case kBusErrUnimplemented:  return "unimplemented command";
            case kBusErrBusy:           return "port busy";
            case kBusErrNotStarted:     return "not started";
            case kBusErrHalted:         return "halted";
            case sim::kSimErrTimeout:   return "timeout";
            case sim::kSimErrIdle:      return "no pending events";
            case sim::kSimErrFull:      return "table full";
            default:                    return "unknown status";
        }
    }

}  // namespace bus
