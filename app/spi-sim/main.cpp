// SPI controller console
//
// Runs one simulated SPI bus master behind the command console.  Commands
// are read from stdin, console output and diagnostics go to stdout.
//
//   spi-sim [--debug] [trace.vcd]
//
//   --debug    also print per-byte DEBUG diagnostics
//   trace.vcd  write every bus line transition as a value change dump on exit

#include "bus/BusTrace.h"
#include "bus/Console.h"
#include "bus/Controller.h"
#include "sim/Diagnostics.h"
#include "sim/Simulator.h"
#include "sim/TextBuffer.h"

#include <cstdio>
#include <cstring>

namespace
{
    sim::Simulator *g_sim = nullptr;

    void print(const char *msg)
    {
        std::fputs(msg, stdout);
    }

    void consoleWrite(void *, const char *str)
    {
        print(str);
    }

    void diagnosticSink(void *, sim::Severity severity, const char *message)
    {
        sim::TextBuffer buf;
        buf.append('[').appendTime(g_sim != nullptr ? g_sim->now() : 0).append("] ")
           .append(sim::severityName(severity)).append(' ');
        print(buf.c_str());
        print(message);
        print("\r\n");
    }

    void fileWrite(void *arg, const char *str)
    {
        std::fputs(str, static_cast<std::FILE *>(arg));
    }

    bool writeTrace(const bus::BusTrace &trace, const char *path)
    {
        std::FILE *file = std::fopen(path, "w");
        if (file == nullptr)
        {
            return false;
        }
        trace.writeVcd(fileWrite, file);
        bool ok = (std::ferror(file) == 0);
        if (std::fclose(file) != 0)
        {
            ok = false;
        }
        return ok;
    }

}  // namespace

int main(int argc, char **argv)
{
    const char *tracePath = nullptr;
    bool debug = false;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--debug") == 0)
        {
            debug = true;
        }
        else if (tracePath == nullptr)
        {
            tracePath = argv[i];
        }
        else
        {
            print("usage: spi-sim [--debug] [trace.vcd]\n");
            return 2;
        }
    }

    sim::Simulator simulator;
    g_sim = &simulator;

    sim::DiagnosticsConfig diagConfig{};
    diagConfig.sinkFn = diagnosticSink;
    diagConfig.debugEnabled = debug;
    sim::Diagnostics diag(diagConfig);

    bus::Controller controller(simulator, diag);
    bus::BusTrace trace(simulator, controller.lines());

    if (controller.start() != bus::kBusOk)
    {
        return 1;
    }

    bus::Console console(simulator, controller);
    bus::ConsoleConfig consoleConfig{};
    consoleConfig.writeFn = consoleWrite;
    console.init(consoleConfig);

    console.prompt();
    std::fflush(stdout);

    int c;
    while ((c = std::fgetc(stdin)) != EOF)
    {
        console.processChar(static_cast<char>(c));
        std::fflush(stdout);
    }
    print("\r\n");

    int exitCode = simulator.halted() ? 1 : 0;

    if (tracePath != nullptr && !writeTrace(trace, tracePath))
    {
        print("spi-sim: cannot write ");
        print(tracePath);
        print("\r\n");
        exitCode = 1;
    }

    g_sim = nullptr;
    return exitCode;
}
