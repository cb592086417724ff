// Diagnostic sink: (severity, message) pairs for the controller and the
// simulation kernel.
//
// Diagnostics do not own any output device -- they forward through a
// function pointer, so the same code writes to stdout in the application
// and into a recording buffer in the tests.
//
// FAILURE marks an unrecoverable condition.  Reporting it does not stop
// anything by itself; the reporter is expected to halt the simulator.

#pragma once

#include <cstdint>

namespace sim
{
    enum class Severity : std::uint8_t
    {
        Info = 0,
        Debug,
        Failure
    };

    static constexpr std::uint8_t kSeverityCount = 3;

    using DiagnosticSinkFn = void (*)(void *arg, Severity severity, const char *message);

    struct DiagnosticsConfig
    {
        DiagnosticSinkFn sinkFn = nullptr;
        void *arg = nullptr;
        bool debugEnabled = false;
    };

    class Diagnostics
    {
    public:
        Diagnostics();
        explicit Diagnostics(const DiagnosticsConfig &config);

        void configure(const DiagnosticsConfig &config);

        // Forward to the sink.  Debug messages are counted but only
        // forwarded when debug output is enabled.
        void report(Severity severity, const char *message);

        void info(const char *message);
        void debug(const char *message);
        void failure(const char *message);

        // Number of reports at this severity (including filtered debug reports)
        std::uint32_t count(Severity severity) const;

        void setDebugEnabled(bool enabled);
        bool debugEnabled() const;

    private:
        DiagnosticsConfig m_config;
        std::uint32_t m_counts[kSeverityCount];
    };

    // "INFO", "DEBUG", "FAILURE"
    const char *severityName(Severity severity);

}  // namespace sim
