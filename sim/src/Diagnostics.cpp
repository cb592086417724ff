#include "sim/Diagnostics.h"

#include <cstring>

namespace sim
{
    Diagnostics::Diagnostics()
        : m_config{}
    {
        std::memset(m_counts, 0, sizeof(m_counts));
    }

    Diagnostics::Diagnostics(const DiagnosticsConfig &config)
        : m_config(config)
    {
        std::memset(m_counts, 0, sizeof(m_counts));
    }

    void Diagnostics::configure(const DiagnosticsConfig &config)
    {
        m_config = config;
    }

    void Diagnostics::report(Severity severity, const char *message)
    {
        std::uint8_t idx = static_cast<std::uint8_t>(severity);
        if (idx >= kSeverityCount)
        {
            return;
        }

        ++m_counts[idx];

        if (severity == Severity::Debug && !m_config.debugEnabled)
        {
            return;
        }

        if (m_config.sinkFn != nullptr)
        {
            m_config.sinkFn(m_config.arg, severity, message != nullptr ? message : "");
        }
    }

    void Diagnostics::info(const char *message)
    {
        report(Severity::Info, message);
    }

    void Diagnostics::debug(const char *message)
    {
        report(Severity::Debug, message);
    }

    void Diagnostics::failure(const char *message)
    {
        report(Severity::Failure, message);
    }

    std::uint32_t Diagnostics::count(Severity severity) const
    {
        std::uint8_t idx = static_cast<std::uint8_t>(severity);
        if (idx >= kSeverityCount)
        {
            return 0;
        }
        return m_counts[idx];
    }

    void Diagnostics::setDebugEnabled(bool enabled)
    {
        m_config.debugEnabled = enabled;
    }

    bool Diagnostics::debugEnabled() const
    {
        return m_config.debugEnabled;
    }

    const char *severityName(Severity severity)
    {
        switch (severity)
        {
            case Severity::Info:    return "INFO";
            case Severity::Debug:   return "DEBUG";
            case Severity::Failure: return "FAILURE";
            default:                return "???";
        }
    }

}  // namespace sim
