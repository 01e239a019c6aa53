#ifndef LUNAR_TRACE_SEVERITY_HPP
#define LUNAR_TRACE_SEVERITY_HPP

#include "../core/log_level.hpp"
#include <stdexcept>
#include <string>

namespace lunar_trace {
    /// Severity scale of the sink backend. OFF sorts above everything and
    /// is never written.
    enum class Severity {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL,
        OFF
    };

    inline const char *getSeverityString(Severity severity) {
        switch (severity) {
            case Severity::TRACE: return "TRACE";
            case Severity::DEBUG: return "DEBUG";
            case Severity::INFO: return "INFO";
            case Severity::WARN: return "WARN";
            case Severity::ERROR: return "ERROR";
            case Severity::FATAL: return "FATAL";
            case Severity::OFF: return "OFF";
            default: return "UNKNOWN";
        }
    }

    /// Maps a contract level onto the backend scale. NONE maps to OFF.
    /// @throws std::invalid_argument for a value outside LogLevel.
    inline Severity toExternalLevel(LogLevel level) {
        switch (level) {
            case LogLevel::NONE: return Severity::OFF;
            case LogLevel::DEBUG: return Severity::DEBUG;
            case LogLevel::INFO: return Severity::INFO;
            case LogLevel::WARNING: return Severity::WARN;
            case LogLevel::ERROR: return Severity::ERROR;
            default:
                throw std::invalid_argument("Unknown log level: "
                                            + std::to_string(static_cast<int>(level)));
        }
    }
} // namespace lunar_trace

#endif // LUNAR_TRACE_SEVERITY_HPP
