#ifndef LUNAR_TRACE_LOG_LEVEL_HPP
#define LUNAR_TRACE_LOG_LEVEL_HPP

namespace lunar_trace {
    /// Severity of a declared operation, from least to most important.
    /// NONE marks an operation that never emits.
    enum class LogLevel {
        NONE,
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::NONE: return "NONE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }
} // namespace lunar_trace

#endif // LUNAR_TRACE_LOG_LEVEL_HPP
