#ifndef LUNAR_TRACE_LOG_ENTRY_HPP
#define LUNAR_TRACE_LOG_ENTRY_HPP

#include "severity.hpp"
#include "../core/formatted_record.hpp"
#include "../core/exception_info.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace lunar_trace {
    /// A record as the sink backend stores it. Unlike FormattedRecord it
    /// owns everything, including a copy of the exception details.
    struct LogEntry {
        Severity severity;
        std::string loggerName;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        Context context;
        std::unique_ptr<detail::ExceptionInfo> exception;

        LogEntry() : severity(Severity::INFO) {}
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_LOG_ENTRY_HPP
