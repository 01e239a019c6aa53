#ifndef LUNAR_TRACE_SINK_ADAPTER_HPP
#define LUNAR_TRACE_SINK_ADAPTER_HPP

#include "../core/log_level.hpp"
#include "../core/formatted_record.hpp"
#include <string>
#include <exception>

namespace lunar_trace {

    /// Boundary between compiled contracts and whatever persists records.
    ///
    /// Called synchronously on the logging thread. Failures inside an
    /// adapter propagate to the logging call; nothing here retries them.
    class ISinkAdapter {
    public:
        virtual ~ISinkAdapter() = default;

        /// @param exception  null when the record carries no exception; only
        ///                   valid for the duration of the call.
        virtual void emit(const std::string &loggerName,
                          LogLevel level,
                          const std::string &message,
                          const Context &context,
                          const std::exception *exception) = 0;

        void emit(const std::string &loggerName, const FormattedRecord &record) {
            emit(loggerName, record.level, record.message, record.context, record.exception);
        }
    };

    /// Discards every record. Installed for all loggers by Tracing::disable().
    class NullSinkAdapter : public ISinkAdapter {
    public:
        using ISinkAdapter::emit;

        void emit(const std::string &, LogLevel, const std::string &,
                  const Context &, const std::exception *) override {}
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_SINK_ADAPTER_HPP
