#ifndef LUNAR_TRACE_SINK_BACKEND_HPP
#define LUNAR_TRACE_SINK_BACKEND_HPP

#include "sink_adapter.hpp"
#include "sink_interface.hpp"
#include "severity.hpp"
#include "../core/common.hpp"
#include "../core/exception_info.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace lunar_trace {

    /// Sink adapter that turns records into LogEntry values and writes them
    /// to its sinks. Records mapped to Severity::OFF, or below the backend
    /// minimum, are dropped before any work is done.
    ///
    /// Writes are serialized: a sink never sees two entries at once.
    class SinkBackend : public ISinkAdapter {
    public:
        explicit SinkBackend(Severity minSeverity = Severity::TRACE)
            : m_minSeverity(minSeverity) {}

        SinkBackend(const SinkBackend &) = delete;
        SinkBackend &operator=(const SinkBackend &) = delete;

        void addSink(std::unique_ptr<ISink> sink) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sinks.push_back(std::move(sink));
        }

        size_t sinkCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_sinks.size();
        }

        void setMinSeverity(Severity severity) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_minSeverity = severity;
        }

        Severity minSeverity() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_minSeverity;
        }

        using ISinkAdapter::emit;

        void emit(const std::string &loggerName,
                  LogLevel level,
                  const std::string &message,
                  const Context &context,
                  const std::exception *exception) override {
            Severity severity = toExternalLevel(level);
            if (severity == Severity::OFF) return;

            std::lock_guard<std::mutex> lock(m_mutex);
            if (severity < m_minSeverity) return;

            LogEntry entry;
            entry.severity = severity;
            entry.loggerName = loggerName;
            entry.message = message;
            entry.timestamp = std::chrono::system_clock::now();
            entry.context = context;
            if (exception) {
                entry.exception = detail::make_unique<detail::ExceptionInfo>(
                    detail::extractExceptionInfo(*exception));
            }

            for (const auto &sink : m_sinks) {
                if (sink->accepts(severity)) {
                    sink->write(entry);
                }
            }
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        Severity m_minSeverity;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_SINK_BACKEND_HPP
