#ifndef LUNAR_TRACE_SINK_INTERFACE_HPP
#define LUNAR_TRACE_SINK_INTERFACE_HPP

#include "log_entry.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace lunar_trace {
    class ISink {
    public:
        ISink() : m_minSeverity(Severity::TRACE) {}

        virtual ~ISink() = default;

        virtual void write(const LogEntry &entry) = 0;

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        IFormatter *formatter() const { return m_formatter.get(); }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        void setMinSeverity(Severity severity) { m_minSeverity = severity; }
        Severity minSeverity() const { return m_minSeverity; }

        bool accepts(Severity severity) const {
            return severity != Severity::OFF && severity >= m_minSeverity;
        }

    protected:
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
        Severity m_minSeverity;
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_SINK_INTERFACE_HPP
