#ifndef LUNAR_TRACE_CONSOLE_SINK_HPP
#define LUNAR_TRACE_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/stdout_transport.hpp"

namespace lunar_trace {
    class ConsoleSink : public ISink {
    public:
        ConsoleSink() {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<StdoutTransport>());
        }

        void write(const LogEntry &entry) override {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(entry));
            }
        }
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_CONSOLE_SINK_HPP
