#pragma once
#include "lunar_trace/sink/sink_interface.hpp"

namespace lunar_trace {

// Backend sink that drops every entry, so SinkBackend benchmarks measure
// level mapping and LogEntry construction without any formatting or I/O.
class NullSink : public ISink {
public:
    void write(const LogEntry&) override {}
};

} // namespace lunar_trace
