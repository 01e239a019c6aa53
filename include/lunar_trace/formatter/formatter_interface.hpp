#ifndef LUNAR_TRACE_FORMATTER_INTERFACE_HPP
#define LUNAR_TRACE_FORMATTER_INTERFACE_HPP

#include "../sink/log_entry.hpp"
#include <string>

namespace lunar_trace {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogEntry &entry) const = 0;
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_FORMATTER_INTERFACE_HPP
