#ifndef LUNAR_TRACE_TRANSPORT_INTERFACE_HPP
#define LUNAR_TRACE_TRANSPORT_INTERFACE_HPP

#include <string>

namespace lunar_trace {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_TRANSPORT_INTERFACE_HPP
