#ifndef LUNAR_TRACE_STDOUT_TRANSPORT_HPP
#define LUNAR_TRACE_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>

namespace lunar_trace {
    /// @note All StdoutTransport instances share a single mutex so that
    ///       concurrent writes from different backends do not interleave.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout << formattedEntry << '\n' << std::flush;
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_STDOUT_TRANSPORT_HPP
