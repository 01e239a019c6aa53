#ifndef LUNAR_TRACE_CALLBACK_SINK_HPP
#define LUNAR_TRACE_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../core/common.hpp"
#include "../formatter/json_formatter.hpp"
#include <functional>
#include <string>
#include <memory>

namespace lunar_trace {

    /// Sink that invokes a user-provided callback for each log entry.
    ///
    /// Two variants:
    ///   1. EntryCallback: receives the LogEntry itself.
    ///   2. StringCallback: receives the formatted string (JsonFormatter
    ///      by default, or a user-supplied formatter).
    ///
    /// @note Callbacks run on the logging thread while the backend holds
    ///       its write lock. An exception thrown by a callback propagates
    ///       to the logging call.
    class CallbackSink : public ISink {
    public:
        using EntryCallback  = std::function<void(const LogEntry&)>;
        using StringCallback = std::function<void(const std::string&)>;

        /// In C++11, wrap lambdas in the typedef to avoid overload ambiguity:
        /// @code
        ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
        /// @endcode
        explicit CallbackSink(EntryCallback cb)
            : m_entryCallback(std::move(cb))
            , m_mode(Mode::Entry) {}

        /// If formatter is nullptr, JsonFormatter is used.
        explicit CallbackSink(StringCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::String) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(detail::make_unique<JsonFormatter>());
            }
        }

        void write(const LogEntry& entry) override {
            if (m_mode == Mode::Entry) {
                if (m_entryCallback) {
                    m_entryCallback(entry);
                }
            } else if (m_stringCallback && m_formatter) {
                m_stringCallback(m_formatter->format(entry));
            }
        }

    private:
        enum class Mode { Entry, String };

        EntryCallback  m_entryCallback;
        StringCallback m_stringCallback;
        Mode           m_mode;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_CALLBACK_SINK_HPP
