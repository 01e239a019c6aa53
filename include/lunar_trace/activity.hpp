#ifndef LUNAR_TRACE_ACTIVITY_HPP
#define LUNAR_TRACE_ACTIVITY_HPP

#include "core/formatted_record.hpp"
#include "core/log_level.hpp"
#include "sink/sink_adapter.hpp"
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace lunar_trace {

    /// Elapsed time as "s.fff" below one minute, "m:ss.fff" from one minute
    /// on (minutes are not wrapped into hours).
    inline std::string formatDuration(std::chrono::milliseconds elapsed) {
        long long ms = elapsed.count();
        if (ms < 0) ms = 0;

        char buf[48];
        if (ms < 60 * 1000) {
            std::snprintf(buf, sizeof(buf), "%lld.%03lld", ms / 1000, ms % 1000);
        } else {
            std::snprintf(buf, sizeof(buf), "%lld:%02lld.%03lld",
                          ms / 60000, (ms / 1000) % 60, ms % 1000);
        }
        return std::string(buf);
    }

    /// A timed span. Emits "<name> [+]" when created and
    /// "<name> [<duration>]" exactly once when closed, either explicitly
    /// through close() or when the object goes out of scope, including
    /// during stack unwinding.
    ///
    /// @code
    ///   {
    ///       auto import = trace.start("Import", path);
    ///       parse(path);              // may throw
    ///   }                             // "Importing a.csv [0.412]"
    /// @endcode
    ///
    /// Move-only; a moved-from Activity emits nothing.
    class Activity {
    public:
        typedef std::chrono::steady_clock Clock;

        /// Starts the span and emits the opening record. A null @p sink or
        /// a NONE @p level gives a silent span.
        Activity(std::shared_ptr<ISinkAdapter> sink,
                 std::string loggerName,
                 std::string name,
                 Context context,
                 LogLevel level = LogLevel::INFO)
            : m_sink(std::move(sink))
            , m_loggerName(std::move(loggerName))
            , m_name(std::move(name))
            , m_context(std::move(context))
            , m_level(level)
            , m_start(Clock::now())
            , m_closed(false) {
            emit(m_name + " [+]");
        }

        ~Activity() {
            if (m_closed) return;
            try {
                close();
            } catch (const std::exception &e) {
                std::fprintf(stderr, "[LunarTrace][Activity] failed to emit closing record for \"%s\": %s\n",
                             m_name.c_str(), e.what());
            } catch (...) {
                std::fprintf(stderr, "[LunarTrace][Activity] failed to emit closing record for \"%s\": "
                             "unknown exception\n", m_name.c_str());
            }
        }

        Activity(Activity &&other)
            : m_sink(std::move(other.m_sink))
            , m_loggerName(std::move(other.m_loggerName))
            , m_name(std::move(other.m_name))
            , m_context(std::move(other.m_context))
            , m_level(other.m_level)
            , m_start(other.m_start)
            , m_elapsed(other.m_elapsed)
            , m_closed(other.m_closed) {
            other.m_closed = true;
        }

        Activity(const Activity &) = delete;
        Activity &operator=(const Activity &) = delete;
        Activity &operator=(Activity &&) = delete;

        /// Emits the closing record. Further calls, and the destructor, do
        /// nothing. Sink failures propagate from here.
        void close() {
            if (m_closed) return;
            m_closed = true;
            m_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_start);
            emit(m_name + " [" + formatDuration(m_elapsed) + "]");
        }

        bool isClosed() const { return m_closed; }

        const std::string &name() const { return m_name; }
        const std::string &loggerName() const { return m_loggerName; }
        const Context &context() const { return m_context; }
        LogLevel level() const { return m_level; }

        /// Time measured at close(); zero while the span is open.
        std::chrono::milliseconds elapsed() const { return m_elapsed; }

    private:
        void emit(const std::string &message) {
            if (!m_sink || m_level == LogLevel::NONE) return;
            m_sink->emit(m_loggerName, m_level, message, m_context, nullptr);
        }

        std::shared_ptr<ISinkAdapter> m_sink;
        std::string m_loggerName;
        std::string m_name;
        Context m_context;
        LogLevel m_level;
        Clock::time_point m_start;
        std::chrono::milliseconds m_elapsed{0};
        bool m_closed;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_ACTIVITY_HPP
