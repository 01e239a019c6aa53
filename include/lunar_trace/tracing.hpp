#ifndef LUNAR_TRACE_TRACING_HPP
#define LUNAR_TRACE_TRACING_HPP

#include "core/common.hpp"
#include "core/log_level.hpp"
#include "sink/sink_adapter.hpp"
#include "sink/sink_backend.hpp"
#include "sink/sink_interface.hpp"
#include "sink/console_sink.hpp"
#include "sink/severity.hpp"
#include "formatter/formatter_interface.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace lunar_trace {

    class TracingConfiguration;

    /// Process-wide choice of where bound traces send their records.
    ///
    /// Usage:
    /// @code
    ///   lunar_trace::Tracing::configure()
    ///       .minLevel(lunar_trace::LogLevel::INFO)
    ///       .writeTo<lunar_trace::ConsoleSink>()
    ///       .build();   // installs the backend for every logger name
    ///
    ///   lunar_trace::Tracing::disable();   // or: silence everything
    /// @endcode
    ///
    /// Sinks obtained from sinkFor() resolve against the factory current at
    /// their first emit, so traces bound before init() or disable() still
    /// follow them. Without init(), records go to a shared console backend.
    class Tracing {
    public:
        typedef std::function<std::shared_ptr<ISinkAdapter>(const std::string &)> SinkFactory;

        Tracing() = delete;

        static TracingConfiguration configure();

        /// Installs @p factory for all sinks resolved from now on.
        /// @throws std::invalid_argument if @p factory is empty.
        static void init(SinkFactory factory) {
            if (!factory) {
                throw std::invalid_argument("lunar_trace::Tracing::init requires a sink factory");
            }
            std::lock_guard<std::mutex> lock(mutex());
            storage() = std::move(factory);
        }

        /// Every sink resolved from now on discards its records.
        static void disable() {
            std::shared_ptr<ISinkAdapter> nullSink = std::make_shared<NullSinkAdapter>();
            init([nullSink](const std::string &) { return nullSink; });
        }

        /// Back to the default console backend.
        static void reset() {
            std::lock_guard<std::mutex> lock(mutex());
            storage() = SinkFactory();
        }

        /// Runs the current factory for @p loggerName now.
        static std::shared_ptr<ISinkAdapter> resolve(const std::string &loggerName) {
            SinkFactory factory;
            {
                std::lock_guard<std::mutex> lock(mutex());
                factory = storage();
            }
            // Runs outside the lock.
            std::shared_ptr<ISinkAdapter> sink = factory ? factory(loggerName) : defaultBackend();
            if (!sink) {
                throw std::logic_error("lunar_trace::Tracing sink factory returned no sink for \""
                                       + loggerName + "\"");
            }
            return sink;
        }

        /// A sink for @p loggerName that resolves on first use.
        static std::shared_ptr<ISinkAdapter> sinkFor(const std::string &loggerName);

    private:
        static SinkFactory &storage() {
            static SinkFactory s_factory;
            return s_factory;
        }

        static std::mutex &mutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }

        static std::shared_ptr<ISinkAdapter> defaultBackend() {
            static std::shared_ptr<SinkBackend> s_backend = []() -> std::shared_ptr<SinkBackend> {
                std::shared_ptr<SinkBackend> backend = std::make_shared<SinkBackend>();
                backend->addSink(detail::make_unique<ConsoleSink>());
                return backend;
            }();
            return s_backend;
        }
    };

    /// Sink returned by Tracing::sinkFor(). The first emit fixes the real
    /// sink; a factory failure propagates and the next emit tries again.
    ///
    /// The factory runs without the adapter's lock held. Other threads that
    /// emit meanwhile wait for it. A record emitted through this adapter by
    /// the factory itself, on the resolving thread, is dropped: there is no
    /// sink to take it yet.
    class LazySinkAdapter : public ISinkAdapter {
    public:
        explicit LazySinkAdapter(std::string loggerName)
            : m_loggerName(std::move(loggerName))
            , m_resolving(false) {}

        using ISinkAdapter::emit;

        void emit(const std::string &loggerName,
                  LogLevel level,
                  const std::string &message,
                  const Context &context,
                  const std::exception *exception) override {
            std::shared_ptr<ISinkAdapter> sink = target();
            if (sink) {
                sink->emit(loggerName, level, message, context, exception);
            }
        }

        bool isResolved() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<bool>(m_target);
        }

    private:
        // Null only for a re-entrant emit from the resolving thread.
        std::shared_ptr<ISinkAdapter> target() {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (!m_target && m_resolving) {
                if (m_resolvingThread == std::this_thread::get_id()) {
                    return nullptr;
                }
                m_resolved.wait(lock);
            }
            if (m_target) {
                return m_target;
            }

            m_resolving = true;
            m_resolvingThread = std::this_thread::get_id();
            lock.unlock();

            std::shared_ptr<ISinkAdapter> resolved;
            try {
                resolved = Tracing::resolve(m_loggerName);
            } catch (...) {
                lock.lock();
                finishResolving();
                throw;
            }

            lock.lock();
            m_target = resolved;
            finishResolving();
            return m_target;
        }

        // Caller holds m_mutex.
        void finishResolving() {
            m_resolving = false;
            m_resolvingThread = std::thread::id();
            m_resolved.notify_all();
        }

        std::string m_loggerName;
        mutable std::mutex m_mutex;
        std::condition_variable m_resolved;
        std::shared_ptr<ISinkAdapter> m_target;
        bool m_resolving;
        std::thread::id m_resolvingThread;
    };

    inline std::shared_ptr<ISinkAdapter> Tracing::sinkFor(const std::string &loggerName) {
        return std::make_shared<LazySinkAdapter>(loggerName);
    }

    /// Fluent builder for the process-wide sink backend. build() creates one
    /// SinkBackend shared by every logger name and installs it through
    /// Tracing::init().
    class TracingConfiguration {
    public:
        TracingConfiguration()
            : m_minSeverity(Severity::TRACE)
            , m_built(false) {}

        TracingConfiguration(const TracingConfiguration &) = delete;
        TracingConfiguration &operator=(const TracingConfiguration &) = delete;
        TracingConfiguration(TracingConfiguration &&) = default;
        TracingConfiguration &operator=(TracingConfiguration &&) = default;

        /// Records below @p level are dropped; NONE drops everything.
        TracingConfiguration &minLevel(LogLevel level) {
            m_minSeverity = toExternalLevel(level);
            return *this;
        }

        /// Add a sink with its default formatter.
        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            TracingConfiguration&
        >::type
        writeTo(Args&&... args) {
            m_sinks.push_back(detail::make_unique<SinkType>(std::forward<Args>(args)...));
            return *this;
        }

        /// Add a sink with a custom formatter.
        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_base_of<IFormatter, FormatterType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            TracingConfiguration&
        >::type
        writeTo(Args&&... args) {
            std::unique_ptr<ISink> sink = detail::make_unique<SinkType>(std::forward<Args>(args)...);
            sink->setFormatter(detail::make_unique<FormatterType>());
            m_sinks.push_back(std::move(sink));
            return *this;
        }

        /// Add an already-built sink.
        TracingConfiguration &writeTo(std::unique_ptr<ISink> sink) {
            if (!sink) {
                throw std::invalid_argument("lunar_trace::TracingConfiguration::writeTo requires a sink");
            }
            m_sinks.push_back(std::move(sink));
            return *this;
        }

        /// Builds the backend (a ConsoleSink when no sink was added) and
        /// installs it for all loggers.
        /// @throws std::logic_error if called twice.
        std::shared_ptr<SinkBackend> build() {
            if (m_built) {
                throw std::logic_error("TracingConfiguration::build() called twice");
            }
            m_built = true;

            std::shared_ptr<SinkBackend> backend = std::make_shared<SinkBackend>(m_minSeverity);
            if (m_sinks.empty()) {
                backend->addSink(detail::make_unique<ConsoleSink>());
            }
            for (auto &sink : m_sinks) {
                backend->addSink(std::move(sink));
            }
            m_sinks.clear();

            std::shared_ptr<ISinkAdapter> shared = backend;
            Tracing::init([shared](const std::string &) { return shared; });
            return backend;
        }

    private:
        Severity m_minSeverity;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        bool m_built;
    };

    inline TracingConfiguration Tracing::configure() {
        return TracingConfiguration();
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_TRACING_HPP
