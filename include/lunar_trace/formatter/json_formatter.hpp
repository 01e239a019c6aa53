#ifndef LUNAR_TRACE_JSON_FORMATTER_HPP
#define LUNAR_TRACE_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/common.hpp"
#include <nlohmann/json.hpp>
#include <string>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
// windows.h defines ERROR as 0, which conflicts with LogLevel::ERROR.
#ifdef ERROR
#undef ERROR
#endif
#else
#include <unistd.h>
#endif

namespace lunar_trace {

    namespace detail {
        inline std::string hostName() {
            std::string name;
#ifdef _WIN32
            char buf[MAX_COMPUTERNAME_LENGTH + 1];
            DWORD size = sizeof(buf);
            if (GetComputerNameA(buf, &size)) {
                name = buf;
            }
#else
            char buf[256];
            if (gethostname(buf, sizeof(buf)) == 0) {
                buf[sizeof(buf) - 1] = '\0';
                name = buf;
            }
#endif
            return name;
        }

        inline nlohmann::ordered_json toJsonValue(const Value &value) {
            switch (value.kind()) {
                case ParamKind::BOOLEAN: return value.asBool();
                case ParamKind::INTEGER: return value.asInt();
                case ParamKind::UNSIGNED: return value.asUInt();
                case ParamKind::FLOATING: return value.asDouble();
                case ParamKind::STRING: return value.asString();
                default: return value.toString();
            }
        }
    } // namespace detail

    /// One JSON object per record, attributes first, then every context
    /// field with its native JSON type:
    /// @code
    ///   {"Timestamp":"2026-02-16 12:00:00.000","Application":"shop",
    ///    "Environment":"prod","Hostname":"web-1","LoggerName":"app.Store",
    ///    "Level":"INFO","Message":"Hello Ada","name":"Ada"}
    /// @endcode
    /// Application and Environment are omitted when empty, Exception when
    /// the record has none. A context field whose name collides with an
    /// attribute is written with an '@' prefix. Bytes that are not valid
    /// UTF-8 are written as U+FFFD rather than failing the logging call.
    class JsonFormatter : public IFormatter {
    public:
        JsonFormatter() : m_hostName(detail::hostName()) {}

        JsonFormatter(const std::string &application, const std::string &environment)
            : m_application(application)
            , m_environment(environment)
            , m_hostName(detail::hostName()) {}

        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["Timestamp"] = detail::formatTimestamp(entry.timestamp);
            if (!m_application.empty()) j["Application"] = m_application;
            if (!m_environment.empty()) j["Environment"] = m_environment;
            j["Hostname"] = m_hostName;
            j["LoggerName"] = entry.loggerName;
            j["Level"] = getSeverityString(entry.severity);
            j["Message"] = entry.message;
            if (entry.exception) {
                j["Exception"] = entry.exception->describe("\n");
            }

            for (const auto &ctx : entry.context) {
                std::string key = ctx.first;
                while (j.contains(key)) {
                    key = "@" + key;
                }
                j[key] = detail::toJsonValue(ctx.second);
            }
            return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }

    private:
        std::string m_application;
        std::string m_environment;
        std::string m_hostName;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_JSON_FORMATTER_HPP
