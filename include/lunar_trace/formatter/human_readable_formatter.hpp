#ifndef LUNAR_TRACE_HUMAN_READABLE_FORMATTER_HPP
#define LUNAR_TRACE_HUMAN_READABLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/common.hpp"
#include <sstream>

namespace lunar_trace {
    /// "2026-02-16 12:00:00.000 [INFO] app.Store - Hello Ada {name=Ada}"
    /// followed, for records with an exception, by one line per exception
    /// in the nested chain.
    class HumanReadableFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            oss << detail::formatTimestamp(entry.timestamp) << " "
                << "[" << getSeverityString(entry.severity) << "] ";
            if (!entry.loggerName.empty()) {
                oss << entry.loggerName << " - ";
            }
            oss << entry.message;

            if (!entry.context.empty()) {
                oss << " {";
                bool first = true;
                for (const auto &ctx : entry.context) {
                    if (!first) oss << ", ";
                    oss << ctx.first << "=" << ctx.second.toString();
                    first = false;
                }
                oss << "}";
            }

            if (entry.exception) {
                oss << "\n  " << entry.exception->describe("\n  caused by ");
            }

            return oss.str();
        }
    };
} // namespace lunar_trace

#endif // LUNAR_TRACE_HUMAN_READABLE_FORMATTER_HPP
