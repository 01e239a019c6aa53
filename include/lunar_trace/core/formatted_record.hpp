#ifndef LUNAR_TRACE_FORMATTED_RECORD_HPP
#define LUNAR_TRACE_FORMATTED_RECORD_HPP

#include "log_level.hpp"
#include "value.hpp"
#include <string>
#include <vector>
#include <utility>
#include <exception>

namespace lunar_trace {

    /// Structured fields of a record, in insertion order, keys unique.
    typedef std::vector<std::pair<std::string, Value> > Context;

    namespace detail {
        /// Inserts (key, value) unless key is already present.
        /// Returns false when the key was already taken.
        inline bool insertFirstWins(Context &context, const std::string &key, const Value &value) {
            for (const auto &entry : context) {
                if (entry.first == key) return false;
            }
            context.emplace_back(key, value);
            return true;
        }
    } // namespace detail

    /// Looks up a context field by name; null when absent.
    inline const Value *findContextValue(const Context &context, const std::string &key) {
        for (const auto &entry : context) {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    /// The output of one logging call, before it reaches a sink.
    struct FormattedRecord {
        std::string message;
        Context context;
        LogLevel level;
        /// Borrowed from the caller; valid only while the call is in progress.
        const std::exception *exception;

        FormattedRecord() : level(LogLevel::NONE), exception(nullptr) {}
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_FORMATTED_RECORD_HPP
