#ifndef LUNAR_TRACE_EXCEPTION_INFO_HPP
#define LUNAR_TRACE_EXCEPTION_INFO_HPP

#include <string>
#include <vector>
#include <exception>
#include <typeinfo>
#include <cstddef>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace lunar_trace {
namespace detail {

    // Names contract and owner types as well as exceptions.
    inline std::string demangleTypeName(const char* mangledName) {
        if (!mangledName) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
        std::string result = (status == 0 && demangled) ? std::string(demangled) : std::string(mangledName);
        std::free(demangled);
        return result;
#else
        return std::string(mangledName);
#endif
    }

    inline std::string getExceptionTypeName(const std::exception& ex) {
        return demangleTypeName(typeid(ex).name());
    }

    inline const char* safeWhat(const std::exception& ex) {
        const char* msg = ex.what();
        return msg ? msg : "(no message)";
    }

    /// "type: message", the rendering used when an exception is
    /// interpolated into a message template.
    inline std::string describeException(const std::exception& ex) {
        return getExceptionTypeName(ex) + ": " + safeWhat(ex);
    }

    /// One exception nested inside the one that was logged.
    /// An empty message marks a payload that is not a std::exception.
    struct ExceptionCause {
        std::string type;
        std::string message;

        std::string line() const {
            return message.empty() ? type : type + ": " + message;
        }
    };

    /// Owned copy of a logged exception, taken while the logging call runs
    /// so that sinks never touch the caller's object.
    struct ExceptionInfo {
        std::string type;
        std::string message;
        /// Outermost cause first.
        std::vector<ExceptionCause> causes;
        /// The walk stopped at kMaxExceptionCauses with more to go.
        bool truncated;

        ExceptionInfo() : truncated(false) {}

        std::string summary() const { return type + ": " + message; }

        /// One "type: message" line per cause.
        std::string chain() const {
            std::string out;
            for (const auto &cause : causes) {
                if (!out.empty()) out += '\n';
                out += cause.line();
            }
            return out;
        }

        /// The summary followed by each cause, every cause preceded by
        /// @p causePrefix. Both formatters render exceptions through this:
        /// @code
        ///   info.describe("\n");              // JSON "Exception" attribute
        ///   info.describe("\n  caused by ");  // console lines
        /// @endcode
        std::string describe(const std::string &causePrefix) const {
            std::string out = summary();
            for (const auto &cause : causes) {
                out += causePrefix;
                out += cause.line();
            }
            if (truncated) {
                out += causePrefix;
                out += "...";
            }
            return out;
        }
    };

    // Bounds the walk over self-referencing or very deep chains.
    static const size_t kMaxExceptionCauses = 20;

    inline bool hasNestedCause(const std::exception& ex) {
        const std::nested_exception* nested = dynamic_cast<const std::nested_exception*>(&ex);
        return nested && nested->nested_ptr();
    }

    inline void collectCauses(const std::exception& ex, ExceptionInfo& info) {
        if (!hasNestedCause(ex)) return;
        if (info.causes.size() >= kMaxExceptionCauses) {
            info.truncated = true;
            return;
        }

        try {
            std::rethrow_if_nested(ex);
        } catch (const std::exception& nested) {
            ExceptionCause cause;
            cause.type = getExceptionTypeName(nested);
            cause.message = safeWhat(nested);
            info.causes.push_back(cause);
            collectCauses(nested, info);
        } catch (...) {
            // A non-std payload ends the chain; it has no text to add.
            ExceptionCause cause;
            cause.type = "unknown exception";
            info.causes.push_back(cause);
        }
    }

    inline ExceptionInfo extractExceptionInfo(const std::exception& ex) {
        ExceptionInfo info;
        info.type = getExceptionTypeName(ex);
        info.message = safeWhat(ex);
        collectCauses(ex, info);
        return info;
    }

} // namespace detail
} // namespace lunar_trace

#endif // LUNAR_TRACE_EXCEPTION_INFO_HPP
