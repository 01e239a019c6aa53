#ifndef LUNAR_TRACE_VALUE_HPP
#define LUNAR_TRACE_VALUE_HPP

#include "exception_info.hpp"
#include <cstddef>
#include <string>
#include <sstream>
#include <ostream>
#include <limits>
#include <exception>
#include <functional>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace lunar_trace {

    /// Type category of a declared parameter or call-time argument.
    enum class ParamKind {
        STRING,
        BOOLEAN,
        CHARACTER,
        INTEGER,
        UNSIGNED,
        FLOATING,
        EXCEPTION,
        OBJECT
    };

    inline const char *getKindString(ParamKind kind) {
        switch (kind) {
            case ParamKind::STRING: return "string";
            case ParamKind::BOOLEAN: return "boolean";
            case ParamKind::CHARACTER: return "character";
            case ParamKind::INTEGER: return "integer";
            case ParamKind::UNSIGNED: return "unsigned";
            case ParamKind::FLOATING: return "floating";
            case ParamKind::EXCEPTION: return "exception";
            case ParamKind::OBJECT: return "object";
            default: return "unknown";
        }
    }

    /// Strings and primitive numeric/boolean kinds. Only these become
    /// structured context fields.
    inline bool isContextEligible(ParamKind kind) {
        switch (kind) {
            case ParamKind::STRING:
            case ParamKind::BOOLEAN:
            case ParamKind::CHARACTER:
            case ParamKind::INTEGER:
            case ParamKind::UNSIGNED:
            case ParamKind::FLOATING:
                return true;
            default:
                return false;
        }
    }

    namespace detail {
        template<typename T>
        struct IsStringType {
            static const bool value = std::is_same<T, std::string>::value
                                      || std::is_same<T, const char *>::value
                                      || std::is_same<T, char *>::value;
        };

        template<typename T>
        class IsStreamable {
            template<typename U>
            static auto test(int) -> decltype(std::declval<std::ostream &>() << std::declval<const U &>(),
                                              std::true_type());

            template<typename>
            static std::false_type test(...);

        public:
            static const bool value = decltype(test<T>(0))::value;
        };
    } // namespace detail

    /// Maps a C++ parameter type onto its ParamKind.
    template<typename T>
    struct KindOf {
        typedef typename std::decay<T>::type Decayed;
        static const ParamKind value =
            detail::IsStringType<Decayed>::value ? ParamKind::STRING :
            std::is_same<Decayed, bool>::value ? ParamKind::BOOLEAN :
            std::is_same<Decayed, char>::value ? ParamKind::CHARACTER :
            std::is_integral<Decayed>::value
                ? (std::is_signed<Decayed>::value ? ParamKind::INTEGER : ParamKind::UNSIGNED) :
            std::is_floating_point<Decayed>::value ? ParamKind::FLOATING :
            std::is_base_of<std::exception, Decayed>::value ? ParamKind::EXCEPTION :
            ParamKind::OBJECT;
    };

    template<typename T>
    ParamKind kindOf() {
        return KindOf<T>::value;
    }

    /// One call-time argument.
    ///
    /// Strings and scalars are owned copies. EXCEPTION and OBJECT values
    /// borrow the caller's object and are only valid for the duration of the
    /// logging call that created them; they never end up in a record context.
    class Value {
    public:
        static Value string(std::string text) {
            Value v(ParamKind::STRING);
            v.m_text = std::move(text);
            return v;
        }

        static Value boolean(bool b) {
            Value v(ParamKind::BOOLEAN);
            v.m_bool = b;
            return v;
        }

        static Value character(char c) {
            Value v(ParamKind::CHARACTER);
            v.m_char = c;
            return v;
        }

        static Value integer(long long i) {
            Value v(ParamKind::INTEGER);
            v.m_int = i;
            return v;
        }

        static Value unsignedInteger(unsigned long long u) {
            Value v(ParamKind::UNSIGNED);
            v.m_uint = u;
            return v;
        }

        static Value floating(double d) {
            Value v(ParamKind::FLOATING);
            v.m_double = d;
            return v;
        }

        static Value exception(const std::exception &ex) {
            Value v(ParamKind::EXCEPTION);
            v.m_exception = &ex;
            return v;
        }

        /// An object rendered on demand through @p renderer.
        static Value object(std::string typeName, std::function<std::string()> renderer) {
            Value v(ParamKind::OBJECT);
            v.m_text = std::move(typeName);
            v.m_renderer = std::move(renderer);
            return v;
        }

        /// An object whose type offers no way to render it.
        static Value unrenderable(std::string typeName) {
            Value v(ParamKind::OBJECT);
            v.m_text = std::move(typeName);
            return v;
        }

        ParamKind kind() const { return m_kind; }

        bool asBool() const { return m_bool; }
        char asChar() const { return m_char; }
        long long asInt() const { return m_int; }
        unsigned long long asUInt() const { return m_uint; }
        double asDouble() const { return m_double; }
        const std::string &asString() const { return m_text; }

        /// Null unless kind() is EXCEPTION.
        const std::exception *exception() const { return m_exception; }

        /// False only for OBJECT values without a renderer.
        bool isRenderable() const {
            return m_kind != ParamKind::OBJECT || static_cast<bool>(m_renderer);
        }

        /// Demangled type name of an OBJECT value.
        const std::string &typeName() const { return m_text; }

        /// Standard string rendering. Exceptions thrown by an object's
        /// operator<< propagate to the caller.
        std::string toString() const {
            switch (m_kind) {
                case ParamKind::STRING: return m_text;
                case ParamKind::BOOLEAN: return m_bool ? "true" : "false";
                case ParamKind::CHARACTER: return std::string(1, m_char);
                case ParamKind::INTEGER: return std::to_string(m_int);
                case ParamKind::UNSIGNED: return std::to_string(m_uint);
                case ParamKind::FLOATING: {
                    std::ostringstream oss;
                    oss.precision(std::numeric_limits<double>::digits10);
                    oss << m_double;
                    return oss.str();
                }
                case ParamKind::EXCEPTION:
                    return detail::describeException(*m_exception);
                case ParamKind::OBJECT:
                    return m_renderer ? m_renderer() : "<" + m_text + ">";
                default:
                    return std::string();
            }
        }

        friend bool operator==(const Value &a, const Value &b) {
            if (a.m_kind != b.m_kind) return false;
            switch (a.m_kind) {
                case ParamKind::STRING: return a.m_text == b.m_text;
                case ParamKind::BOOLEAN: return a.m_bool == b.m_bool;
                case ParamKind::CHARACTER: return a.m_char == b.m_char;
                case ParamKind::INTEGER: return a.m_int == b.m_int;
                case ParamKind::UNSIGNED: return a.m_uint == b.m_uint;
                case ParamKind::FLOATING: return a.m_double == b.m_double;
                case ParamKind::EXCEPTION: return a.m_exception == b.m_exception;
                default: return false;
            }
        }

        friend bool operator!=(const Value &a, const Value &b) {
            return !(a == b);
        }

        friend std::ostream &operator<<(std::ostream &os, const Value &v) {
            return os << v.toString();
        }

    private:
        explicit Value(ParamKind kind)
            : m_kind(kind)
            , m_bool(false)
            , m_char('\0')
            , m_int(0)
            , m_uint(0)
            , m_double(0.0)
            , m_exception(nullptr) {}

        ParamKind m_kind;
        bool m_bool;
        char m_char;
        long long m_int;
        unsigned long long m_uint;
        double m_double;
        std::string m_text;
        const std::exception *m_exception;
        std::function<std::string()> m_renderer;
    };

    namespace detail {
        template<ParamKind K>
        struct KindTag {};

        inline std::string toStdString(const std::string &s) { return s; }
        inline std::string toStdString(const char *s) { return s ? std::string(s) : std::string("(null)"); }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::STRING>) {
            return Value::string(toStdString(v));
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::BOOLEAN>) {
            return Value::boolean(v);
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::CHARACTER>) {
            return Value::character(v);
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::INTEGER>) {
            return Value::integer(static_cast<long long>(v));
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::UNSIGNED>) {
            return Value::unsignedInteger(static_cast<unsigned long long>(v));
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::FLOATING>) {
            return Value::floating(static_cast<double>(v));
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::EXCEPTION>) {
            return Value::exception(v);
        }

        template<typename T>
        typename std::enable_if<IsStreamable<T>::value, Value>::type
        makeObjectValue(const T &v) {
            const T *ptr = &v;
            return Value::object(demangleTypeName(typeid(T).name()), [ptr]() -> std::string {
                std::ostringstream oss;
                oss << *ptr;
                return oss.str();
            });
        }

        template<typename T>
        typename std::enable_if<!IsStreamable<T>::value, Value>::type
        makeObjectValue(const T &) {
            return Value::unrenderable(demangleTypeName(typeid(T).name()));
        }

        template<typename T>
        Value makeValue(const T &v, KindTag<ParamKind::OBJECT>) {
            return makeObjectValue(v);
        }
    } // namespace detail

    /// Wraps a call-time argument, choosing the Value kind from its C++ type.
    template<typename T>
    Value makeValue(const T &value) {
        return detail::makeValue(value, detail::KindTag<KindOf<T>::value>());
    }

    /// Overload for string literals and other char arrays.
    template<size_t N>
    Value makeValue(const char (&value)[N]) {
        return Value::string(std::string(value));
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_VALUE_HPP
