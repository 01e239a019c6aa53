#ifndef LUNAR_TRACE_RECORD_FORMATTER_HPP
#define LUNAR_TRACE_RECORD_FORMATTER_HPP

#include "template_validator.hpp"
#include "parameter_classifier.hpp"
#include "../core/formatted_record.hpp"
#include "../core/errors.hpp"
#include <string>
#include <vector>
#include <limits>
#include <exception>

namespace lunar_trace {

    namespace detail {
        inline bool coerceValue(Value &value, ParamKind declared) {
            ParamKind actual = value.kind();
            if (actual == declared) return true;

            switch (declared) {
                case ParamKind::INTEGER:
                    if (actual == ParamKind::UNSIGNED
                        && value.asUInt() <= static_cast<unsigned long long>(
                               std::numeric_limits<long long>::max())) {
                        value = Value::integer(static_cast<long long>(value.asUInt()));
                        return true;
                    }
                    return false;
                case ParamKind::UNSIGNED:
                    if (actual == ParamKind::INTEGER && value.asInt() >= 0) {
                        value = Value::unsignedInteger(static_cast<unsigned long long>(value.asInt()));
                        return true;
                    }
                    return false;
                case ParamKind::FLOATING:
                    if (actual == ParamKind::INTEGER) {
                        value = Value::floating(static_cast<double>(value.asInt()));
                        return true;
                    }
                    if (actual == ParamKind::UNSIGNED) {
                        value = Value::floating(static_cast<double>(value.asUInt()));
                        return true;
                    }
                    return false;
                case ParamKind::OBJECT:
                    return actual != ParamKind::EXCEPTION;
                default:
                    return false;
            }
        }

        inline std::string renderValue(const Value &value, const ParameterSpec &parameter,
                                       const std::string &operationName) {
            if (!value.isRenderable()) {
                throw FormatError(operationName, parameter.name,
                                  "type " + value.typeName() + " has no operator<<");
            }
            try {
                return value.toString();
            } catch (const std::exception &e) {
                std::throw_with_nested(FormatError(operationName, parameter.name,
                                                   std::string("rendering threw: ") + e.what()));
            }
        }
    } // namespace detail

    /// Checks call-time arguments against the declared parameters and
    /// converts numeric arguments to the declared kind (an int passed for a
    /// double parameter becomes a double).
    ///
    /// @throws FormatError on a count mismatch or an incompatible argument.
    inline void bindArguments(const std::vector<ParameterSpec> &parameters,
                              std::vector<Value> &values,
                              const std::string &operationName) {
        if (values.size() != parameters.size()) {
            throw FormatError(operationName, values.size() < parameters.size()
                                                 ? parameters[values.size()].name
                                                 : std::string("<extra>"),
                              "expected " + std::to_string(parameters.size())
                              + " arguments, got " + std::to_string(values.size()));
        }
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (!detail::coerceValue(values[i], parameters[i].kind)) {
                throw FormatError(operationName, parameters[i].name,
                                  std::string("expected ") + getKindString(parameters[i].kind)
                                  + ", got " + getKindString(values[i].kind()));
            }
        }
    }

    /// Produces the message, context and exception of one call.
    /// Pure: performs no I/O and touches nothing but its arguments.
    ///
    /// @throws FormatError when an argument cannot be rendered; an exception
    ///         thrown by an operator<< is nested inside it.
    inline FormattedRecord formatRecord(const ValidatedTemplate &validated,
                                        const std::vector<Value> &values,
                                        const Classification &classification,
                                        const std::vector<ParameterSpec> &parameters,
                                        LogLevel level,
                                        const std::string &operationName) {
        if (values.size() != parameters.size()) {
            throw FormatError(operationName, "<arguments>",
                              "expected " + std::to_string(parameters.size())
                              + " arguments, got " + std::to_string(values.size()));
        }

        FormattedRecord record;
        record.level = level;
        record.message.reserve(validated.text.size());
        for (const auto &segment : validated.segments) {
            record.message += segment.literal;
            if (segment.hasParameter()) {
                size_t index = segment.parameterIndex;
                record.message += detail::renderValue(values[index], parameters[index], operationName);
            }
        }

        for (size_t index : classification.contextIndices) {
            detail::insertFirstWins(record.context, parameters[index].name, values[index]);
        }

        if (classification.hasException) {
            record.exception = values[classification.exceptionIndex].exception();
        }
        return record;
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_RECORD_FORMATTER_HPP
