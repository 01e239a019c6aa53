#ifndef LUNAR_TRACE_TEMPLATE_VALIDATOR_HPP
#define LUNAR_TRACE_TEMPLATE_VALIDATOR_HPP

#include "../core/errors.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace lunar_trace {

    /// A run of literal text followed by at most one parameter slot.
    struct TemplateSegment {
        static const size_t kNoParameter = static_cast<size_t>(-1);

        std::string literal;
        size_t parameterIndex;

        bool hasParameter() const { return parameterIndex != kNoParameter; }
    };

    /// A message template in which every placeholder is a positional
    /// marker "{i}" referring to a declared parameter.
    struct ValidatedTemplate {
        std::string text;
        std::vector<TemplateSegment> segments;
    };

    namespace detail {
        inline bool isAllDigits(const std::string &s) {
            if (s.empty()) return false;
            for (char c : s) {
                if (c < '0' || c > '9') return false;
            }
            return true;
        }

        inline size_t findParameter(const std::vector<std::string> &names, const std::string &name) {
            for (size_t i = 0; i < names.size(); ++i) {
                if (names[i] == name) return i;
            }
            return TemplateSegment::kNoParameter;
        }
    } // namespace detail

    /// Rewrites every "{name}" of @p templateStr into the positional marker
    /// of that parameter (first declaration wins for a repeated name), then
    /// rejects anything brace-shaped that is not a valid positional marker.
    ///
    /// Accepted:  "Hello {name}", "{0} and {1}" (already positional).
    /// Rejected:  "{unknown}", "{}", "{", "}", "{{escaped}}", "{7}" with
    ///            fewer than eight parameters.
    ///
    /// @throws TemplateError naming the first offending token.
    inline ValidatedTemplate validateTemplate(const std::string &templateStr,
                                              const std::vector<std::string> &parameterNames,
                                              const std::string &contractName,
                                              const std::string &operationName) {
        ValidatedTemplate result;
        result.text.reserve(templateStr.size());
        std::string literal;

        size_t i = 0;
        while (i < templateStr.size()) {
            char c = templateStr[i];
            if (c == '}') {
                throw TemplateError(contractName, operationName, "}", templateStr);
            }
            if (c != '{') {
                literal += c;
                result.text += c;
                ++i;
                continue;
            }

            size_t close = templateStr.find_first_of("{}", i + 1);
            if (close == std::string::npos || templateStr[close] != '}') {
                throw TemplateError(contractName, operationName, "{", templateStr);
            }

            std::string token = templateStr.substr(i, close - i + 1);
            std::string content = templateStr.substr(i + 1, close - i - 1);

            size_t index = detail::findParameter(parameterNames, content);
            if (index == TemplateSegment::kNoParameter) {
                if (!detail::isAllDigits(content) || content.size() > 9) {
                    throw TemplateError(contractName, operationName, token, templateStr);
                }
                index = static_cast<size_t>(std::stoul(content));
                if (index >= parameterNames.size()) {
                    throw TemplateError(contractName, operationName, token, templateStr);
                }
            }

            TemplateSegment segment;
            segment.literal = literal;
            segment.parameterIndex = index;
            result.segments.push_back(segment);
            literal.clear();

            result.text += '{';
            result.text += std::to_string(index);
            result.text += '}';
            i = close + 1;
        }

        if (!literal.empty()) {
            TemplateSegment segment;
            segment.literal = literal;
            segment.parameterIndex = TemplateSegment::kNoParameter;
            result.segments.push_back(segment);
        }
        return result;
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_TEMPLATE_VALIDATOR_HPP
