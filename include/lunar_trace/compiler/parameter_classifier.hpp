#ifndef LUNAR_TRACE_PARAMETER_CLASSIFIER_HPP
#define LUNAR_TRACE_PARAMETER_CLASSIFIER_HPP

#include "../contract/operation_spec.hpp"
#include "../core/errors.hpp"
#include <vector>
#include <cstddef>

namespace lunar_trace {

    /// How the parameters of one operation feed a record.
    struct Classification {
        bool hasException;
        size_t exceptionIndex;
        /// Parameters copied into the record context, declared order.
        std::vector<size_t> contextIndices;
        /// Every parameter; all of them may be interpolated.
        std::vector<size_t> allIndices;

        Classification() : hasException(false), exceptionIndex(0) {}
    };

    /// Splits @p parameters into the exception slot, the context fields and
    /// the substitution list.
    ///
    /// Only operations returning void carry an exception slot. A second
    /// exception parameter on such an operation, or any exception parameter
    /// on an operation returning an Activity, is rejected.
    ///
    /// @throws ClassificationError
    inline Classification classify(const std::vector<ParameterSpec> &parameters,
                                   ReturnKind returnKind,
                                   const std::string &contractName,
                                   const std::string &operationName) {
        Classification result;
        result.allIndices.reserve(parameters.size());

        for (size_t i = 0; i < parameters.size(); ++i) {
            const ParameterSpec &p = parameters[i];
            result.allIndices.push_back(i);

            if (p.kind == ParamKind::EXCEPTION) {
                if (returnKind == ReturnKind::ACTIVITY) {
                    throw ClassificationError(contractName, operationName, p.name,
                                              "an operation returning an Activity cannot take an exception");
                }
                if (result.hasException) {
                    throw ClassificationError(contractName, operationName, p.name,
                                              "second exception parameter, '"
                                              + parameters[result.exceptionIndex].name
                                              + "' already carries the exception");
                }
                result.hasException = true;
                result.exceptionIndex = i;
            } else if (isContextEligible(p.kind)) {
                result.contextIndices.push_back(i);
            }
        }
        return result;
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_PARAMETER_CLASSIFIER_HPP
