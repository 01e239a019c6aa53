#ifndef LUNAR_TRACE_COMPILED_CONTRACT_HPP
#define LUNAR_TRACE_COMPILED_CONTRACT_HPP

#include "template_validator.hpp"
#include "parameter_classifier.hpp"
#include "record_formatter.hpp"
#include "../contract/operation_spec.hpp"
#include "../core/errors.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <utility>

namespace lunar_trace {

    /// One validated operation: its declaration, positional template and
    /// parameter classification. Immutable once built.
    class CompiledOperation {
    public:
        CompiledOperation(OperationSpec spec, ValidatedTemplate validated, Classification classification)
            : m_spec(std::move(spec))
            , m_template(std::move(validated))
            , m_classification(std::move(classification)) {}

        const std::string &name() const { return m_spec.name; }
        LogLevel level() const { return m_spec.level; }
        bool returnsActivity() const { return m_spec.returnsActivity(); }
        const OperationSpec &spec() const { return m_spec; }
        const ValidatedTemplate &validatedTemplate() const { return m_template; }
        const Classification &classification() const { return m_classification; }

        /// Binds the arguments of one call and formats its record.
        FormattedRecord format(std::vector<Value> values) const {
            bindArguments(m_spec.parameters, values, m_spec.name);
            return formatRecord(m_template, values, m_classification,
                                m_spec.parameters, m_spec.level, m_spec.name);
        }

    private:
        OperationSpec m_spec;
        ValidatedTemplate m_template;
        Classification m_classification;
    };

    /// The dispatch table of a contract: operation name -> compiled operation.
    class CompiledContract {
    public:
        CompiledContract(std::string name, std::vector<CompiledOperation> operations)
            : m_name(std::move(name))
            , m_operations(std::move(operations)) {
            for (size_t i = 0; i < m_operations.size(); ++i) {
                m_index[m_operations[i].name()] = i;
            }
        }

        const std::string &name() const { return m_name; }

        /// Null when the contract declares no such operation.
        const CompiledOperation *find(const std::string &operationName) const {
            auto it = m_index.find(operationName);
            return it == m_index.end() ? nullptr : &m_operations[it->second];
        }

        const std::vector<CompiledOperation> &operations() const { return m_operations; }
        size_t size() const { return m_operations.size(); }

    private:
        std::string m_name;
        std::vector<CompiledOperation> m_operations;
        std::map<std::string, size_t> m_index;
    };

    /// Validates every operation of @p contract and builds its dispatch
    /// table. All or nothing: the first invalid operation aborts the whole
    /// contract.
    ///
    /// @throws ContractError (or its TemplateError / ClassificationError
    ///         subclasses) naming the contract and operation at fault.
    inline std::shared_ptr<const CompiledContract> compileContract(const ContractSpec &contract) {
        std::vector<CompiledOperation> compiled;
        compiled.reserve(contract.operations.size());
        std::map<std::string, size_t> seen;

        for (const auto &op : contract.operations) {
            if (!seen.insert(std::make_pair(op.name, compiled.size())).second) {
                throw ContractError(contract.name, op.name,
                                    "Operation " + contract.name + "." + op.name
                                    + " is declared more than once");
            }
            if (!op.hasLevel) {
                throw ContractError(contract.name, op.name,
                                    "Operation " + contract.name + "." + op.name
                                    + " must declare a log level");
            }
            if (op.returnKind == ReturnKind::UNSUPPORTED) {
                throw ContractError(contract.name, op.name,
                                    "Return type " + op.returnTypeName + " of operation "
                                    + contract.name + "." + op.name
                                    + " not supported, expected void or Activity");
            }

            ValidatedTemplate validated = validateTemplate(op.templateStr, op.parameterNames(),
                                                           contract.name, op.name);
            Classification classification = classify(op.parameters, op.returnKind,
                                                     contract.name, op.name);
            compiled.emplace_back(op, std::move(validated), std::move(classification));
        }

        return std::make_shared<const CompiledContract>(contract.name, std::move(compiled));
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_COMPILED_CONTRACT_HPP
