#ifndef LUNAR_TRACE_CONTRACT_BUILDER_HPP
#define LUNAR_TRACE_CONTRACT_BUILDER_HPP

#include "operation_spec.hpp"
#include "../core/exception_info.hpp"
#include <string>
#include <deque>
#include <typeinfo>

namespace lunar_trace {

    class Activity;

    namespace detail {
        template<typename R>
        struct ReturnKindOf {
            static ReturnKind kind() { return ReturnKind::UNSUPPORTED; }
            static std::string typeName() { return demangleTypeName(typeid(R).name()); }
        };

        template<>
        struct ReturnKindOf<void> {
            static ReturnKind kind() { return ReturnKind::VOID; }
            static std::string typeName() { return std::string(); }
        };

        template<>
        struct ReturnKindOf<Activity> {
            static ReturnKind kind() { return ReturnKind::ACTIVITY; }
            static std::string typeName() { return "lunar_trace::Activity"; }
        };
    } // namespace detail

    /// Fluent declaration of a single operation. Obtained from
    /// ContractBuilder::operation(); the reference stays valid for the
    /// lifetime of the builder.
    class OperationBuilder {
    public:
        explicit OperationBuilder(const std::string &name) {
            m_spec.name = name;
        }

        OperationBuilder &debug(const std::string &templateStr) {
            return level(LogLevel::DEBUG, templateStr);
        }

        OperationBuilder &info(const std::string &templateStr) {
            return level(LogLevel::INFO, templateStr);
        }

        OperationBuilder &warning(const std::string &templateStr) {
            return level(LogLevel::WARNING, templateStr);
        }

        OperationBuilder &error(const std::string &templateStr) {
            return level(LogLevel::ERROR, templateStr);
        }

        /// Declares an operation that never emits.
        OperationBuilder &ignored(const std::string &text = "ignored") {
            return level(LogLevel::NONE, text);
        }

        OperationBuilder &level(LogLevel lvl, const std::string &templateStr) {
            m_spec.level = lvl;
            m_spec.hasLevel = true;
            m_spec.templateStr = templateStr;
            return *this;
        }

        /// Appends a parameter whose kind is derived from T.
        template<typename T>
        OperationBuilder &param(const std::string &name) {
            ParameterSpec p;
            p.name = name;
            p.kind = kindOf<T>();
            p.position = m_spec.parameters.size();
            p.typeName = detail::demangleTypeName(typeid(T).name());
            m_spec.parameters.push_back(p);
            return *this;
        }

        /// void (the default) fires a record, Activity returns a timed span.
        /// Any other type is kept so that compilation can reject it.
        template<typename R>
        OperationBuilder &returns() {
            m_spec.returnKind = detail::ReturnKindOf<R>::kind();
            m_spec.returnTypeName = detail::ReturnKindOf<R>::typeName();
            return *this;
        }

        const OperationSpec &spec() const { return m_spec; }

    private:
        OperationSpec m_spec;
    };

    /// Collects the operations of a contract.
    ///
    /// A contract type exposes them through a static declare function:
    /// @code
    ///   struct StoreTrace {
    ///       static void declare(lunar_trace::ContractBuilder& c) {
    ///           c.operation("Greet").info("Hello {name}").param<std::string>("name");
    ///       }
    ///   };
    /// @endcode
    class ContractBuilder {
    public:
        explicit ContractBuilder(const std::string &name) : m_name(name) {}

        /// Overrides the contract name (the demangled type name by default).
        ContractBuilder &name(const std::string &contractName) {
            m_name = contractName;
            return *this;
        }

        OperationBuilder &operation(const std::string &operationName) {
            m_operations.push_back(OperationBuilder(operationName));
            return m_operations.back();
        }

        ContractSpec spec() const {
            ContractSpec contract;
            contract.name = m_name;
            for (const auto &op : m_operations) {
                contract.operations.push_back(op.spec());
            }
            return contract;
        }

    private:
        std::string m_name;
        // deque: references handed out by operation() survive later appends
        std::deque<OperationBuilder> m_operations;
    };

    /// Runs ContractType::declare and returns the declared data.
    template<typename ContractType>
    ContractSpec describeContract() {
        ContractBuilder builder(detail::demangleTypeName(typeid(ContractType).name()));
        ContractType::declare(builder);
        return builder.spec();
    }

} // namespace lunar_trace

#endif // LUNAR_TRACE_CONTRACT_BUILDER_HPP
