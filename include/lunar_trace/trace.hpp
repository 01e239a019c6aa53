#ifndef LUNAR_TRACE_TRACE_HPP
#define LUNAR_TRACE_TRACE_HPP

#include "activity.hpp"
#include "tracing.hpp"
#include "compiler/compiled_contract.hpp"
#include "registry/contract_registry.hpp"
#include "core/errors.hpp"
#include "core/exception_info.hpp"
#include "sink/sink_adapter.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace lunar_trace {

    /// A compiled contract bound to an owner name and a sink. Cheap to copy;
    /// every copy shares the compiled dispatch table.
    ///
    /// @code
    ///   static lunar_trace::Trace trace =
    ///       lunar_trace::Tracer::bind<StoreTrace>("shop.Store");
    ///
    ///   trace.log("Greet", "Ada");                  // "Hello Ada"
    ///   auto import = trace.start("Import", path);  // "Importing a.csv [+]"
    /// @endcode
    class Trace {
    public:
        Trace(std::shared_ptr<const CompiledContract> contract,
              std::string ownerName,
              std::shared_ptr<ISinkAdapter> sink)
            : m_contract(std::move(contract))
            , m_ownerName(std::move(ownerName))
            , m_sink(std::move(sink)) {
            if (!m_contract) {
                throw std::invalid_argument("lunar_trace::Trace requires a compiled contract");
            }
            if (!m_sink) {
                throw std::invalid_argument("lunar_trace::Trace requires a sink for \"" + m_ownerName + "\"");
            }
        }

        /// Fires a void operation.
        /// @throws DispatchError for an unknown or Activity-returning operation.
        /// @throws FormatError if an argument does not fit its parameter.
        template<typename... Args>
        void log(const std::string &operation, const Args &... args) const {
            const CompiledOperation &op = lookup(operation, false);
            if (op.level() == LogLevel::NONE) return;

            FormattedRecord record = op.format(std::vector<Value>{makeValue(args)...});
            m_sink->emit(m_ownerName, record);
        }

        /// Starts an Activity-returning operation. The formatted message
        /// names the span; context fields carry over to both of its records.
        /// @throws DispatchError for an unknown or void operation.
        /// @throws FormatError if an argument does not fit its parameter.
        template<typename... Args>
        Activity start(const std::string &operation, const Args &... args) const {
            const CompiledOperation &op = lookup(operation, true);
            if (op.level() == LogLevel::NONE) {
                return Activity(nullptr, m_ownerName, op.name(), Context(), LogLevel::NONE);
            }

            FormattedRecord record = op.format(std::vector<Value>{makeValue(args)...});
            return Activity(m_sink, m_ownerName, std::move(record.message),
                            std::move(record.context), record.level);
        }

        const std::string &ownerName() const { return m_ownerName; }
        const CompiledContract &contract() const { return *m_contract; }
        const std::shared_ptr<ISinkAdapter> &sink() const { return m_sink; }

    private:
        const CompiledOperation &lookup(const std::string &operation, bool wantActivity) const {
            const CompiledOperation *op = m_contract->find(operation);
            if (!op) {
                throw DispatchError(m_contract->name(), operation, "no such operation");
            }
            if (op->returnsActivity() != wantActivity) {
                throw DispatchError(m_contract->name(), operation,
                                    wantActivity ? "operation does not return an Activity, use log()"
                                                 : "operation returns an Activity, use start()");
            }
            return *op;
        }

        std::shared_ptr<const CompiledContract> m_contract;
        std::string m_ownerName;
        std::shared_ptr<ISinkAdapter> m_sink;
    };

    /// Binds contract types to owner names.
    ///
    /// Compilation happens once per contract type in the process-wide
    /// ContractRegistry; each binding only adds its owner name and sink.
    class Tracer {
    public:
        Tracer() = delete;

        /// Records go to Tracing::sinkFor(ownerName).
        /// @throws ContractError if ContractType does not compile.
        template<typename ContractType>
        static Trace bind(const std::string &ownerName) {
            return bind<ContractType>(ownerName, Tracing::sinkFor(ownerName));
        }

        template<typename ContractType>
        static Trace bind(const std::string &ownerName, std::shared_ptr<ISinkAdapter> sink) {
            return Trace(ContractRegistry::instance().getOrCompile<ContractType>(),
                         ownerName, std::move(sink));
        }

        /// Uses the demangled name of OwnerType as the owner name, for the
        /// common case of one trace per class.
        template<typename ContractType, typename OwnerType>
        static Trace bindFor() {
            return bind<ContractType>(detail::demangleTypeName(typeid(OwnerType).name()));
        }
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_TRACE_HPP
