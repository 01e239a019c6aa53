#ifndef LUNAR_TRACE_CONTRACT_REGISTRY_HPP
#define LUNAR_TRACE_CONTRACT_REGISTRY_HPP

#include "../compiler/compiled_contract.hpp"
#include "../contract/contract_builder.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>

namespace lunar_trace {

    /// Cache of compiled contracts, one per contract type.
    ///
    /// Compilation runs under the registry's mutex, so concurrent first uses
    /// of a contract type all observe the same CompiledContract. A contract
    /// that fails to compile is not cached; asking again recompiles it and
    /// fails the same way, while other contracts stay usable.
    ///
    /// The process-wide registry is instance(). Entries are never evicted.
    class ContractRegistry {
    public:
        typedef std::function<ContractSpec()> DeclareFn;

        ContractRegistry() = default;

        ContractRegistry(const ContractRegistry &) = delete;
        ContractRegistry &operator=(const ContractRegistry &) = delete;

        static ContractRegistry &instance() {
            static ContractRegistry s_registry;
            return s_registry;
        }

        /// Returns the cached contract for @p contractType, compiling the
        /// result of @p declare on first use.
        /// @throws ContractError if the declaration does not compile.
        std::shared_ptr<const CompiledContract> getOrCompile(std::type_index contractType,
                                                             const DeclareFn &declare) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_contracts.find(contractType);
            if (it != m_contracts.end()) {
                return it->second;
            }

            std::shared_ptr<const CompiledContract> compiled = compileContract(declare());
            m_contracts.insert(std::make_pair(contractType, compiled));
            return compiled;
        }

        /// Typed form: the declaration comes from ContractType::declare.
        template<typename ContractType>
        std::shared_ptr<const CompiledContract> getOrCompile() {
            return getOrCompile(std::type_index(typeid(ContractType)), &describeContract<ContractType>);
        }

        bool contains(std::type_index contractType) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_contracts.find(contractType) != m_contracts.end();
        }

        template<typename ContractType>
        bool contains() const {
            return contains(std::type_index(typeid(ContractType)));
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_contracts.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::type_index, std::shared_ptr<const CompiledContract> > m_contracts;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_CONTRACT_REGISTRY_HPP
