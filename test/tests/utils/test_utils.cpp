#include "test_utils.hpp"

void RecordingSinkAdapter::emit(const std::string &loggerName,
                                lunar_trace::LogLevel level,
                                const std::string &message,
                                const lunar_trace::Context &context,
                                const std::exception *exception) {
    RecordedEntry entry;
    entry.loggerName = loggerName;
    entry.level = level;
    entry.message = message;
    entry.context = context;
    entry.exception = exception;
    if (exception) {
        entry.exceptionText = exception->what();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
}

std::vector<RecordedEntry> RecordingSinkAdapter::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

size_t RecordingSinkAdapter::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void RecordingSinkAdapter::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

std::string TestUtils::contextString(const lunar_trace::Context &context, const std::string &key) {
    const lunar_trace::Value *value = lunar_trace::findContextValue(context, key);
    return value ? value->toString() : std::string();
}

std::vector<std::string> TestUtils::contextKeys(const lunar_trace::Context &context) {
    std::vector<std::string> keys;
    for (const auto &entry : context) {
        keys.push_back(entry.first);
    }
    return keys;
}

lunar_trace::ContractSpec TestUtils::singleOperation(const lunar_trace::OperationSpec &op,
                                                     const std::string &contractName) {
    lunar_trace::ContractSpec contract;
    contract.name = contractName;
    contract.operations.push_back(op);
    return contract;
}

lunar_trace::ParameterSpec TestUtils::parameter(const std::string &name, lunar_trace::ParamKind kind,
                                                size_t position) {
    lunar_trace::ParameterSpec p;
    p.name = name;
    p.kind = kind;
    p.position = position;
    return p;
}
