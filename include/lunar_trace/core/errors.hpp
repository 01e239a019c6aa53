#ifndef LUNAR_TRACE_ERRORS_HPP
#define LUNAR_TRACE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lunar_trace {

    /// A contract declaration that cannot be compiled.
    /// Thrown while a contract is being registered, never from a logging call.
    class ContractError : public std::logic_error {
    public:
        ContractError(const std::string &contractName,
                      const std::string &operationName,
                      const std::string &what)
            : std::logic_error(what)
            , m_contractName(contractName)
            , m_operationName(operationName) {}

        const std::string &contractName() const { return m_contractName; }

        /// Empty when the error concerns the contract as a whole.
        const std::string &operationName() const { return m_operationName; }

    private:
        std::string m_contractName;
        std::string m_operationName;
    };

    /// A message template with a placeholder that matches no parameter,
    /// or a stray brace left after placeholder substitution.
    class TemplateError : public ContractError {
    public:
        TemplateError(const std::string &contractName,
                      const std::string &operationName,
                      const std::string &token,
                      const std::string &templateText)
            : ContractError(contractName, operationName,
                            "Invalid format argument '" + token + "' in template \""
                            + templateText + "\" for operation "
                            + contractName + "." + operationName)
            , m_token(token)
            , m_templateText(templateText) {}

        const std::string &token() const { return m_token; }
        const std::string &templateText() const { return m_templateText; }

    private:
        std::string m_token;
        std::string m_templateText;
    };

    /// An exception parameter the record layout cannot carry: a second one
    /// on a plain operation, or any on a timed-span operation.
    class ClassificationError : public ContractError {
    public:
        ClassificationError(const std::string &contractName,
                            const std::string &operationName,
                            const std::string &parameterName,
                            const std::string &reason)
            : ContractError(contractName, operationName,
                            "Parameter '" + parameterName + "' of operation "
                            + contractName + "." + operationName + ": " + reason)
            , m_parameterName(parameterName) {}

        const std::string &parameterName() const { return m_parameterName; }

    private:
        std::string m_parameterName;
    };

    /// An argument that could not be rendered while formatting a record.
    class FormatError : public std::runtime_error {
    public:
        FormatError(const std::string &operationName,
                    const std::string &parameterName,
                    const std::string &reason)
            : std::runtime_error("Cannot format argument '" + parameterName
                                 + "' of operation " + operationName + ": " + reason)
            , m_operationName(operationName)
            , m_parameterName(parameterName) {}

        const std::string &operationName() const { return m_operationName; }
        const std::string &parameterName() const { return m_parameterName; }

    private:
        std::string m_operationName;
        std::string m_parameterName;
    };

    /// A call on a bound trace that names no operation of its contract, or
    /// uses the wrong call form (log vs. start) for the operation.
    class DispatchError : public std::invalid_argument {
    public:
        DispatchError(const std::string &contractName,
                      const std::string &operationName,
                      const std::string &reason)
            : std::invalid_argument(contractName + "." + operationName + ": " + reason)
            , m_contractName(contractName)
            , m_operationName(operationName) {}

        const std::string &contractName() const { return m_contractName; }
        const std::string &operationName() const { return m_operationName; }

    private:
        std::string m_contractName;
        std::string m_operationName;
    };

} // namespace lunar_trace

#endif // LUNAR_TRACE_ERRORS_HPP
