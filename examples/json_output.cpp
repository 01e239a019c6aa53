#include "lunar_trace.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

struct PaymentTrace {
    static void declare(lunar_trace::ContractBuilder& c) {
        c.operation("Charged").info("Charged {amount} to {account}")
            .param<double>("amount").param<std::string>("account");
        c.operation("Declined").warning("Card declined for {account}, attempt {attempt}")
            .param<std::string>("account").param<unsigned>("attempt");
        c.operation("Crashed").error("Processor crashed")
            .param<std::logic_error>("ex");
    }
};

int main() {
    // JSON lines on stdout, with application and environment attributes.
    lunar_trace::Tracing::configure()
        .writeTo<lunar_trace::CallbackSink>(
            lunar_trace::CallbackSink::StringCallback([](const std::string& line) {
                std::cout << line << '\n';
            }),
            lunar_trace::detail::make_unique<lunar_trace::JsonFormatter>("payments", "staging"))
        .build();

    lunar_trace::Trace trace = lunar_trace::Tracer::bind<PaymentTrace>("billing.Processor");
    trace.log("Charged", 19.99, "acct-17");
    trace.log("Declined", "acct-42", 2u);

    try {
        try {
            throw std::runtime_error("connection reset");
        } catch (const std::exception&) {
            std::throw_with_nested(std::logic_error("processor state lost"));
        }
    } catch (const std::logic_error& ex) {
        trace.log("Crashed", ex);
    }

    return 0;
}
