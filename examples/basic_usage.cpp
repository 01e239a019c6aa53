#include "lunar_trace.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

// A trace contract: every message this component logs, declared in one place.
struct StoreTrace {
    static void declare(lunar_trace::ContractBuilder& c) {
        c.operation("Greet").info("Hello {name}").param<std::string>("name");
        c.operation("Restock").debug("Restocking {sku} with {quantity} units")
            .param<std::string>("sku").param<int>("quantity");
        c.operation("PriceChanged").warning("Price of {sku} moved to {price}")
            .param<std::string>("sku").param<double>("price");
        c.operation("Fail").error("failure {code}")
            .param<std::runtime_error>("ex").param<int>("code");
        c.operation("Noise").ignored();
    }
};

class Store {
public:
    void greet(const std::string& customer) {
        m_trace.log("Greet", customer);
    }

    void restock(const std::string& sku, int quantity) {
        m_trace.log("Restock", sku, quantity);
    }

    void reprice(const std::string& sku, double price) {
        m_trace.log("PriceChanged", sku, price);
    }

    void checkout(int code) {
        try {
            throw std::runtime_error("payment gateway timeout");
        } catch (const std::runtime_error& ex) {
            m_trace.log("Fail", ex, code);
        }
    }

    void tick() {
        m_trace.log("Noise");
    }

private:
    lunar_trace::Trace m_trace = lunar_trace::Tracer::bind<StoreTrace>("shop.Store");
};

int main() {
    lunar_trace::Tracing::configure()
        .minLevel(lunar_trace::LogLevel::DEBUG)
        .writeTo<lunar_trace::ConsoleSink>()
        .build();

    Store store;
    store.greet("Ada");
    store.restock("SKU-1", 12);
    store.reprice("SKU-1", 9.5);
    store.checkout(42);
    store.tick();   // declared as ignored, never printed

    // Contract mistakes surface when the contract is first bound.
    struct BrokenTrace {
        static void declare(lunar_trace::ContractBuilder& c) {
            c.operation("Oops").info("Hello {who}").param<std::string>("name");
        }
    };
    try {
        lunar_trace::Tracer::bind<BrokenTrace>("shop.Broken");
    } catch (const lunar_trace::TemplateError& e) {
        std::cout << "Rejected contract: " << e.what() << std::endl;
    }

    return 0;
}
