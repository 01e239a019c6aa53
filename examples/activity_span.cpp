#include "lunar_trace.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

struct ImportTrace {
    static void declare(lunar_trace::ContractBuilder& c) {
        c.operation("Import").info("Importing {file}")
            .param<std::string>("file").returns<lunar_trace::Activity>();
        c.operation("Batch").debug("Batch {index} of {file}")
            .param<int>("index").param<std::string>("file").returns<lunar_trace::Activity>();
        c.operation("Rejected").error("Import of {file} failed")
            .param<std::string>("file").param<std::exception>("ex");
    }
};

static void parse(const std::string& file) {
    if (file == "broken.csv") {
        throw std::runtime_error("unexpected end of file");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
}

int main() {
    lunar_trace::Tracing::configure()
        .minLevel(lunar_trace::LogLevel::DEBUG)
        .writeTo<lunar_trace::ConsoleSink>()
        .build();

    lunar_trace::Trace trace = lunar_trace::Tracer::bind<ImportTrace>("etl.Importer");

    std::vector<std::string> files = {"orders.csv", "broken.csv"};
    for (const auto& file : files) {
        try {
            // "Importing orders.csv [+]" now, "Importing orders.csv [0.051]" at scope exit
            lunar_trace::Activity import = trace.start("Import", file);
            for (int i = 0; i < 2; ++i) {
                lunar_trace::Activity batch = trace.start("Batch", i, file);
                parse(file);
            }
        } catch (const std::exception& ex) {
            // Both spans were closed during unwinding.
            trace.log("Rejected", file, ex);
        }
    }

    // Explicit close when the span ends before its scope does.
    lunar_trace::Activity tail = trace.start("Import", std::string("tail.csv"));
    parse("tail.csv");
    tail.close();

    return 0;
}
