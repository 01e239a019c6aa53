#include <benchmark/benchmark.h>
#include <memory>
#include <stdexcept>
#include <string>
#include "lunar_trace.hpp"
#include "null_sink.hpp"

namespace {
    struct BenchTrace {
        static void declare(lunar_trace::ContractBuilder& c) {
            c.operation("Greet").info("Hello {name}").param<std::string>("name");
            c.operation("Order").info("Order {id} of {count} items at {price}")
                .param<long long>("id").param<int>("count").param<double>("price");
            c.operation("Fail").error("failure {code}")
                .param<std::runtime_error>("ex").param<int>("code");
            c.operation("Step").debug("Step {n}").param<int>("n")
                .returns<lunar_trace::Activity>();
            c.operation("Noise").ignored();
        }
    };
}

// ---------------------------------------------------------------------------
// BM_Log_NullAdapter
// Full call path (lookup, argument binding, formatting) with an adapter that
// discards the record.
// ---------------------------------------------------------------------------
static void BM_Log_NullAdapter(benchmark::State& state) {
    auto trace = lunar_trace::Tracer::bind<BenchTrace>(
        "bench", std::make_shared<lunar_trace::NullSinkAdapter>());

    for (auto _ : state) {
        trace.log("Greet", "World");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_NullAdapter);

// ---------------------------------------------------------------------------
// BM_Log_ThreeParameters
// Mixed integer and floating point parameters, all copied into context.
// ---------------------------------------------------------------------------
static void BM_Log_ThreeParameters(benchmark::State& state) {
    auto trace = lunar_trace::Tracer::bind<BenchTrace>(
        "bench", std::make_shared<lunar_trace::NullSinkAdapter>());

    for (auto _ : state) {
        trace.log("Order", 123456789LL, 3, 19.99);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_ThreeParameters);

// ---------------------------------------------------------------------------
// BM_Log_Ignored
// NONE-level operation: returns after the lookup.
// ---------------------------------------------------------------------------
static void BM_Log_Ignored(benchmark::State& state) {
    auto trace = lunar_trace::Tracer::bind<BenchTrace>(
        "bench", std::make_shared<lunar_trace::NullSinkAdapter>());

    for (auto _ : state) {
        trace.log("Noise");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Ignored);

// ---------------------------------------------------------------------------
// BM_Log_Backend
// Record goes through SinkBackend: level mapping, LogEntry construction,
// write to a sink that drops it.
// ---------------------------------------------------------------------------
static void BM_Log_Backend(benchmark::State& state) {
    auto backend = std::make_shared<lunar_trace::SinkBackend>();
    backend->addSink(lunar_trace::detail::make_unique<lunar_trace::NullSink>());
    auto trace = lunar_trace::Tracer::bind<BenchTrace>("bench", backend);

    for (auto _ : state) {
        trace.log("Greet", "World");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Backend);

// ---------------------------------------------------------------------------
// BM_Log_WithException
// Exception slot plus nested-chain extraction in the backend.
// ---------------------------------------------------------------------------
static void BM_Log_WithException(benchmark::State& state) {
    auto backend = std::make_shared<lunar_trace::SinkBackend>();
    backend->addSink(lunar_trace::detail::make_unique<lunar_trace::NullSink>());
    auto trace = lunar_trace::Tracer::bind<BenchTrace>("bench", backend);
    std::runtime_error ex("disk full");

    for (auto _ : state) {
        trace.log("Fail", ex, 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_WithException);

// ---------------------------------------------------------------------------
// BM_Activity_StartClose
// Two records per iteration plus the clock reads.
// ---------------------------------------------------------------------------
static void BM_Activity_StartClose(benchmark::State& state) {
    auto trace = lunar_trace::Tracer::bind<BenchTrace>(
        "bench", std::make_shared<lunar_trace::NullSinkAdapter>());

    for (auto _ : state) {
        lunar_trace::Activity step = trace.start("Step", 1);
        step.close();
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_Activity_StartClose);

// ---------------------------------------------------------------------------
// BM_Compile_Contract
// Cost of compileContract alone, as paid once per contract type.
// ---------------------------------------------------------------------------
static void BM_Compile_Contract(benchmark::State& state) {
    lunar_trace::ContractSpec spec = lunar_trace::describeContract<BenchTrace>();

    for (auto _ : state) {
        auto compiled = lunar_trace::compileContract(spec);
        benchmark::DoNotOptimize(compiled);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Compile_Contract);

// ---------------------------------------------------------------------------
// BM_Format_Json
// JsonFormatter on a record with three context fields.
// ---------------------------------------------------------------------------
static void BM_Format_Json(benchmark::State& state) {
    lunar_trace::JsonFormatter formatter("bench", "local");
    lunar_trace::LogEntry entry;
    entry.severity = lunar_trace::Severity::INFO;
    entry.loggerName = "bench";
    entry.message = "Order 1 of 3 items at 19.99";
    entry.timestamp = std::chrono::system_clock::now();
    entry.context.emplace_back("id", lunar_trace::Value::integer(1));
    entry.context.emplace_back("count", lunar_trace::Value::integer(3));
    entry.context.emplace_back("price", lunar_trace::Value::floating(19.99));

    for (auto _ : state) {
        std::string out = formatter.format(entry);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Format_Json);

BENCHMARK_MAIN();
