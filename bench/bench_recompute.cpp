/**
 * @file  bench/bench_recompute.cpp
 * @brief Google Benchmark suite for incremental and full recompute.
 *
 * Benchmarks
 * ----------
 *   BM_FullRecompute_Chain       — N-node chain over a 36-month horizon
 *   BM_Incremental_TailUpdate    — update near the end of the chain
 *   BM_Incremental_HeadUpdate    — update at the root (whole chain affected)
 *   BM_Tier_WideFanOut           — one root, N parallel dependents
 *   BM_Compile_Formula           — formula text → CompiledFormula
 *
 * Build (CMake):
 *   cmake -DHYPERCUBE_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_recompute
 *   ./build/bench_recompute --benchmark_format=json
 *
 * Throughput units: items/second (nodes recomputed).
 */

#include "benchmark/benchmark.h"

#include "hypercube/engine.hpp"
#include "hypercube/formula.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <vector>

using namespace hypercube;
using namespace hypercube::core;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static EngineConfig bench_config(std::size_t workers) {
    EngineConfig cfg;
    cfg.worker_threads = workers;
    cfg.logger = std::make_shared<spdlog::logger>(
        "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
    return cfg;
}

static std::vector<std::string> months(int n) {
    std::vector<std::string> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(fmt::format("{}-{:02}", 2024 + i / 12, i % 12 + 1));
    }
    return out;
}

/// n0 (input) → n1 → ... → n{length}, each node = previous * 1.01 + 1.
static void build_chain(Engine& engine, int length) {
    (void)engine.initialize_horizon(months(36));
    for (int i = 1; i <= length; ++i) {
        (void)engine.set_formula(fmt::format("n{}", i), fmt::format("n{} * 1.01 + 1", i - 1));
    }
}

// ── Chain benchmarks ──────────────────────────────────────────────────────────

static void BM_FullRecompute_Chain(benchmark::State& state) {
    const int length = static_cast<int>(state.range(0));
    Engine engine(bench_config(0));
    build_chain(engine, length);
    (void)engine.update_input("n0", "2024-01", 100.0);

    for (auto _ : state) {
        auto outcome = engine.full_recompute();
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * length);
}
BENCHMARK(BM_FullRecompute_Chain)->Arg(100)->Arg(1000);

static void BM_Incremental_TailUpdate(benchmark::State& state) {
    const int length = static_cast<int>(state.range(0));
    Engine engine(bench_config(0));
    build_chain(engine, length);
    (void)engine.full_recompute();

    // Only the last five nodes sit downstream of n{length-5}.
    const std::string target = fmt::format("n{}", length - 5);
    double value = 1.0;
    for (auto _ : state) {
        auto outcome = engine.update_input(target, "2024-06", value);
        benchmark::DoNotOptimize(outcome);
        value += 1.0;
    }
    state.SetItemsProcessed(state.iterations() * 5);
}
BENCHMARK(BM_Incremental_TailUpdate)->Arg(1000);

static void BM_Incremental_HeadUpdate(benchmark::State& state) {
    const int length = static_cast<int>(state.range(0));
    Engine engine(bench_config(0));
    build_chain(engine, length);

    double value = 1.0;
    for (auto _ : state) {
        auto outcome = engine.update_input("n0", "2024-06", value);
        benchmark::DoNotOptimize(outcome);
        value += 1.0;
    }
    state.SetItemsProcessed(state.iterations() * length);
}
BENCHMARK(BM_Incremental_HeadUpdate)->Arg(1000);

// ── Tier fan-out ──────────────────────────────────────────────────────────────

static void BM_Tier_WideFanOut(benchmark::State& state) {
    const int width   = static_cast<int>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));
    Engine engine(bench_config(workers));
    (void)engine.initialize_horizon(months(36));
    for (int i = 0; i < width; ++i) {
        (void)engine.set_formula(fmt::format("leaf{}", i),
                                 fmt::format("sqrt(abs(root * {})) + exp(root / 1000)", i + 1));
    }

    double value = 1.0;
    for (auto _ : state) {
        auto outcome = engine.update_input("root", "2024-01", value);
        benchmark::DoNotOptimize(outcome);
        value += 1.0;
    }
    state.SetItemsProcessed(state.iterations() * width);
}
BENCHMARK(BM_Tier_WideFanOut)->Args({512, 0})->Args({512, 4});

// ── Compiler ──────────────────────────────────────────────────────────────────

static void BM_Compile_Formula(benchmark::State& state) {
    formula::SafeIdCache ids;
    ids.register_id("marketing-budget");
    const std::string text = "max(marketing-budget / CAC, 0) * ARPU ^ 1.05 - churn * 0.3";
    for (auto _ : state) {
        auto compiled = formula::FormulaCompiler::compile(text, ids);
        benchmark::DoNotOptimize(compiled);
    }
}
BENCHMARK(BM_Compile_Formula);

BENCHMARK_MAIN();
