/**
 * @file  fuzz_formula.cpp
 * @brief libFuzzer target for the formula compiler and engine assignment
 *
 * Build:
 *   cmake -DHYPERCUBE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_formula
 *
 * Run for 60 seconds:
 *   ./fuzz_formula -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed or over-nested text only ever raises FormulaSyntaxError.
 *   3. A formula that compiles:
 *      a. re-compiles from its canonical rendering with the same dependencies,
 *         unless the added grouping crosses the nesting limit
 *      b. evaluates against scalar arguments or raises EvaluationError
 *   4. Engine::set_formula never throws; on CircularDependency the cycle
 *      starts at the assigned metric.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "hypercube/engine.hpp"
#include "hypercube/formula.hpp"

using namespace hypercube;
using namespace hypercube::formula;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    SafeIdCache ids;
    ids.register_id("rev-2024");
    ids.register_id("cost");

    try {
        const auto compiled = FormulaCompiler::compile(input, ids);

        // Invariant 3a: canonical form is itself a valid formula
        try {
            const auto again = FormulaCompiler::compile(compiled.canonical(), ids);
            assert(again.dependencies().size() == compiled.dependencies().size());
        } catch (const FormulaSyntaxError& e) {
            assert(std::string_view(e.what()).find("nested deeper") != std::string_view::npos);
        }

        // Invariant 3b: evaluation either succeeds or reports EvaluationError
        std::vector<NdArray> args(compiled.dependencies().size(), NdArray::scalar(1.5));
        try {
            const auto out = compiled.evaluate(args);
            for (Eigen::Index i = 0; i < out.values.size(); ++i) {
                assert(std::isfinite(out.values(i)));
            }
        } catch (const EvaluationError&) {
        }
    } catch (const FormulaSyntaxError&) {
    }

    // Invariant 4: engine assignment never throws
    core::EngineConfig cfg;
    cfg.worker_threads = 0;
    cfg.logger = std::make_shared<spdlog::logger>(
        "fuzz", std::make_shared<spdlog::sinks::null_sink_mt>());
    core::Engine engine(cfg);
    (void)engine.set_formula("seed", "target + 1");
    if (const auto err = engine.set_formula("target", input)) {
        if (err->kind == ErrorKind::CircularDependency) {
            assert(!err->cycle.empty() && err->cycle.front() == "target");
        }
    }

    return 0;
}
