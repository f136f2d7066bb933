#pragma once

#include <cstddef>

/// @file include/hypercube/constants.hpp
/// @brief Engine-wide defaults and tolerances for the hypercube engine.

namespace hypercube::constants {

// ─── Scheduling ───────────────────────────────────────────────────────────────

/// Default size of the bounded worker pool used for tier evaluation.
static constexpr std::size_t DEFAULT_WORKER_THREADS = 4;

/// Tiers with fewer nodes than this are evaluated inline on the caller's
/// thread. Long single-node chains never pay pool dispatch overhead.
static constexpr std::size_t DEFAULT_PARALLEL_TIER_THRESHOLD = 8;

// ─── Explainability ───────────────────────────────────────────────────────────

/// Default number of trace entries retained by the explainability log.
static constexpr std::size_t DEFAULT_TRACE_CAPACITY = 1000;

/// Default number of entries returned by `get_trace()` when no limit is given.
static constexpr std::size_t DEFAULT_TRACE_LIMIT = 10;

// ─── Formulas ─────────────────────────────────────────────────────────────────

/// Deepest nesting of parentheses, calls, unary signs and `^` operands the
/// formula parser accepts. Sums and products of any length are flat and do
/// not count against it.
static constexpr std::size_t MAX_FORMULA_DEPTH = 256;

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// Category assigned to metrics created without an explicit category,
/// including auto-registered placeholders.
static constexpr const char* DEFAULT_CATEGORY = "operational";

/// Extent used for a declared dimension that is not (yet) in the catalog.
static constexpr std::size_t UNKNOWN_DIMENSION_EXTENT = 1;

/// Remediation hint attached to every circular-dependency rejection.
static constexpr const char* CYCLE_SUGGESTION =
    "break the loop by introducing a lagged reference (prior-period value) "
    "or by turning one of the metrics into an input";

} // namespace hypercube::constants
