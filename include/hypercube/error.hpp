#pragma once

/// @file include/hypercube/error.hpp
/// @brief Error values reported by the hypercube engine.
///
/// Structural and configuration failures are returned to the caller as
/// `EngineError` values. Evaluation failures are recovered per node inside a
/// batch; they are thrown internally as `EvaluationError` / `ShapeError` and
/// surface to the caller only as `NodeError` records.

#include "hypercube/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hypercube {

/// Category of an error returned from a public engine call.
enum class ErrorKind {
    CircularDependency,  ///< set_formula would close a cycle; graph unchanged
    InvalidFormula,      ///< formula text failed to parse or compile
    UnknownMetric,       ///< query names a metric that does not exist
    Configuration,       ///< horizon/dimension/coordinate misuse
};

/// Stable name of an ErrorKind, e.g. "CircularDependency".
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// An error surfaced synchronously to the caller of a structural or
/// configuration call. The call that produced it had no effect.
struct EngineError {
    ErrorKind             kind;
    std::string           message;
    std::vector<MetricId> cycle;       ///< CircularDependency only: ordered node list
    std::string           suggestion;  ///< Remediation hint, may be empty

    /// "<Kind>: <message>" plus the cycle path and suggestion when present.
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static EngineError configuration(std::string message);
    [[nodiscard]] static EngineError unknown_metric(const MetricId& id);
};

/// A formula that failed to evaluate during a recompute batch.
struct NodeError {
    MetricId    node;
    std::string message;
    bool        shape_error = false;  ///< true when caused by dimension misalignment

    bool operator==(const NodeError&) const = default;
};

// ─── Internal evaluation exceptions ───────────────────────────────────────────

/// Thrown while evaluating one node: bad reference, domain error or a
/// non-finite result. Caught per node by the scheduler.
class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Dimension misalignment between a dependency (or the result) and the
/// node being evaluated.
class ShapeError : public EvaluationError {
public:
    using EvaluationError::EvaluationError;
};

} // namespace hypercube
