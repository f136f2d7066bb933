#pragma once

/// @file include/hypercube/types.hpp
/// @brief Shared value types for the hypercube computation engine.
///
/// Every module includes this file. It defines metric identifiers, input
/// coordinates and the dense N-dimensional array (`NdArray`) that backs each
/// metric's tensor. Storage is an Eigen array in row-major order with the
/// time axis last.

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace hypercube {

/// Unique metric (node) identifier as supplied by the caller.
using MetricId = std::string;

/// Dense index of a metric inside the registry, stable for its lifetime.
using NodeIndex = std::size_t;

/// Extents of an N-dimensional array, outermost axis first.
using Shape = std::vector<std::size_t>;

/// Dimension name → member label for a coordinate-scoped write or filter.
using Coordinates = std::map<std::string, std::string>;

// ─── NdArray ──────────────────────────────────────────────────────────────────

/// A dense row-major N-dimensional array of doubles.
///
/// A rank-0 array (empty shape) is a scalar and holds exactly one value.
/// The last axis of every metric tensor is the time horizon.
struct NdArray {
    Shape           shape;   ///< Axis extents, outermost first
    Eigen::ArrayXd  values;  ///< Row-major storage, size == element_count(shape)

    /// Rank-0 array holding `v`.
    [[nodiscard]] static NdArray scalar(double v);

    /// Zero-filled array of the given shape.
    [[nodiscard]] static NdArray zeros(const Shape& shape);

    /// True if this is a rank-0 scalar.
    [[nodiscard]] bool is_scalar() const noexcept { return shape.empty(); }

    /// Number of stored elements.
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(values.size());
    }
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// One coordinate-scoped input write.
///
/// Dimensions of the target metric that are absent from `coords` broadcast
/// the write across that whole axis.
struct InputValue {
    std::string month;   ///< Horizon label, e.g. "2024-01"
    Coordinates coords;  ///< dim → member; unspecified dims broadcast
    double      value;   ///< Value written at every addressed cell
};

} // namespace hypercube
