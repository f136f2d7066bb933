#pragma once

/// @file include/hypercube/tensor.hpp
/// @brief Tensor Store & broadcasting kernels.
///
/// # Module: Tensor Store
///
/// ## Responsibility
/// Own the dense array behind every metric and provide the array arithmetic
/// used by compiled formulas:
///   - `TensorStore`        — one `NdArray` per metric, zero-filled on allocation
///   - broadcasting kernels — numpy-style elementwise arithmetic over NdArrays
///   - `align_dependency`   — lay a dependency's tensor out over the dependent's
///                            dimension order so the two broadcast correctly
///
/// ## Broadcasting Rules
/// Shapes are right-aligned; two extents are compatible when they are equal or
/// one of them is 1. A scalar (rank 0) broadcasts against anything. Equal
/// shapes take a fast path that maps straight onto Eigen array expressions.
///
/// ## Guarantees
/// - A tensor is never shared between metrics
/// - Distinct slots may be written concurrently once allocated
///   (the slot vector is never resized during a recompute batch)
///
/// ## NOT Responsible For
/// - Deciding tensor shapes (see core engine: dims + horizon)
/// - Per-node failure policy (see scheduler.hpp)

#include "hypercube/types.hpp"
#include "hypercube/error.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hypercube::tensor {

// ─── Shape helpers ────────────────────────────────────────────────────────────

/// Product of all extents (1 for a scalar shape).
[[nodiscard]] std::size_t element_count(const Shape& shape) noexcept;

/// Row-major strides for `shape`, in elements.
[[nodiscard]] std::vector<std::size_t> row_major_strides(const Shape& shape);

/// Broadcast result shape of `a` and `b`, or `nullopt` if incompatible.
[[nodiscard]] std::optional<Shape>
broadcast_shape(const Shape& a, const Shape& b);

/// Expand `a` into `target` following the broadcasting rules.
///
/// # Returns
/// The materialised array, or `nullopt` if `a` cannot broadcast to `target`.
[[nodiscard]] std::optional<NdArray>
broadcast_to(const NdArray& a, const Shape& target);

/// Materialise a strided view of `src` with shape `out_shape`.
///
/// `src_strides[i]` is the step through `src.values` for one step along
/// output axis `i`; a stride of 0 repeats the same source element.
[[nodiscard]] NdArray strided_gather(const NdArray& src,
                                     const Shape& out_shape,
                                     std::span<const std::size_t> src_strides);

/// Human-readable "(3, 2, 12)" rendering of a shape.
[[nodiscard]] std::string shape_to_string(const Shape& shape);

// ─── Elementwise kernels ──────────────────────────────────────────────────────

/// Binary elementwise operations available to formulas.
enum class BinaryOp { Add, Sub, Mul, Div, Pow, Min, Max };

/// Unary elementwise operations available to formulas.
enum class UnaryOp { Negate, Abs, Sqrt, Exp, Log };

/// Apply `op` elementwise with broadcasting.
///
/// Throws `ShapeError` if the operand shapes cannot be broadcast together.
/// Non-finite values are produced as-is (IEEE semantics); the caller decides
/// whether they are acceptable.
[[nodiscard]] NdArray apply(BinaryOp op, const NdArray& a, const NdArray& b);

/// Apply `op` to every element of `a`.
[[nodiscard]] NdArray apply(UnaryOp op, const NdArray& a);

// ─── Dimension alignment ──────────────────────────────────────────────────────

/// Lay out a dependency tensor over the dependent's dimension order.
///
/// For each dimension of `target_dims`, in order: if the dependency varies
/// over it, that axis keeps its extent (transposing if the dependency declares
/// its dims in a different order); otherwise a size-1 axis is inserted. The
/// shared time axis is appended unchanged.
///
/// Fallback precedence:
///   1. exact match (`dep_dims == target_dims`) → returned unchanged
///   2. dimension expand / transpose             → size-1 axes inserted
///   3. uniform broadcast                        → a dependency holding exactly
///      one time series is laid out as (1, …, 1, T)
///   4. otherwise throws `ShapeError`
///
/// # Arguments
/// * `dep`          — Dependency tensor (its dims + time axis)
/// * `dep_id`       — Dependency id, used in error messages
/// * `dep_dims`     — Dimensions the dependency declares
/// * `target_dims`  — Dimensions the dependent declares
[[nodiscard]] NdArray
align_dependency(const NdArray& dep,
                 const MetricId& dep_id,
                 std::span<const std::string> dep_dims,
                 std::span<const std::string> target_dims);

/// Fit a formula result into the node's tensor shape.
///
/// Precedence: scalar fill → exact shape → broadcast into `target`.
/// Throws `ShapeError` when none applies.
[[nodiscard]] NdArray fit_result(NdArray result, const Shape& target);

// ─── TensorStore ──────────────────────────────────────────────────────────────

/// Sole owner of every metric's values, indexed by NodeIndex.
///
/// Slots are created with `reserve_slot` when a metric is registered and
/// hold no tensor until `allocate` is called. An unallocated slot reads as
/// an all-zero time series of the current horizon length.
class TensorStore {
public:
    TensorStore() = default;

    /// Make sure a slot exists for `node` (no allocation).
    void reserve_slot(NodeIndex node);

    /// (Re)allocate `node`'s tensor with `shape`, zero-filled.
    void allocate(NodeIndex node, const Shape& shape);

    /// Zero every element of `node`'s tensor, keeping its shape.
    void zero(NodeIndex node) noexcept;

    /// Replace the stored tensor. Precondition: `values.shape` is the
    /// allocated shape of `node`.
    void store(NodeIndex node, NdArray values) noexcept;

    /// True if `node` currently holds an allocated tensor.
    [[nodiscard]] bool is_allocated(NodeIndex node) const noexcept;

    /// Read-only view of `node`'s tensor, or of a zero series of length
    /// `horizon()` when the slot is unallocated.
    [[nodiscard]] const NdArray& read(NodeIndex node) const noexcept;

    /// Mutable access for coordinate-scoped writes. Precondition: allocated.
    [[nodiscard]] NdArray& write(NodeIndex node) noexcept;

    /// Set the horizon length used for unallocated reads.
    void set_horizon(std::size_t months);

    /// Current horizon length.
    [[nodiscard]] std::size_t horizon() const noexcept { return horizon_; }

    /// Number of slots.
    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }

private:
    struct Slot {
        NdArray data;
        bool    allocated = false;
    };

    std::vector<Slot> slots_;
    std::size_t       horizon_ = 0;
    NdArray           empty_series_ = NdArray::zeros(Shape{0});
};

} // namespace hypercube::tensor
