/// @file src/tensor/alignment.cpp
/// @brief Dimension alignment of dependency tensors and result fitting.
///
/// A dependency declared over a subset of the dependent's dimensions is laid
/// out over the dependent's dimension order with size-1 axes where it does
/// not vary, e.g. dependent [geo, product] × T and dependency [product] × T:
///
///     (P, T)  →  (1, P, T)
///
/// after which elementwise broadcasting in the formula kernel does the rest.

#include "hypercube/tensor.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace hypercube::tensor {

namespace {

/// Position of `dim` in `dims`, or dims.size() if absent.
std::size_t position_of(std::span<const std::string> dims, const std::string& dim) {
    return static_cast<std::size_t>(
        std::find(dims.begin(), dims.end(), dim) - dims.begin());
}

/// Length of the time axis of a tensor (its last extent).
std::size_t time_extent(const NdArray& t) noexcept {
    return t.shape.empty() ? 1 : t.shape.back();
}

}  // namespace

// ─── align_dependency ─────────────────────────────────────────────────────────

NdArray align_dependency(const NdArray& dep,
                         const MetricId& dep_id,
                         std::span<const std::string> dep_dims,
                         std::span<const std::string> target_dims) {
    const bool well_formed = dep.shape.size() == dep_dims.size() + 1;

    // ── 1. Exact match: nothing to reshape ───────────────────────────────────
    if (well_formed &&
        std::equal(dep_dims.begin(), dep_dims.end(),
                   target_dims.begin(), target_dims.end())) {
        return dep;
    }

    const std::size_t months = time_extent(dep);
    const auto missing = std::find_if(dep_dims.begin(), dep_dims.end(),
        [&](const std::string& d) { return position_of(target_dims, d) == target_dims.size(); });

    // ── 2. Dimension expand (and transpose if the order differs) ─────────────
    if (well_formed && missing == dep_dims.end()) {
        const auto dep_strides = row_major_strides(dep.shape);

        Shape                    out_shape;
        std::vector<std::size_t> strides;
        out_shape.reserve(target_dims.size() + 1);
        strides.reserve(target_dims.size() + 1);

        bool        in_order = true;
        std::size_t last_pos = 0;
        for (const auto& dim : target_dims) {
            const std::size_t k = position_of(dep_dims, dim);
            if (k == dep_dims.size()) {
                out_shape.push_back(1);
                strides.push_back(0);
                continue;
            }
            if (k < last_pos) {
                in_order = false;
            }
            last_pos = k;
            out_shape.push_back(dep.shape[k]);
            strides.push_back(dep.shape[k] == 1 ? 0 : dep_strides[k]);
        }
        out_shape.push_back(months);
        strides.push_back(1);

        if (in_order) {
            // Same memory order: a pure reshape.
            return NdArray{.shape = std::move(out_shape), .values = dep.values};
        }
        return strided_gather(dep, out_shape, strides);
    }

    // ── 3. Uniform broadcast of a single time series ─────────────────────────
    if (dep.size() == months) {
        Shape out_shape(target_dims.size(), 1);
        out_shape.push_back(months);
        return NdArray{.shape = std::move(out_shape), .values = dep.values};
    }

    // ── 4. Incompatible ──────────────────────────────────────────────────────
    if (!well_formed) {
        throw ShapeError(fmt::format(
            "dependency '{}' has shape {} which does not match its {} declared dimension(s)",
            dep_id, shape_to_string(dep.shape), dep_dims.size()));
    }
    throw ShapeError(fmt::format(
        "dependency '{}' varies over dimension '{}' which the dependent does not declare",
        dep_id, *missing));
}

// ─── fit_result ───────────────────────────────────────────────────────────────

NdArray fit_result(NdArray result, const Shape& target) {
    if (result.is_scalar()) {
        NdArray out = NdArray::zeros(target);
        out.values.setConstant(result.values(0));
        return out;
    }
    if (result.shape == target) {
        return result;
    }
    if (auto expanded = broadcast_to(result, target)) {
        return std::move(*expanded);
    }
    throw ShapeError(fmt::format("result shape {} cannot be stored into tensor of shape {}",
                                 shape_to_string(result.shape), shape_to_string(target)));
}

}  // namespace hypercube::tensor
