/// @file src/tensor/ndarray.cpp
/// @brief NdArray construction, shape helpers and broadcasting kernels.

#include "hypercube/tensor.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>

namespace hypercube {

// ─── NdArray ──────────────────────────────────────────────────────────────────

NdArray NdArray::scalar(double v) {
    return NdArray{
        .shape  = Shape{},
        .values = Eigen::ArrayXd::Constant(1, v),
    };
}

NdArray NdArray::zeros(const Shape& shape) {
    return NdArray{
        .shape  = shape,
        .values = Eigen::ArrayXd::Zero(
            static_cast<Eigen::Index>(tensor::element_count(shape))),
    };
}

}  // namespace hypercube

namespace hypercube::tensor {

// ─── Shape helpers ────────────────────────────────────────────────────────────

std::size_t element_count(const Shape& shape) noexcept {
    std::size_t n = 1;
    for (std::size_t extent : shape) {
        n *= extent;
    }
    return n;
}

std::vector<std::size_t> row_major_strides(const Shape& shape) {
    std::vector<std::size_t> strides(shape.size(), 1);
    std::size_t acc = 1;
    for (std::size_t i = shape.size(); i-- > 0;) {
        strides[i] = acc;
        acc *= shape[i];
    }
    return strides;
}

std::optional<Shape> broadcast_shape(const Shape& a, const Shape& b) {
    const std::size_t rank = std::max(a.size(), b.size());
    Shape out(rank, 1);
    for (std::size_t i = 0; i < rank; ++i) {
        // Right-align: axis i of the output maps to the trailing axes of a/b.
        const std::size_t ea = i < rank - a.size() ? 1 : a[i - (rank - a.size())];
        const std::size_t eb = i < rank - b.size() ? 1 : b[i - (rank - b.size())];
        if (ea == eb || eb == 1) {
            out[i] = ea;
        } else if (ea == 1) {
            out[i] = eb;
        } else {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<NdArray> broadcast_to(const NdArray& a, const Shape& target) {
    if (a.shape == target) {
        return a;
    }
    if (a.shape.size() > target.size()) {
        return std::nullopt;
    }

    // Source strides laid over the target's axes; broadcast axes get stride 0.
    const std::size_t offset = target.size() - a.shape.size();
    const auto src_strides   = row_major_strides(a.shape);
    std::vector<std::size_t> strides(target.size(), 0);
    for (std::size_t i = 0; i < a.shape.size(); ++i) {
        const std::size_t extent = a.shape[i];
        if (extent != target[offset + i] && extent != 1) {
            return std::nullopt;
        }
        strides[offset + i] = extent == 1 ? 0 : src_strides[i];
    }

    if (a.is_scalar()) {
        NdArray out = NdArray::zeros(target);
        out.values.setConstant(a.values(0));
        return out;
    }
    return strided_gather(a, target, strides);
}

NdArray strided_gather(const NdArray& src,
                       const Shape& out_shape,
                       std::span<const std::size_t> src_strides) {
    NdArray out = NdArray::zeros(out_shape);
    const std::size_t total = out.size();
    const std::size_t rank  = out_shape.size();

    // Odometer walk over the output index space.
    std::vector<std::size_t> idx(rank, 0);
    std::size_t from = 0;
    for (std::size_t flat = 0; flat < total; ++flat) {
        out.values(static_cast<Eigen::Index>(flat)) =
            src.values(static_cast<Eigen::Index>(from));
        for (std::size_t axis = rank; axis-- > 0;) {
            ++idx[axis];
            from += src_strides[axis];
            if (idx[axis] < out_shape[axis]) {
                break;
            }
            from -= src_strides[axis] * idx[axis];
            idx[axis] = 0;
        }
    }
    return out;
}

std::string shape_to_string(const Shape& shape) {
    return fmt::format("({})", fmt::join(shape, ", "));
}

// ─── Elementwise kernels ──────────────────────────────────────────────────────

namespace {

Eigen::ArrayXd combine(BinaryOp op, const Eigen::ArrayXd& a, const Eigen::ArrayXd& b) {
    switch (op) {
        case BinaryOp::Add: return a + b;
        case BinaryOp::Sub: return a - b;
        case BinaryOp::Mul: return a * b;
        case BinaryOp::Div: return a / b;
        case BinaryOp::Min: return a.min(b);
        case BinaryOp::Max: return a.max(b);
        case BinaryOp::Pow:
            return a.binaryExpr(b, [](double x, double y) { return std::pow(x, y); });
    }
    return Eigen::ArrayXd::Zero(a.size());
}

Eigen::ArrayXd combine(BinaryOp op, const Eigen::ArrayXd& a, double s) {
    switch (op) {
        case BinaryOp::Add: return a + s;
        case BinaryOp::Sub: return a - s;
        case BinaryOp::Mul: return a * s;
        case BinaryOp::Div: return a / s;
        case BinaryOp::Min: return a.min(s);
        case BinaryOp::Max: return a.max(s);
        case BinaryOp::Pow:
            return a.unaryExpr([s](double x) { return std::pow(x, s); });
    }
    return Eigen::ArrayXd::Zero(a.size());
}

Eigen::ArrayXd combine(BinaryOp op, double s, const Eigen::ArrayXd& b) {
    switch (op) {
        case BinaryOp::Add: return s + b;
        case BinaryOp::Sub: return s - b;
        case BinaryOp::Mul: return s * b;
        case BinaryOp::Div: return s / b;
        case BinaryOp::Min: return b.min(s);
        case BinaryOp::Max: return b.max(s);
        case BinaryOp::Pow:
            return b.unaryExpr([s](double y) { return std::pow(s, y); });
    }
    return Eigen::ArrayXd::Zero(b.size());
}

}  // namespace

NdArray apply(BinaryOp op, const NdArray& a, const NdArray& b) {
    // Fast paths map straight onto Eigen expressions.
    if (a.shape == b.shape) {
        return NdArray{.shape = a.shape, .values = combine(op, a.values, b.values)};
    }
    if (b.is_scalar()) {
        return NdArray{.shape = a.shape, .values = combine(op, a.values, b.values(0))};
    }
    if (a.is_scalar()) {
        return NdArray{.shape = b.shape, .values = combine(op, a.values(0), b.values)};
    }

    const auto out_shape = broadcast_shape(a.shape, b.shape);
    if (!out_shape) {
        throw ShapeError(fmt::format("operands with shapes {} and {} cannot be broadcast together",
                                     shape_to_string(a.shape), shape_to_string(b.shape)));
    }
    const auto lhs = broadcast_to(a, *out_shape);
    const auto rhs = broadcast_to(b, *out_shape);
    return NdArray{.shape = *out_shape, .values = combine(op, lhs->values, rhs->values)};
}

NdArray apply(UnaryOp op, const NdArray& a) {
    NdArray out{.shape = a.shape, .values = Eigen::ArrayXd()};
    switch (op) {
        case UnaryOp::Negate: out.values = -a.values;      break;
        case UnaryOp::Abs:    out.values = a.values.abs();  break;
        case UnaryOp::Sqrt:   out.values = a.values.sqrt(); break;
        case UnaryOp::Exp:    out.values = a.values.exp();  break;
        case UnaryOp::Log:    out.values = a.values.log();  break;
    }
    return out;
}

}  // namespace hypercube::tensor
