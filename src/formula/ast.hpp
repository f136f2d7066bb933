#pragma once

/// @file src/formula/ast.hpp
/// @brief Expression tree produced by the formula parser (internal).

#include "hypercube/tensor.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace hypercube::formula {

struct Expr;
using ExprPtr = std::unique_ptr<const Expr>;

/// One node of a parsed formula.
///
/// `Variable` nodes refer to dependency slots, not names: `slot` indexes the
/// argument list passed to the compiled kernel.
///
/// A `Chain` is a left-associative run of same-precedence operators
/// (`a - b + c`, `x * y / z`): `chain_ops[i]` joins the running value with
/// `operands[i + 1]`. Chains keep the tree depth independent of term count.
struct Expr {
    enum class Kind { Number, Variable, Unary, Binary, Chain };

    Kind                  kind;
    double                number = 0.0;                  ///< Number
    std::size_t           slot   = 0;                    ///< Variable
    tensor::UnaryOp       unary  = tensor::UnaryOp::Negate;
    tensor::BinaryOp      binary = tensor::BinaryOp::Add;
    bool                  call   = false;                ///< written as f(x)
    std::vector<ExprPtr>  operands;
    std::vector<tensor::BinaryOp> chain_ops;             ///< Chain
};

} // namespace hypercube::formula
