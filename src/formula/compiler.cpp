/// @file src/formula/compiler.cpp
/// @brief FormulaCompiler — parse once, evaluate many times.

#include "hypercube/formula.hpp"
#include "hypercube/error.hpp"
#include "hypercube/tensor.hpp"

#include "ast.hpp"
#include "lexer.hpp"
#include "parser.hpp"

#include <fmt/format.h>

#include <memory>
#include <utility>

namespace hypercube::formula {

namespace {

using tensor::BinaryOp;
using tensor::UnaryOp;

const char* symbol(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Pow: return "^";
        case BinaryOp::Min: return "min";
        case BinaryOp::Max: return "max";
    }
    return "?";
}

const char* name(UnaryOp op) noexcept {
    switch (op) {
        case UnaryOp::Negate: return "-";
        case UnaryOp::Abs:    return "abs";
        case UnaryOp::Sqrt:   return "sqrt";
        case UnaryOp::Exp:    return "exp";
        case UnaryOp::Log:    return "log";
    }
    return "?";
}

/// Fully parenthesised text over original metric ids. A chain renders as one
/// group, `(a - b + c)`, which reads back with the same left associativity.
std::string render(const Expr& e, const std::vector<MetricId>& deps) {
    switch (e.kind) {
        case Expr::Kind::Number:
            return fmt::format("{}", e.number);
        case Expr::Kind::Variable:
            return deps[e.slot];
        case Expr::Kind::Unary:
            if (e.call) {
                return fmt::format("{}({})", name(e.unary), render(*e.operands[0], deps));
            }
            return fmt::format("(-{})", render(*e.operands[0], deps));
        case Expr::Kind::Binary: {
            const std::string lhs = render(*e.operands[0], deps);
            const std::string rhs = render(*e.operands[1], deps);
            if (e.call) {
                // pow() and '^' share an op but keep their spelling.
                const char* fn = e.binary == BinaryOp::Pow ? "pow" : symbol(e.binary);
                return fmt::format("{}({}, {})", fn, lhs, rhs);
            }
            return fmt::format("({} {} {})", lhs, symbol(e.binary), rhs);
        }
        case Expr::Kind::Chain: {
            std::string out = "(" + render(*e.operands[0], deps);
            for (std::size_t i = 1; i < e.operands.size(); ++i) {
                out += fmt::format(" {} ", symbol(e.chain_ops[i - 1]));
                out += render(*e.operands[i], deps);
            }
            out += ')';
            return out;
        }
    }
    return {};
}

NdArray eval(const Expr& e, std::span<const NdArray> args) {
    switch (e.kind) {
        case Expr::Kind::Number:
            return NdArray::scalar(e.number);
        case Expr::Kind::Variable:
            return args[e.slot];
        case Expr::Kind::Unary:
            return tensor::apply(e.unary, eval(*e.operands[0], args));
        case Expr::Kind::Binary:
            return tensor::apply(e.binary, eval(*e.operands[0], args),
                                 eval(*e.operands[1], args));
        case Expr::Kind::Chain: {
            NdArray acc = eval(*e.operands[0], args);
            for (std::size_t i = 1; i < e.operands.size(); ++i) {
                acc = tensor::apply(e.chain_ops[i - 1], acc, eval(*e.operands[i], args));
            }
            return acc;
        }
    }
    throw EvaluationError("malformed expression tree");
}

}  // namespace

// ─── CompiledFormula ──────────────────────────────────────────────────────────

CompiledFormula::CompiledFormula(std::string source,
                                 std::string canonical,
                                 std::vector<MetricId> dependencies,
                                 Kernel kernel)
    : source_(std::move(source))
    , canonical_(std::move(canonical))
    , dependencies_(std::move(dependencies))
    , kernel_(std::move(kernel)) {}

NdArray CompiledFormula::evaluate(std::span<const NdArray> args) const {
    if (args.size() != dependencies_.size()) {
        throw EvaluationError(fmt::format("formula '{}' expects {} inputs, got {}",
                                          source_, dependencies_.size(), args.size()));
    }
    NdArray result = kernel_(args);
    if (!result.values.allFinite()) {
        throw EvaluationError(fmt::format(
            "formula '{}' produced a non-finite value (division by zero or domain error)",
            source_));
    }
    return result;
}

// ─── FormulaCompiler ──────────────────────────────────────────────────────────

CompiledFormula FormulaCompiler::compile(std::string_view text, const SafeIdCache& ids) {
    const SafeIdCache::SafeText safe = ids.to_safe_text(text);
    Parser parser(Lexer(safe.text).tokenize());
    std::shared_ptr<const Expr> root = parser.parse();

    std::vector<MetricId> deps;
    deps.reserve(parser.variables().size());
    for (const auto& name : parser.variables()) {
        deps.push_back(safe.original_of(name));
    }

    std::string canonical = render(*root, deps);
    Kernel kernel = [root](std::span<const NdArray> args) { return eval(*root, args); };
    return CompiledFormula(std::string(text), std::move(canonical), std::move(deps),
                           std::move(kernel));
}

} // namespace hypercube::formula
