/// @file src/formula/parser.cpp
/// @brief Formula parser — precedence climbing by grammar level.

#include "parser.hpp"

#include "hypercube/constants.hpp"
#include "hypercube/formula.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace hypercube::formula {

namespace {

using tensor::BinaryOp;
using tensor::UnaryOp;

/// Built-in function: one argument maps to a UnaryOp, two to a BinaryOp.
struct Builtin {
    std::size_t arity;
    UnaryOp     unary  = UnaryOp::Abs;
    BinaryOp    binary = BinaryOp::Min;
};

std::optional<Builtin> find_builtin(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "abs")  return Builtin{.arity = 1, .unary = UnaryOp::Abs};
    if (name == "sqrt") return Builtin{.arity = 1, .unary = UnaryOp::Sqrt};
    if (name == "exp")  return Builtin{.arity = 1, .unary = UnaryOp::Exp};
    if (name == "log")  return Builtin{.arity = 1, .unary = UnaryOp::Log};
    if (name == "min")  return Builtin{.arity = 2, .binary = BinaryOp::Min};
    if (name == "max")  return Builtin{.arity = 2, .binary = BinaryOp::Max};
    if (name == "pow")  return Builtin{.arity = 2, .binary = BinaryOp::Pow};
    return std::nullopt;
}

ExprPtr make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, bool call = false) {
    auto node    = std::make_unique<Expr>(Expr{.kind = Expr::Kind::Binary});
    node->binary = op;
    node->call   = call;
    node->operands.push_back(std::move(lhs));
    node->operands.push_back(std::move(rhs));
    return node;
}

ExprPtr make_unary(UnaryOp op, ExprPtr operand, bool call = false) {
    auto node   = std::make_unique<Expr>(Expr{.kind = Expr::Kind::Unary});
    node->unary = op;
    node->call  = call;
    node->operands.push_back(std::move(operand));
    return node;
}

/// Fold `operands` joined by `ops` into one Chain node (or the lone operand).
ExprPtr make_chain(std::vector<ExprPtr> operands, std::vector<BinaryOp> ops) {
    if (ops.empty()) {
        return std::move(operands.front());
    }
    auto node       = std::make_unique<Expr>(Expr{.kind = Expr::Kind::Chain});
    node->operands  = std::move(operands);
    node->chain_ops = std::move(ops);
    return node;
}

}  // namespace

Parser::DepthGuard::DepthGuard(Parser& parser) : parser_(parser) {
    if (parser_.depth_ >= constants::MAX_FORMULA_DEPTH) {
        throw FormulaSyntaxError(
            fmt::format("formula nested deeper than {} levels", constants::MAX_FORMULA_DEPTH),
            parser_.peek().column);
    }
    ++parser_.depth_;
}

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
        const std::size_t column = tokens_.empty() ? 1 : tokens_.back().column;
        tokens_.push_back(Token{.kind = TokenKind::End, .text = "", .column = column});
    }
}

ExprPtr Parser::parse() {
    ExprPtr root = expression();
    if (!check(TokenKind::End)) {
        throw FormulaSyntaxError(fmt::format("unexpected {}", describe(peek())), peek().column);
    }
    return root;
}

// ─── Grammar levels ───────────────────────────────────────────────────────────

ExprPtr Parser::expression() {
    std::vector<ExprPtr>  operands;
    std::vector<BinaryOp> ops;
    operands.push_back(term());
    for (;;) {
        if (match(TokenKind::Plus)) {
            ops.push_back(BinaryOp::Add);
        } else if (match(TokenKind::Minus)) {
            ops.push_back(BinaryOp::Sub);
        } else {
            return make_chain(std::move(operands), std::move(ops));
        }
        operands.push_back(term());
    }
}

ExprPtr Parser::term() {
    std::vector<ExprPtr>  operands;
    std::vector<BinaryOp> ops;
    operands.push_back(unary());
    for (;;) {
        if (match(TokenKind::Star)) {
            ops.push_back(BinaryOp::Mul);
        } else if (match(TokenKind::Slash)) {
            ops.push_back(BinaryOp::Div);
        } else {
            return make_chain(std::move(operands), std::move(ops));
        }
        operands.push_back(unary());
    }
}

ExprPtr Parser::unary() {
    // Every nested construct (parentheses, call arguments, signs, `^`
    // operands) re-enters here.
    const DepthGuard guard(*this);
    if (match(TokenKind::Minus)) {
        return make_unary(UnaryOp::Negate, unary());
    }
    if (match(TokenKind::Plus)) {
        return unary();
    }
    return power();
}

ExprPtr Parser::power() {
    ExprPtr base = primary();
    if (match(TokenKind::Caret)) {
        // Right operand goes through `unary` so that 2^-1 and a^b^c (right
        // associative) both parse.
        return make_binary(BinaryOp::Pow, std::move(base), unary());
    }
    return base;
}

ExprPtr Parser::primary() {
    const Token& token = peek();
    switch (token.kind) {
        case TokenKind::Number: {
            advance();
            auto node    = std::make_unique<Expr>(Expr{.kind = Expr::Kind::Number});
            node->number = token.number;
            return node;
        }
        case TokenKind::Identifier: {
            const Token& name = advance();
            if (check(TokenKind::LParen)) {
                return call(name);
            }
            auto node  = std::make_unique<Expr>(Expr{.kind = Expr::Kind::Variable});
            node->slot = slot_of(name.text);
            return node;
        }
        case TokenKind::LParen: {
            advance();
            ExprPtr inner = expression();
            expect(TokenKind::RParen, "')'");
            return inner;
        }
        default:
            break;
    }
    throw FormulaSyntaxError(fmt::format("expected expression, found {}", describe(token)),
                             token.column);
}

ExprPtr Parser::call(const Token& name) {
    const auto builtin = find_builtin(name.text);
    if (!builtin) {
        throw FormulaSyntaxError(fmt::format("unknown function '{}'", name.text), name.column);
    }
    expect(TokenKind::LParen, "'('");

    std::vector<ExprPtr> args;
    if (!check(TokenKind::RParen)) {
        do {
            args.push_back(expression());
        } while (match(TokenKind::Comma));
    }
    expect(TokenKind::RParen, "')'");

    if (args.size() != builtin->arity) {
        throw FormulaSyntaxError(
            fmt::format("function '{}' takes {} argument{}, got {}", name.text, builtin->arity,
                        builtin->arity == 1 ? "" : "s", args.size()),
            name.column);
    }
    if (builtin->arity == 1) {
        return make_unary(builtin->unary, std::move(args[0]), true);
    }
    return make_binary(builtin->binary, std::move(args[0]), std::move(args[1]), true);
}

// ─── Token helpers ────────────────────────────────────────────────────────────

const Token& Parser::advance() noexcept {
    const Token& token = tokens_[current_];
    if (token.kind != TokenKind::End) {
        ++current_;
    }
    return token;
}

bool Parser::match(TokenKind kind) noexcept {
    if (!check(kind)) {
        return false;
    }
    advance();
    return true;
}

const Token& Parser::expect(TokenKind kind, const char* what) {
    if (!check(kind)) {
        throw FormulaSyntaxError(fmt::format("expected {}, found {}", what, describe(peek())),
                                 peek().column);
    }
    return advance();
}

std::size_t Parser::slot_of(const std::string& name) {
    const auto [it, inserted] = slots_.try_emplace(name, variables_.size());
    if (inserted) {
        variables_.push_back(name);
    }
    return it->second;
}

} // namespace hypercube::formula
