#pragma once

/// @file src/formula/parser.hpp
/// @brief Recursive-descent parser for formula text (internal).

#include "ast.hpp"
#include "lexer.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace hypercube::formula {

/// Parses one token stream into an expression tree.
///
/// Identifiers become variable slots numbered in order of first appearance;
/// `variables()` lists their (safe) names by slot. Nesting deeper than
/// `constants::MAX_FORMULA_DEPTH` is a syntax error.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /// Parse the whole formula. Throws FormulaSyntaxError.
    [[nodiscard]] ExprPtr parse();

    [[nodiscard]] const std::vector<std::string>& variables() const noexcept {
        return variables_;
    }

private:
    /// Counts one nesting level for the lifetime of a grammar call.
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser);
        ~DepthGuard() { --parser_.depth_; }

        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    ExprPtr expression();
    ExprPtr term();
    ExprPtr unary();
    ExprPtr power();
    ExprPtr primary();
    ExprPtr call(const Token& name);

    [[nodiscard]] const Token& peek() const noexcept { return tokens_[current_]; }
    const Token& advance() noexcept;
    [[nodiscard]] bool check(TokenKind kind) const noexcept { return peek().kind == kind; }
    bool match(TokenKind kind) noexcept;
    const Token& expect(TokenKind kind, const char* what);

    [[nodiscard]] std::size_t slot_of(const std::string& name);

    std::vector<Token>                           tokens_;
    std::size_t                                  current_ = 0;
    std::size_t                                  depth_   = 0;
    std::vector<std::string>                     variables_;
    std::unordered_map<std::string, std::size_t> slots_;
};

} // namespace hypercube::formula
