#pragma once

/// @file src/formula/lexer.hpp
/// @brief Tokenizer for formula text (internal).

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hypercube::formula {

enum class TokenKind {
    Number,
    Identifier,
    Plus,
    Minus,
    Star,
    Slash,
    Caret,      ///< '^' or '**'
    LParen,
    RParen,
    Comma,
    End,
};

struct Token {
    TokenKind   kind;
    std::string text;
    std::size_t column = 1;  ///< 1-based
    double      number = 0.0;
};

/// Human-readable token description for error messages.
[[nodiscard]] std::string describe(const Token& token);

/// Splits formula text into tokens. Throws FormulaSyntaxError on characters
/// that belong to no token and on malformed numbers.
class Lexer {
public:
    explicit Lexer(std::string_view source) : source_(source) {}

    /// All tokens, terminated by a single `End` token.
    [[nodiscard]] std::vector<Token> tokenize();

private:
    [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;
    [[nodiscard]] bool at_end() const noexcept { return index_ >= source_.size(); }

    void  skip_whitespace() noexcept;
    Token number_token();
    Token identifier_token();
    Token next_token();

    std::string_view source_;
    std::size_t      index_ = 0;
};

} // namespace hypercube::formula
