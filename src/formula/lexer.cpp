/// @file src/formula/lexer.cpp
/// @brief Formula tokenizer.

#include "lexer.hpp"

#include "hypercube/formula.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>

namespace hypercube::formula {

namespace {

bool is_ident_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string describe(const Token& token) {
    if (token.kind == TokenKind::End) {
        return "end of formula";
    }
    return fmt::format("'{}'", token.text);
}

char Lexer::peek(std::size_t ahead) const noexcept {
    const std::size_t i = index_ + ahead;
    return i < source_.size() ? source_[i] : '\0';
}

void Lexer::skip_whitespace() noexcept {
    while (!at_end() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
        ++index_;
    }
}

Token Lexer::number_token() {
    const std::size_t start = index_;
    while (is_digit(peek())) {
        ++index_;
    }
    if (peek() == '.') {
        ++index_;
        while (is_digit(peek())) {
            ++index_;
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        std::size_t ahead = 1;
        if (peek(1) == '+' || peek(1) == '-') {
            ahead = 2;
        }
        if (is_digit(peek(ahead))) {
            index_ += ahead;
            while (is_digit(peek())) {
                ++index_;
            }
        }
    }

    const std::string_view lexeme = source_.substr(start, index_ - start);
    if (lexeme == ".") {
        throw FormulaSyntaxError("expected digits after '.'", start + 1);
    }
    // A number immediately followed by letters ("2x") is not a valid token.
    if (is_ident_start(peek())) {
        throw FormulaSyntaxError(
            fmt::format("invalid number '{}{}'", lexeme, peek()), start + 1);
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), value);
    if (ec != std::errc{} || ptr != lexeme.data() + lexeme.size()) {
        throw FormulaSyntaxError(fmt::format("invalid number '{}'", lexeme), start + 1);
    }
    return Token{.kind = TokenKind::Number, .text = std::string(lexeme),
                 .column = start + 1, .number = value};
}

Token Lexer::identifier_token() {
    const std::size_t start = index_;
    while (is_ident_char(peek())) {
        ++index_;
    }
    return Token{.kind = TokenKind::Identifier,
                 .text = std::string(source_.substr(start, index_ - start)),
                 .column = start + 1};
}

Token Lexer::next_token() {
    skip_whitespace();
    const std::size_t column = index_ + 1;
    if (at_end()) {
        return Token{.kind = TokenKind::End, .text = "", .column = column};
    }

    const char c = peek();
    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
        return number_token();
    }
    if (is_ident_start(c)) {
        return identifier_token();
    }

    auto single = [&](TokenKind kind) {
        ++index_;
        return Token{.kind = kind, .text = std::string(1, c), .column = column};
    };

    switch (c) {
        case '+': return single(TokenKind::Plus);
        case '-': return single(TokenKind::Minus);
        case '/': return single(TokenKind::Slash);
        case '^': return single(TokenKind::Caret);
        case '(': return single(TokenKind::LParen);
        case ')': return single(TokenKind::RParen);
        case ',': return single(TokenKind::Comma);
        case '*':
            if (peek(1) == '*') {
                index_ += 2;
                return Token{.kind = TokenKind::Caret, .text = "**", .column = column};
            }
            return single(TokenKind::Star);
        default:
            break;
    }
    throw FormulaSyntaxError(fmt::format("unexpected character '{}'", c), column);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    for (;;) {
        tokens.push_back(next_token());
        if (tokens.back().kind == TokenKind::End) {
            break;
        }
    }
    return tokens;
}

} // namespace hypercube::formula
