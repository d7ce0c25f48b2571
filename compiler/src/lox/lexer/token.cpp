//! # Token Utilities
//!
//! - `token_kind_to_string()`: Canonical kind names used in token display
//! - `is_keyword()`, `is_literal()`, `is_operator()`: Kind classification
//! - `format_number()`: Number rendering shared with the AST printer
//! - `to_display_string()`: `<KIND> <lexeme> <literal|null>`

#include "lox/lexer/token.hpp"

#include <charconv>
#include <cmath>

namespace lox::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Error:
        return "ERROR";

    // Delimiters
    case TokenKind::LParen:
        return "LEFT_PAREN";
    case TokenKind::RParen:
        return "RIGHT_PAREN";
    case TokenKind::LBrace:
        return "LEFT_BRACE";
    case TokenKind::RBrace:
        return "RIGHT_BRACE";
    case TokenKind::Comma:
        return "COMMA";
    case TokenKind::Dot:
        return "DOT";
    case TokenKind::Semicolon:
        return "SEMICOLON";

    // Operators
    case TokenKind::Minus:
        return "MINUS";
    case TokenKind::Plus:
        return "PLUS";
    case TokenKind::Slash:
        return "SLASH";
    case TokenKind::Star:
        return "STAR";
    case TokenKind::Bang:
        return "BANG";
    case TokenKind::BangEqual:
        return "BANG_EQUAL";
    case TokenKind::Equal:
        return "EQUAL";
    case TokenKind::EqualEqual:
        return "EQUAL_EQUAL";
    case TokenKind::Greater:
        return "GREATER";
    case TokenKind::GreaterEqual:
        return "GREATER_EQUAL";
    case TokenKind::Less:
        return "LESS";
    case TokenKind::LessEqual:
        return "LESS_EQUAL";

    // Literals
    case TokenKind::Identifier:
        return "IDENTIFIER";
    case TokenKind::String:
        return "STRING";
    case TokenKind::Number:
        return "NUMBER";

    // Keywords
    case TokenKind::KwAnd:
        return "AND";
    case TokenKind::KwClass:
        return "CLASS";
    case TokenKind::KwElse:
        return "ELSE";
    case TokenKind::KwFalse:
        return "FALSE";
    case TokenKind::KwFor:
        return "FOR";
    case TokenKind::KwFun:
        return "FUN";
    case TokenKind::KwIf:
        return "IF";
    case TokenKind::KwNil:
        return "NIL";
    case TokenKind::KwOr:
        return "OR";
    case TokenKind::KwPrint:
        return "PRINT";
    case TokenKind::KwReturn:
        return "RETURN";
    case TokenKind::KwSuper:
        return "SUPER";
    case TokenKind::KwThis:
        return "THIS";
    case TokenKind::KwTrue:
        return "TRUE";
    case TokenKind::KwVar:
        return "VAR";
    case TokenKind::KwWhile:
        return "WHILE";
    }
    return "UNKNOWN";
}

auto is_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwAnd && kind <= TokenKind::KwWhile;
}

auto is_literal(TokenKind kind) -> bool {
    return kind >= TokenKind::Identifier && kind <= TokenKind::Number;
}

auto is_operator(TokenKind kind) -> bool {
    return kind >= TokenKind::Minus && kind <= TokenKind::LessEqual;
}

auto format_number(double value) -> std::string {
    // Fixed notation of the largest doubles needs over 300 digits.
    char buf[512];
    std::to_chars_result result;
    if (std::isfinite(value) && std::trunc(value) == value) {
        result = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, 1);
    } else {
        // Shortest round-trip digits, never in exponent form
        result = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    }
    if (result.ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buf, result.ptr);
}

auto Token::number_value() const -> double {
    return std::get<double>(value);
}

auto Token::string_value() const -> const std::string& {
    return std::get<std::string>(value);
}

auto to_display_string(const Token& token) -> std::string {
    std::string out(token_kind_to_string(token.kind));
    out += ' ';
    out += token.lexeme;
    out += ' ';

    if (const auto* number = std::get_if<double>(&token.value)) {
        out += format_number(*number);
    } else if (const auto* text = std::get_if<std::string>(&token.value)) {
        out += *text;
    } else {
        out += "null";
    }
    return out;
}

} // namespace lox::lexer
