//! # Lexer - Numbers
//!
//! Lox has a single number type, a double. A literal is a run of digits
//! optionally followed by `.` and at least one more digit:
//!
//! ```lox
//! 42      // 42.0
//! 3.14
//! 123.    // NUMBER 123 then DOT
//! ```
//!
//! Leading signs are unary operators, not part of the literal.

#include "lox/lexer/lexer.hpp"

#include <cstdlib>
#include <string>

namespace lox::lexer {

auto Lexer::lex_number() -> Token {
    while (!is_at_end() && is_digit(peek())) {
        advance();
    }

    // A trailing '.' belongs to the number only if a digit follows
    if (peek() == '.' && is_digit(peek_next())) {
        advance(); // consume '.'
        while (!is_at_end() && is_digit(peek())) {
            advance();
        }
    }

    auto token = make_token(TokenKind::Number);

    // Note: std::from_chars for floats is not supported on macOS libc++
    // Use strtod instead for cross-platform compatibility.
    // Out-of-range literals saturate to infinity.
    token.value = std::strtod(token.lexeme.c_str(), nullptr);
    return token;
}

} // namespace lox::lexer
