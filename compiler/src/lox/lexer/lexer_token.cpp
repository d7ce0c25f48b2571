//! # Lexer - Token Dispatch
//!
//! This file implements the main `next_token()` entry point.
//!
//! ## Token Dispatch Order
//!
//! 1. Skip whitespace, newlines and `//` comments
//! 2. Return `Eof` if at end of input
//! 3. Lex identifiers and keywords
//! 4. Lex numbers
//! 5. Lex strings
//! 6. Lex operators and delimiters (reports unexpected characters)

#include "lox/lexer/lexer.hpp"

namespace lox::lexer {

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (is_identifier_start(c)) {
        return lex_identifier();
    }

    if (is_digit(c)) {
        return lex_number();
    }

    if (c == '"') {
        return lex_string();
    }

    return lex_operator();
}

} // namespace lox::lexer
