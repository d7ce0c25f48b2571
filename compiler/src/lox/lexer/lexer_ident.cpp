//! # Lexer - Identifiers
//!
//! ## Identifier Rules
//!
//! - Start with a letter (a-z, A-Z) or underscore
//! - Continue with letters, digits, or underscores
//!
//! After the longest such run is consumed it is checked against the
//! keyword table; reserved words get their keyword kind.

#include "lox/lexer/lexer.hpp"

namespace lox::lexer {

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto lexeme = source_.slice(token_start_, pos_);
    if (auto keyword = lookup_keyword(lexeme)) {
        return make_token(*keyword);
    }

    return make_token(TokenKind::Identifier);
}

} // namespace lox::lexer
