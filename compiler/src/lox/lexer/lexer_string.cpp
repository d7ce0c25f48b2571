//! # Lexer - Strings
//!
//! String literals are delimited by `"` and may span lines. There are no
//! escape sequences: the literal value is the raw text between the quotes.
//!
//! A string token's `line()` is the line of its opening quote; the span end
//! holds the line of the closing quote. Diagnostics at a multi-line string
//! therefore point where the literal begins.
//!
//! An unterminated string is reported at the line where input ends and
//! produces no token.

#include "lox/lexer/lexer.hpp"

namespace lox::lexer {

auto Lexer::lex_string() -> Token {
    advance(); // opening quote

    while (!is_at_end() && peek() != '"') {
        advance();
    }

    if (is_at_end()) {
        auto end_loc = source_.location(pos_);
        auto token = make_token(TokenKind::Error);
        report_error(LexerErrorKind::UnterminatedString, "Unterminated string.", "L002",
                     SourceSpan{end_loc, end_loc});
        return token;
    }

    advance(); // closing quote

    auto token = make_token(TokenKind::String);
    token.value = std::string(source_.slice(token_start_ + 1, pos_ - 1));
    return token;
}

} // namespace lox::lexer
