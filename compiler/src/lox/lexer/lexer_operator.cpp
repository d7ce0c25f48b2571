//! # Lexer - Operators and Delimiters
//!
//! ## Maximal Munch
//!
//! Operators sharing a prefix resolve to the longest match:
//!
//! | First | Alone     | With `=`        |
//! |-------|-----------|-----------------|
//! | `!`   | `Bang`    | `BangEqual`     |
//! | `=`   | `Equal`   | `EqualEqual`    |
//! | `<`   | `Less`    | `LessEqual`     |
//! | `>`   | `Greater` | `GreaterEqual`  |
//!
//! `/` is always `Slash` here; comments were skipped before dispatch.
//! Any other character is an unexpected character (L001).

#include "lox/lexer/lexer.hpp"

namespace lox::lexer {

auto Lexer::lex_operator() -> Token {
    char c = advance();

    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case ',':
        return make_token(TokenKind::Comma);
    case '.':
        return make_token(TokenKind::Dot);
    case ';':
        return make_token(TokenKind::Semicolon);
    case '-':
        return make_token(TokenKind::Minus);
    case '+':
        return make_token(TokenKind::Plus);
    case '/':
        return make_token(TokenKind::Slash);
    case '*':
        return make_token(TokenKind::Star);

    case '!':
        return make_token(match('=') ? TokenKind::BangEqual : TokenKind::Bang);
    case '=':
        return make_token(match('=') ? TokenKind::EqualEqual : TokenKind::Equal);
    case '<':
        return make_token(match('=') ? TokenKind::LessEqual : TokenKind::Less);
    case '>':
        return make_token(match('=') ? TokenKind::GreaterEqual : TokenKind::Greater);

    default:
        break;
    }

    // Skip the whole UTF-8 sequence so the message shows the real character
    size_t extra = utf8_char_length(c) - 1;
    while (extra > 0 && !is_at_end()) {
        advance();
        --extra;
    }

    std::string text(source_.slice(token_start_, pos_));
    return make_error_token(LexerErrorKind::UnexpectedCharacter,
                            "Unexpected character: " + text, "L001");
}

} // namespace lox::lexer
