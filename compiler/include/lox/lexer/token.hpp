//! # Token Definitions
//!
//! This module defines the token types produced by the Lox lexer.
//!
//! ## Overview
//!
//! Lox tokens are categorized into:
//!
//! - **Delimiters**: Parentheses, braces, comma, dot, semicolon
//! - **Operators**: Arithmetic, comparison, equality, negation, assignment
//! - **Literals**: Identifiers, strings, numbers
//! - **Keywords**: The sixteen reserved words (`and`, `class`, ..., `while`)
//! - **Special**: End-of-file, and the internal error token
//!
//! ## Display Form
//!
//! `to_display_string()` renders a token as `<KIND> <lexeme> <literal|null>`:
//!
//! ```text
//! VAR var null
//! IDENTIFIER answer null
//! NUMBER 42 42.0
//! STRING "hi" hi
//! EOF  null
//! ```

#ifndef LOX_LEXER_TOKEN_HPP
#define LOX_LEXER_TOKEN_HPP

#include "lox/common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace lox::lexer {

/// Token kinds for the Lox language.
enum class TokenKind : uint8_t {
    // ========================================================================
    // Special Tokens
    // ========================================================================

    Eof,   ///< End of input, always the last token of a sequence
    Error, ///< Lexical error (never returned by `tokenize()`)

    // ========================================================================
    // Single-character Delimiters
    // ========================================================================

    LParen,    ///< `(`
    RParen,    ///< `)`
    LBrace,    ///< `{`
    RBrace,    ///< `}`
    Comma,     ///< `,`
    Dot,       ///< `.`
    Semicolon, ///< `;`

    // ========================================================================
    // Operators
    // ========================================================================

    Minus, ///< `-`
    Plus,  ///< `+`
    Slash, ///< `/`
    Star,  ///< `*`

    Bang,         ///< `!`
    BangEqual,    ///< `!=`
    Equal,        ///< `=`
    EqualEqual,   ///< `==`
    Greater,      ///< `>`
    GreaterEqual, ///< `>=`
    Less,         ///< `<`
    LessEqual,    ///< `<=`

    // ========================================================================
    // Literals
    // ========================================================================

    Identifier, ///< Name: `foo`, `_bar2`
    String,     ///< String literal: `"hello"`
    Number,     ///< Number literal: `42`, `3.14`

    // ========================================================================
    // Keywords
    // ========================================================================

    KwAnd,    ///< `and` - logical conjunction
    KwClass,  ///< `class` - class declaration
    KwElse,   ///< `else` - alternative branch
    KwFalse,  ///< `false` - boolean literal
    KwFor,    ///< `for` - counted loop
    KwFun,    ///< `fun` - function declaration
    KwIf,     ///< `if` - conditional
    KwNil,    ///< `nil` - absent value
    KwOr,     ///< `or` - logical disjunction
    KwPrint,  ///< `print` - print statement
    KwReturn, ///< `return` - return from function
    KwSuper,  ///< `super` - superclass access
    KwThis,   ///< `this` - receiver
    KwTrue,   ///< `true` - boolean literal
    KwVar,    ///< `var` - variable declaration
    KwWhile,  ///< `while` - conditional loop
};

/// Returns the canonical uppercase name of a token kind (e.g. `"LEFT_PAREN"`).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns true if the token kind is a reserved word.
[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;

/// Returns true if the token kind carries a literal value or names something.
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;

/// Returns true if the token kind is an operator.
[[nodiscard]] auto is_operator(TokenKind kind) -> bool;

/// Formats a number literal the way tokens and the AST printer display it.
///
/// Integral values keep one decimal (`42.0`), everything else uses the
/// shortest round-trip form (`86.63`).
[[nodiscard]] auto format_number(double value) -> std::string;

/// A lexical token.
///
/// Tokens own their lexeme so a token sequence stays valid independently of
/// the `Source` it was scanned from.
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Source location of this token.
    SourceSpan span;

    /// Raw text from source code, quotes included for strings.
    std::string lexeme;

    /// Literal value (if applicable).
    ///
    /// - `std::monostate` for everything but literals
    /// - `double` for `Number`
    /// - `std::string` for `String` (content without quotes)
    std::variant<std::monostate, double, std::string> value;

    /// Checks if this token is of the given kind.
    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// Checks if this token is one of the given kinds.
    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    /// Checks if this is an end-of-file token.
    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Checks if this is an error token.
    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    /// Line the token starts on (1-based).
    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }

    /// Gets the number value. Throws if this is not a `Number`.
    [[nodiscard]] auto number_value() const -> double;

    /// Gets the string value. Throws if this is not a `String`.
    [[nodiscard]] auto string_value() const -> const std::string&;
};

/// Renders a token as `<KIND> <lexeme> <literal|null>`.
[[nodiscard]] auto to_display_string(const Token& token) -> std::string;

} // namespace lox::lexer

#endif // LOX_LEXER_TOKEN_HPP
