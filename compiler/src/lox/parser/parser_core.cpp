//! # Parser Core
//!
//! This file implements the core parser infrastructure.
//!
//! ## Token Navigation
//!
//! | Method        | Description                           |
//! |---------------|---------------------------------------|
//! | `peek()`      | Look at current token                 |
//! | `advance()`   | Consume and return current token      |
//! | `previous()`  | Get last consumed token               |
//! | `match()`     | Consume token if it matches           |
//! | `check()`     | Check current token without consuming |
//! | `expect()`    | Require specific token or error       |
//!
//! ## Error Recovery
//!
//! A failing production returns its `ParseError` up to the nearest
//! declaration boundary, which records it and calls `synchronize()`: skip
//! tokens until just after a `;` or just before a keyword that starts a new
//! statement. Inside a block it also stops before `}`, so the block still
//! closes and the statements after it are parsed normally. Errors that do not derail the grammar (argument limits,
//! invalid assignment targets) are recorded in place and parsing continues.

#include "lox/parser/parser.hpp"
#include "lox/log/log.hpp"

#include <stdexcept>

namespace lox::parser {

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {
    // Token sequences from the lexer always end with Eof; hand-built ones might not
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        SourceSpan end_span = tokens_.empty() ? SourceSpan{} : tokens_.back().span;
        tokens_.push_back(lexer::Token{.kind = lexer::TokenKind::Eof,
                                       .span = {end_span.end, end_span.end},
                                       .lexeme = "",
                                       .value = std::monostate{}});
    }
}

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

auto Parser::previous() const -> const lexer::Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::match_any(std::initializer_list<lexer::TokenKind> kinds) -> bool {
    for (auto kind : kinds) {
        if (check(kind)) {
            advance();
            return true;
        }
    }
    return false;
}

auto Parser::expect(lexer::TokenKind kind, const std::string& message)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    return make_error(ParseErrorKind::ExpectedToken, message, peek());
}

// ============================================================================
// Error Handling
// ============================================================================

auto parse_error_code(ParseErrorKind kind) -> const char* {
    switch (kind) {
    case ParseErrorKind::ExpectedToken:
        return "P001";
    case ParseErrorKind::ExpectedExpression:
        return "P002";
    case ParseErrorKind::TooManyArguments:
        return "P003";
    case ParseErrorKind::TooManyParameters:
        return "P004";
    case ParseErrorKind::InvalidAssignmentTarget:
        return "P005";
    }
    return "P000";
}

auto Parser::make_error(ParseErrorKind kind, const std::string& message,
                        const lexer::Token& token) const -> ParseError {
    return ParseError{.kind = kind,
                      .message = message,
                      .span = token.span,
                      .lexeme = token.lexeme,
                      .at_end = token.is_eof(),
                      .code = parse_error_code(kind)};
}

void Parser::report_error(ParseError error) {
    LOX_LOG_DEBUG("parser", error.code << " at line " << error.line() << ": " << error.message);
    errors_.push_back(std::move(error));
}

void Parser::synchronize() {
    // Inside a block the closing brace belongs to the block, never to the failed statement
    if (block_depth_ > 0 && check(lexer::TokenKind::RBrace)) {
        return;
    }
    advance();

    while (!is_at_end()) {
        if (previous().is(lexer::TokenKind::Semicolon)) {
            return;
        }

        switch (peek().kind) {
        case lexer::TokenKind::RBrace:
            if (block_depth_ > 0) {
                return;
            }
            advance();
            break;
        case lexer::TokenKind::KwClass:
        case lexer::TokenKind::KwFun:
        case lexer::TokenKind::KwVar:
        case lexer::TokenKind::KwFor:
        case lexer::TokenKind::KwIf:
        case lexer::TokenKind::KwWhile:
        case lexer::TokenKind::KwPrint:
        case lexer::TokenKind::KwReturn:
            return;
        default:
            advance();
        }
    }
}

// ============================================================================
// Entry Points
// ============================================================================

auto Parser::parse_program() -> Program {
    Program program;

    while (!is_at_end()) {
        if (auto stmt = parse_declaration_or_recover()) {
            program.statements.push_back(std::move(stmt));
        }
    }

    LOX_LOG_DEBUG("parser", "Parsed " << program.statements.size() << " statement(s) with "
                                      << errors_.size() << " error(s)");
    return program;
}

auto Parser::parse_expression() -> Result<ExprPtr, ParseError> {
    return parse_expr();
}

auto parse(std::vector<lexer::Token> tokens) -> ParseResult {
    Parser parser(std::move(tokens));
    auto program = parser.parse_program();
    return ParseResult{.program = std::move(program), .errors = parser.errors()};
}

auto parse_expression(std::vector<lexer::Token> tokens)
    -> Result<ExprPtr, std::vector<ParseError>> {
    Parser parser(std::move(tokens));
    auto result = parser.parse_expression();

    // Non-fatal errors recorded along the way come first: they precede the failure point
    std::vector<ParseError> errors = parser.errors();
    if (is_err(result)) {
        errors.push_back(std::move(unwrap_err(result)));
    }
    if (!errors.empty()) {
        return errors;
    }
    return std::move(unwrap(result));
}

// ============================================================================
// Operator Helpers
// ============================================================================

auto Parser::token_to_binary_op(lexer::TokenKind kind) -> BinaryOp {
    switch (kind) {
    case lexer::TokenKind::Plus:
        return BinaryOp::Add;
    case lexer::TokenKind::Minus:
        return BinaryOp::Sub;
    case lexer::TokenKind::Star:
        return BinaryOp::Mul;
    case lexer::TokenKind::Slash:
        return BinaryOp::Div;
    case lexer::TokenKind::EqualEqual:
        return BinaryOp::Eq;
    case lexer::TokenKind::BangEqual:
        return BinaryOp::Ne;
    case lexer::TokenKind::Less:
        return BinaryOp::Lt;
    case lexer::TokenKind::LessEqual:
        return BinaryOp::Le;
    case lexer::TokenKind::Greater:
        return BinaryOp::Gt;
    case lexer::TokenKind::GreaterEqual:
        return BinaryOp::Ge;
    default:
        break;
    }
    throw std::invalid_argument("not a binary operator: " +
                                std::string(lexer::token_kind_to_string(kind)));
}

auto Parser::token_to_unary_op(lexer::TokenKind kind) -> UnaryOp {
    switch (kind) {
    case lexer::TokenKind::Minus:
        return UnaryOp::Neg;
    case lexer::TokenKind::Bang:
        return UnaryOp::Not;
    default:
        break;
    }
    throw std::invalid_argument("not a unary operator: " +
                                std::string(lexer::token_kind_to_string(kind)));
}

} // namespace lox::parser
