//! # Lexer Core
//!
//! This file implements core lexer functionality including:
//!
//! - **Keyword table**: Maps identifier text to token kinds
//! - **Character access**: `peek()`, `advance()`, `match()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Whitespace and comments**: Spaces, tabs, newlines and `//` comments
//! - **Driver**: `tokenize()` and the `scan()` entry point

#include "lox/lexer/lexer.hpp"
#include "lox/log/log.hpp"

#include <unordered_map>

namespace lox::lexer {

namespace {

// Reserved words. Anything else matching the identifier rule is an IDENTIFIER.
const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    // Declarations
    {"class", TokenKind::KwClass},
    {"fun", TokenKind::KwFun},
    {"var", TokenKind::KwVar},

    // Control flow
    {"else", TokenKind::KwElse},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"print", TokenKind::KwPrint},
    {"return", TokenKind::KwReturn},
    {"while", TokenKind::KwWhile},

    // Logical operators
    {"and", TokenKind::KwAnd},
    {"or", TokenKind::KwOr},

    // Literals
    {"false", TokenKind::KwFalse},
    {"nil", TokenKind::KwNil},
    {"true", TokenKind::KwTrue},

    // Classes
    {"super", TokenKind::KwSuper},
    {"this", TokenKind::KwThis},
};

} // anonymous namespace

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::match(char expected) -> bool {
    if (is_at_end() || peek() != expected) {
        return false;
    }
    ++pos_;
    return true;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : pos_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = std::string(source_.slice(token_start_, pos_)),
                 .value = std::monostate{}};
}

auto Lexer::make_error_token(LexerErrorKind kind, const std::string& message,
                             const std::string& code) -> Token {
    auto token = make_token(TokenKind::Error);
    report_error(kind, message, code, token.span);
    return token;
}

void Lexer::report_error(LexerErrorKind kind, const std::string& message,
                         const std::string& code, SourceSpan span) {
    LOX_LOG_DEBUG("lexer", code << " at line " << span.start.line << ": " << message);
    errors_.push_back(
        LexerError{.kind = kind, .message = message, .span = span, .code = code});
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        switch (c) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            advance();
            break;
        case '/':
            if (peek_next() == '/') {
                skip_line_comment();
            } else {
                return;
            }
            break;
        default:
            return;
        }
    }
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

auto Lexer::is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || is_digit(c);
}

auto Lexer::is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto Lexer::utf8_char_length(char c) -> size_t {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80)
        return 1;
    if ((byte & 0xE0) == 0xC0)
        return 2;
    if ((byte & 0xF0) == 0xE0)
        return 3;
    if ((byte & 0xF8) == 0xF0)
        return 4;
    return 1; // Stray continuation byte
}

auto Lexer::lookup_keyword(std::string_view ident) -> std::optional<TokenKind> {
    auto it = KEYWORDS.find(ident);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;

    while (true) {
        auto token = next_token();
        if (token.is_error()) {
            continue;
        }
        bool done = token.is_eof();
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }

    LOX_LOG_DEBUG("lexer", "Scanned " << tokens.size() << " tokens from " << source_.filename()
                                      << " with " << errors_.size() << " error(s)");
    return tokens;
}

auto scan(std::string_view text) -> ScanResult {
    auto source = Source::from_string(std::string(text));
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    return ScanResult{.tokens = std::move(tokens), .errors = lexer.errors()};
}

} // namespace lox::lexer
