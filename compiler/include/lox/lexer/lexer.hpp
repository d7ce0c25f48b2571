//! # Lexical Analysis
//!
//! Converts Lox source text into an ordered token sequence terminated by a
//! single `Eof` token. The scan is one left-to-right pass with maximal
//! munch; lexical errors are recorded and scanning continues.
//!
//! ## Error Codes
//!
//! | Code | Kind                | Message                   |
//! |------|---------------------|---------------------------|
//! | L001 | UnexpectedCharacter | `Unexpected character: @` |
//! | L002 | UnterminatedString  | `Unterminated string.`    |

#ifndef LOX_LEXER_LEXER_HPP
#define LOX_LEXER_LEXER_HPP

#include "lox/common.hpp"
#include "lox/lexer/source.hpp"
#include "lox/lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lox::lexer {

/// Classification of lexical errors.
enum class LexerErrorKind : uint8_t {
    UnexpectedCharacter, ///< A byte sequence that starts no token.
    UnterminatedString,  ///< End of input reached inside a string literal.
};

/// An error encountered during lexical analysis.
struct LexerError {
    LexerErrorKind kind; ///< What went wrong.
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in source.
    std::string code;    ///< Diagnostic code ("L001", "L002").

    /// Line used when reporting the error.
    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }
};

/// Output of a complete scan: tokens ending with `Eof`, plus errors in source order.
struct ScanResult {
    std::vector<Token> tokens;
    std::vector<LexerError> errors;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors.empty();
    }
};

/// Lexical analyzer for Lox source code.
///
/// # Usage
///
/// ```cpp
/// Source source = Source::from_string("var x = 1;");
/// Lexer lexer(source);
/// auto tokens = lexer.tokenize();
///
/// for (const auto& err : lexer.errors()) {
///     report(err);
/// }
/// ```
class Lexer {
public:
    /// Constructs a lexer for the given source.
    ///
    /// The source must outlive the lexer, but not the tokens it produces.
    explicit Lexer(const Source& source);

    /// Returns the next token from the source.
    ///
    /// Returns `TokenKind::Eof` at end of input and `TokenKind::Error` for
    /// malformed input (after recording a `LexerError`).
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source.
    ///
    /// Error tokens are dropped; the returned vector always ends with
    /// exactly one `Eof` token.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    /// Returns all errors encountered so far.
    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    /// Returns true if any errors occurred during lexing.
    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;
    size_t pos_ = 0;         ///< Current byte position in source.
    size_t token_start_ = 0; ///< Start position of current token.
    std::vector<LexerError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    auto advance() -> char;
    auto match(char expected) -> bool;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    /// Creates a token of the given kind spanning `token_start_..pos_`.
    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    /// Records an error and returns an error token for the current lexeme.
    [[nodiscard]] auto make_error_token(LexerErrorKind kind, const std::string& message,
                                        const std::string& code) -> Token;

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    void skip_whitespace();

    /// Skips a line comment (`// ...`) up to, not including, the newline.
    void skip_line_comment();

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_operator() -> Token;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
    [[nodiscard]] static auto is_digit(char c) -> bool;

    /// Returns the byte length of the UTF-8 sequence starting with `c`.
    [[nodiscard]] static auto utf8_char_length(char c) -> size_t;

    // ========================================================================
    // Keyword Lookup
    // ========================================================================

    /// Returns the keyword token kind, or `std::nullopt` if not a keyword.
    [[nodiscard]] static auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind>;

    // ========================================================================
    // Error Reporting
    // ========================================================================

    void report_error(LexerErrorKind kind, const std::string& message, const std::string& code,
                      SourceSpan span);
};

/// Scans `text` in one pass.
///
/// Pure function of its input: every call builds its own `Source` and
/// `Lexer`, and the result owns all of its tokens.
[[nodiscard]] auto scan(std::string_view text) -> ScanResult;

} // namespace lox::lexer

#endif // LOX_LEXER_LEXER_HPP
