//! # Diagnostic System Interface
//!
//! Formats lexical and syntax errors for the user.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category | Example                          |
//! |--------|----------|----------------------------------|
//! | L      | Lexer    | L001 - Unexpected character      |
//! | P      | Parser   | P001 - Expected token            |
//!
//! ## Output Formats
//!
//! ```text
//! [line 3] Error: Unexpected character: @
//! [line 7] Error at ')': Expect expression.
//! [line 9] Error at end: Expect ';' after value.
//! ```
//!
//! With `--error-format=json` each diagnostic is a single-line JSON object.

#pragma once

#include "lox/common.hpp"
#include "lox/lexer/lexer.hpp"
#include "lox/parser/parser.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace lox::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Yellow = "\033[33m";
};

// ============================================================================
// Error Codes
// ============================================================================
//
// Error codes follow the pattern: <category><number>
//
//   L - Lexer errors (tokenization)
//   P - Parser errors (syntax)
//
namespace ErrorCodes {
// Lexer errors (L000-L099)
constexpr const char* LEX_UNEXPECTED_CHAR = "L001";
constexpr const char* LEX_UNTERMINATED_STRING = "L002";

// Parser errors (P000-P099)
constexpr const char* PARSE_EXPECTED_TOKEN = "P001";
constexpr const char* PARSE_EXPECTED_EXPR = "P002";
constexpr const char* PARSE_TOO_MANY_ARGS = "P003";
constexpr const char* PARSE_TOO_MANY_PARAMS = "P004";
constexpr const char* PARSE_INVALID_ASSIGN = "P005";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;    // Error code (e.g., "L001", "P002")
    std::string message; // Main error message
    SourceSpan span;
    std::optional<std::string> lexeme; // Offending token; absent for lexical errors
    bool at_end = false;               // Offending token is end of input
};

/// Builds a diagnostic from a lexer error.
auto make_diagnostic(const lexer::LexerError& error) -> Diagnostic;

/// Builds a diagnostic from a parser error.
auto make_diagnostic(const parser::ParseError& error) -> Diagnostic;

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    // Emit diagnostics
    void emit(const Diagnostic& diag);
    void emit_all(const std::vector<lexer::LexerError>& lex_errors,
                  const std::vector<parser::ParseError>& parse_errors = {});

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }
    void reset_counts() {
        error_count_ = 0;
    }

    static auto escape_json_string(const std::string& s) -> std::string;

private:
    std::ostream& out_;
    bool use_colors_ = false;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    size_t error_count_ = 0;

    void emit_text(const Diagnostic& diag);
    void emit_json(const Diagnostic& diag);

    static auto severity_string(DiagnosticSeverity sev) -> std::string;
    static auto location_string(const Diagnostic& diag) -> std::string;
};

// Whether stderr is a color-capable terminal
bool terminal_supports_colors();

// Process-wide emitter writing to stderr
DiagnosticEmitter& get_diagnostic_emitter();

} // namespace lox::cli
