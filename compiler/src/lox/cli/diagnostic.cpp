#include "lox/cli/diagnostic.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace lox::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// Conversions
// ============================================================================

auto make_diagnostic(const lexer::LexerError& error) -> Diagnostic {
    return Diagnostic{.severity = DiagnosticSeverity::Error,
                      .code = error.code,
                      .message = error.message,
                      .span = error.span,
                      .lexeme = std::nullopt,
                      .at_end = false};
}

auto make_diagnostic(const parser::ParseError& error) -> Diagnostic {
    return Diagnostic{.severity = DiagnosticSeverity::Error,
                      .code = error.code,
                      .message = error.message,
                      .span = error.span,
                      .lexeme = error.lexeme,
                      .at_end = error.at_end};
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

auto DiagnosticEmitter::severity_string(DiagnosticSeverity sev) -> std::string {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return "Error";
    case DiagnosticSeverity::Warning:
        return "Warning";
    }
    return "Error";
}

// " at 'x'" / " at end" for syntax errors, nothing for lexical ones
auto DiagnosticEmitter::location_string(const Diagnostic& diag) -> std::string {
    if (diag.at_end) {
        return " at end";
    }
    if (diag.lexeme) {
        return " at '" + *diag.lexeme + "'";
    }
    return "";
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        ++error_count_;
    }

    if (format_ == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }
    emit_text(diag);
}

void DiagnosticEmitter::emit_all(const std::vector<lexer::LexerError>& lex_errors,
                                 const std::vector<parser::ParseError>& parse_errors) {
    std::vector<Diagnostic> diags;
    diags.reserve(lex_errors.size() + parse_errors.size());
    for (const auto& error : lex_errors) {
        diags.push_back(make_diagnostic(error));
    }
    for (const auto& error : parse_errors) {
        diags.push_back(make_diagnostic(error));
    }

    // Lexical errors win ties: they come first and the sort is stable
    std::stable_sort(diags.begin(), diags.end(), [](const Diagnostic& a, const Diagnostic& b) {
        return a.span.start.offset < b.span.start.offset;
    });

    for (const auto& diag : diags) {
        emit(diag);
    }
}

void DiagnosticEmitter::emit_text(const Diagnostic& diag) {
    out_ << "[line " << diag.span.start.line << "] ";
    if (use_colors_) {
        const char* color =
            diag.severity == DiagnosticSeverity::Error ? Colors::Red : Colors::Yellow;
        out_ << Colors::Bold << color << severity_string(diag.severity) << Colors::Reset;
    } else {
        out_ << severity_string(diag.severity);
    }
    out_ << location_string(diag) << ": " << diag.message << "\n";
}

auto DiagnosticEmitter::escape_json_string(const std::string& s) -> std::string {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    std::string severity = diag.severity == DiagnosticSeverity::Error ? "error" : "warning";

    out_ << "{";
    out_ << "\"severity\":\"" << severity << "\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";
    out_ << "\"line\":" << diag.span.start.line << ",";
    out_ << "\"column\":" << diag.span.start.column << ",";
    if (diag.lexeme) {
        out_ << "\"lexeme\":\"" << escape_json_string(*diag.lexeme) << "\"";
    } else {
        out_ << "\"lexeme\":null";
    }
    out_ << "}\n";
}

} // namespace lox::cli
