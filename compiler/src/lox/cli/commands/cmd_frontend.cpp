//! # Front-End Commands
//!
//! Implements `lox tokenize`, `lox parse` and `lox ast`.
//!
//! ## Output Streams
//!
//! Results go to stdout, diagnostics to stderr through the diagnostic
//! emitter, logs to stderr through the logger. Every command returns
//! `ExitCode::DATA_ERROR` when any lexical or syntax error was reported.
//!
//! ```bash
//! lox tokenize main.lox     # VAR var null / IDENTIFIER x null / ...
//! lox parse expr.lox        # (+ 1.0 (* 2.0 3.0))
//! lox ast main.lox          # (var x = 1.0)
//! ```

#include "lox/cli/commands/cmd_frontend.hpp"

#include "lox/cli/diagnostic.hpp"
#include "lox/cli/utils.hpp"
#include "lox/common.hpp"
#include "lox/lexer/lexer.hpp"
#include "lox/lexer/source.hpp"
#include "lox/log/log.hpp"
#include "lox/parser/ast_printer.hpp"
#include "lox/parser/parser.hpp"

#include <iostream>
#include <optional>

namespace lox::cli {

static auto load_source(const std::string& path) -> std::optional<lexer::Source> {
    auto result = lexer::Source::from_file(path);
    if (is_err(result)) {
        LOX_LOG_ERROR("cli", unwrap_err(result));
        return std::nullopt;
    }
    LOX_LOG_DEBUG("cli", "Loaded " << path << " (" << unwrap(result).length() << " bytes)");
    return std::move(unwrap(result));
}

static auto make_emitter() -> DiagnosticEmitter& {
    auto& diag = get_diagnostic_emitter();
    diag.set_format(CompilerOptions::diagnostic_format);
    diag.set_color_enabled(terminal_supports_colors());
    diag.reset_counts();
    return diag;
}

int run_tokenize(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return ExitCode::NO_INPUT;
    }
    auto& diag = make_emitter();

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();

    for (const auto& token : tokens) {
        std::cout << lexer::to_display_string(token) << "\n";
    }
    std::cout.flush();

    LOX_LOG_INFO("lexer", "Lexed " << tokens.size() << " tokens from " << path);

    if (lex.has_errors()) {
        diag.emit_all(lex.errors());
        return ExitCode::DATA_ERROR;
    }
    return ExitCode::SUCCESS;
}

int run_parse(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return ExitCode::NO_INPUT;
    }
    auto& diag = make_emitter();

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();

    auto result = parser::parse_expression(std::move(tokens));

    if (is_err(result)) {
        diag.emit_all(lex.errors(), unwrap_err(result));
        return ExitCode::DATA_ERROR;
    }
    if (lex.has_errors()) {
        diag.emit_all(lex.errors());
        return ExitCode::DATA_ERROR;
    }

    parser::AstPrinter printer;
    std::cout << printer.print(*unwrap(result)) << "\n";
    return ExitCode::SUCCESS;
}

int run_ast(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return ExitCode::NO_INPUT;
    }
    auto& diag = make_emitter();

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();
    auto result = parser::parse(std::move(tokens));

    // Best-effort tree is printed even when errors were reported
    parser::AstPrinter printer;
    std::cout << printer.print(result.program);
    std::cout.flush();

    LOX_LOG_INFO("parser", "Parsed " << result.program.statements.size() << " statements from "
                                     << path);

    if (lex.has_errors() || result.has_errors()) {
        diag.emit_all(lex.errors(), result.errors);
        return ExitCode::DATA_ERROR;
    }
    return ExitCode::SUCCESS;
}

} // namespace lox::cli
