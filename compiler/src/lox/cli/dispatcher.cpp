//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! lox_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ tokenize       → run_tokenize()
//!   ├─ parse          → run_parse()
//!   └─ ast            → run_ast()
//! ```
//!
//! ## Global Flags
//!
//! - `--error-format=json|text`: Diagnostic output format
//! - `--verbose`: Enable verbose output
//! - `--log-*`, `-v`, `-q`: Logger configuration (see `log::parse_log_options`)

#include "lox/cli/driver.hpp"

#include "lox/cli/commands/cmd_frontend.hpp"
#include "lox/cli/utils.hpp"
#include "lox/common.hpp"
#include "lox/log/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lox::cli {

/// Main entry point for the Lox front-end CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                  |
/// |------|------------------------------------------|
/// | 0    | Success                                  |
/// | 64   | Usage error (unknown command, no file)   |
/// | 65   | Lexical or syntax errors in the input    |
/// | 66   | Input file could not be read             |
/// | 70   | Internal error                           |
int lox_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    CompilerOptions::verbose = false;
    CompilerOptions::diagnostic_format = DiagnosticFormat::Text;

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return ExitCode::SUCCESS;
        }
        if (arg == "--version" || arg == "-V") {
            print_version();
            return ExitCode::SUCCESS;
        }
        if (arg == "--verbose") {
            CompilerOptions::verbose = true;
            continue;
        }
        if (arg.starts_with("--error-format=")) {
            std::string format = arg.substr(15);
            if (format == "json") {
                CompilerOptions::diagnostic_format = DiagnosticFormat::JSON;
            } else if (format == "text") {
                CompilerOptions::diagnostic_format = DiagnosticFormat::Text;
            } else {
                std::cerr << "Unknown error format: " << format << "\n";
                return ExitCode::USAGE;
            }
            continue;
        }
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(std::cerr);
            return ExitCode::USAGE;
        }
        positional.push_back(std::move(arg));
    }

    if (positional.empty()) {
        print_usage(std::cerr);
        return ExitCode::USAGE;
    }

    const std::string& command = positional[0];
    if (command != "tokenize" && command != "parse" && command != "ast") {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(std::cerr);
        return ExitCode::USAGE;
    }
    if (positional.size() != 2) {
        std::cerr << "Usage: lox " << command << " <file.lox> [options]\n";
        return ExitCode::USAGE;
    }

    const std::string& path = positional[1];
    LOX_DEBUG_LN("lox " << command << " " << path);

    try {
        if (command == "tokenize") {
            return run_tokenize(path);
        }
        if (command == "parse") {
            return run_parse(path);
        }
        return run_ast(path);
    } catch (const std::exception& e) {
        LOX_LOG_FATAL("cli", "Internal error while running '" << command << "': " << e.what());
        log::Logger::instance().flush();
        return ExitCode::SOFTWARE;
    }
}

} // namespace lox::cli
