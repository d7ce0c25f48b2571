#include "lox/cli/utils.hpp"

#include "lox/common.hpp"

namespace lox::cli {

void print_usage(std::ostream& out) {
    out << "Lox Front-End " << VERSION << "\n\n";
    out << "Usage: lox <command> [options] <file.lox>\n\n";
    out << "Commands:\n";
    out << "  tokenize  Print the token stream\n";
    out << "  parse     Parse a single expression and print it\n";
    out << "  ast       Parse a program and print its syntax tree\n";
    out << "\nOptions:\n";
    out << "  --help, -h            Show this help\n";
    out << "  --version, -V         Show version\n";
    out << "  --error-format=json   Output diagnostics as JSON\n";
    out << "  --verbose             Show detailed output\n";
    out << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>   Per-module levels (e.g. parser=trace,*=warn)\n";
    out << "  --log-file=<path>     Also write logs to a file\n";
    out << "  --log-format=json     Structured log output\n";
    out << "  -v, -vv, -vvv, -q     Log verbosity\n";
}

void print_version() {
    std::cout << "lox " << VERSION << "\n";
}

} // namespace lox::cli
