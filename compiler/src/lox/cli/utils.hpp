//! # CLI Utilities Interface
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print front-end version              |
//!
//! Exit codes follow the BSD `sysexits.h` convention.

#pragma once
#include <iostream>

namespace lox::cli {

namespace ExitCode {
constexpr int SUCCESS = 0;
constexpr int USAGE = 64;      // Bad command line
constexpr int DATA_ERROR = 65; // Lexical or syntax errors in the input
constexpr int NO_INPUT = 66;   // Input file missing or unreadable
constexpr int SOFTWARE = 70;   // Internal error
} // namespace ExitCode

// Help text
void print_usage(std::ostream& out = std::cout);
void print_version();

} // namespace lox::cli
