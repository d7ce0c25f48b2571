//! # Lox Front-End Entry Point
//!
//! Delegates to the CLI driver, which handles command parsing and execution.
//!
//! ```bash
//! lox tokenize file.lox       # Print the token stream
//! lox parse expr.lox          # Print a single parsed expression
//! lox ast file.lox            # Print the syntax tree of a program
//! ```
//!
//! ## See Also
//!
//! - `cli/driver.hpp` - CLI driver interface
//! - `cli/dispatcher.cpp` - Command dispatching logic

#include "lox/cli/driver.hpp"

/// Main entry point for the Lox front-end.
int main(int argc, char* argv[]) {
    return lox::cli::lox_main(argc, argv);
}
