//! # Front-End Driver Interface
//!
//! `lox_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

namespace lox::cli {

// Main driver entry point; returns the process exit code
int lox_main(int argc, char* argv[]);

} // namespace lox::cli
