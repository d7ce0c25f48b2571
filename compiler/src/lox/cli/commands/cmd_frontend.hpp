//! # Front-End Commands Interface
//!
//! | Function         | Command        | Output                        |
//! |------------------|----------------|-------------------------------|
//! | `run_tokenize()` | `lox tokenize` | Token stream                  |
//! | `run_parse()`    | `lox parse`    | Rendered expression           |
//! | `run_ast()`      | `lox ast`      | Rendered program, one per line|

#pragma once
#include <string>

namespace lox::cli {

int run_tokenize(const std::string& path);
int run_parse(const std::string& path);
int run_ast(const std::string& path);

} // namespace lox::cli
