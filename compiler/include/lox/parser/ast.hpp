//! # Abstract Syntax Tree (AST)
//!
//! The tree produced by the parser. Two node categories, each a
//! `std::variant` over its kinds:
//!
//! - **Expressions**: Value-producing constructs (`Expr`)
//! - **Statements**: Declarations and control flow (`Stmt`)
//!
//! A `Program` owns the top-level statements. Every node carries a
//! `SourceSpan`. The tree is never mutated after parsing.

#ifndef LOX_PARSER_AST_HPP
#define LOX_PARSER_AST_HPP

#include "lox/parser/ast_common.hpp"
#include "lox/parser/ast_exprs.hpp"
#include "lox/parser/ast_stmts.hpp"

namespace lox::parser {

/// A parsed script: top-level statements in source order.
struct Program {
    std::vector<StmtPtr> statements;
};

} // namespace lox::parser

#endif // LOX_PARSER_AST_HPP
