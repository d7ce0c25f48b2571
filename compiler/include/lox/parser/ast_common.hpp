//! # AST Common Types
//!
//! Forward declarations and pointer type aliases shared by the AST headers.
//!
//! ## Architecture
//!
//! - `ast_common.hpp` - Forward declarations and pointer types (this file)
//! - `ast_exprs.hpp` - Expressions (`Expr`, `BinaryExpr`, `CallExpr`, etc.)
//! - `ast_stmts.hpp` - Statements (`Stmt`, `VarStmt`, `FunctionStmt`, etc.)
//! - `ast.hpp` - Main header that includes all of the above plus `Program`
//!
//! ## Ownership Model
//!
//! All child nodes are owned via `Box<T>` (unique pointer). A node has
//! exactly one parent and holds no back references, so the tree is acyclic
//! by construction.

#ifndef LOX_PARSER_AST_COMMON_HPP
#define LOX_PARSER_AST_COMMON_HPP

#include "lox/common.hpp"
#include "lox/lexer/token.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lox::parser {

// ============================================================================
// Forward Declarations
// ============================================================================

struct Expr;
struct Stmt;

// ============================================================================
// Pointer Type Aliases
// ============================================================================

/// Owned pointer to an expression node.
using ExprPtr = Box<Expr>;

/// Owned pointer to a statement node.
using StmtPtr = Box<Stmt>;

} // namespace lox::parser

#endif // LOX_PARSER_AST_COMMON_HPP
