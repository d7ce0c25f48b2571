//! # Statement AST Nodes
//!
//! AST nodes for statements and declarations.
//!
//! ## Statement Types
//!
//! - `ExprStmt` - Expression evaluated for its effect: `f();`
//! - `PrintStmt` - `print value;`
//! - `VarStmt` - `var x = 1;`
//! - `BlockStmt` - `{ ... }`, introduces a scope
//! - `IfStmt`, `WhileStmt` - Control flow (`for` is desugared to `WhileStmt`)
//! - `FunctionStmt` - `fun name(a, b) { ... }`, also used for methods
//! - `ReturnStmt` - `return value;`
//! - `ClassStmt` - `class Name < Base { methods }`

#ifndef LOX_PARSER_AST_STMTS_HPP
#define LOX_PARSER_AST_STMTS_HPP

#include "lox/parser/ast_exprs.hpp"

namespace lox::parser {

/// Expression statement: `expr;`.
struct ExprStmt {
    ExprPtr expr;
    SourceSpan span;
};

/// Print statement: `print expr;`.
struct PrintStmt {
    ExprPtr expr;
    SourceSpan span;
};

/// Variable declaration: `var name;` or `var name = init;`.
struct VarStmt {
    lexer::Token name;
    std::optional<ExprPtr> init; ///< Absent means the variable starts as `nil`.
    SourceSpan span;
};

/// Block: `{ stmt* }`.
struct BlockStmt {
    std::vector<StmtPtr> stmts;
    SourceSpan span;
};

/// Conditional: `if (cond) then else other`.
struct IfStmt {
    ExprPtr condition;
    StmtPtr then_branch;
    std::optional<StmtPtr> else_branch;
    SourceSpan span;
};

/// Loop: `while (cond) body`.
///
/// Also the target of `for` desugaring:
///
/// ```lox
/// for (var i = 0; i < 3; i = i + 1) print i;
/// // becomes
/// { var i = 0; while (i < 3) { print i; i = i + 1; } }
/// ```
struct WhileStmt {
    ExprPtr condition;
    StmtPtr body;
    SourceSpan span;
};

/// Function declaration or class method: `fun name(a, b) { body }`.
struct FunctionStmt {
    lexer::Token name;
    std::vector<lexer::Token> params;
    std::vector<StmtPtr> body;
    SourceSpan span;
};

/// Return statement: `return;` or `return value;`.
struct ReturnStmt {
    lexer::Token keyword; ///< The `return` token, for error locations.
    std::optional<ExprPtr> value;
    SourceSpan span;
};

/// Class declaration: `class Name < Base { method* }`.
struct ClassStmt {
    lexer::Token name;
    std::optional<ExprPtr> superclass; ///< Always a `VariableExpr` when present.
    std::vector<FunctionStmt> methods;
    SourceSpan span;
};

/// A statement node.
struct Stmt {
    std::variant<ExprStmt, PrintStmt, VarStmt, BlockStmt, IfStmt, WhileStmt, FunctionStmt,
                 ReturnStmt, ClassStmt>
        kind;
    SourceSpan span;

    /// Checks if this statement is of kind `T`.
    ///
    /// # Example
    /// ```cpp
    /// if (stmt.is<VarStmt>()) { ... }
    /// ```
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this statement as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Gets this statement as kind `T` (const). Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

} // namespace lox::parser

#endif // LOX_PARSER_AST_STMTS_HPP
