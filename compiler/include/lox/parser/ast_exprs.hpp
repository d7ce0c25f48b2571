//! # Expression AST Nodes
//!
//! AST nodes for value-producing constructs.
//!
//! ## Expression Categories
//!
//! - **Literals**: `42`, `"hello"`, `true`, `nil`
//! - **Names**: `foo`, `this`, `super.method`
//! - **Operators**: `-x`, `a + b`, `a and b`, `x = y`
//! - **Calls and access**: `f(a, b)`, `obj.field`, `obj.field = v`
//! - **Grouping**: `(a + b)`
//!
//! Unary, binary and logical nodes keep the operator token they were built
//! from, so later stages can report errors at the operator.

#ifndef LOX_PARSER_AST_EXPRS_HPP
#define LOX_PARSER_AST_EXPRS_HPP

#include "lox/parser/ast_common.hpp"

namespace lox::parser {

// ============================================================================
// Literals and Names
// ============================================================================

/// Value of a literal: `nil`, a boolean, a number, or a string.
using LiteralValue = std::variant<std::monostate, bool, double, std::string>;

/// Literal expression: `42`, `3.14`, `"hello"`, `true`, `nil`.
///
/// `std::monostate` stands for `nil`.
struct LiteralExpr {
    LiteralValue value;
    SourceSpan span;
};

/// Parenthesized expression: `(a + b)`.
///
/// Kept as its own node so the printer can render `(group ...)`.
struct GroupingExpr {
    ExprPtr expr;
    SourceSpan span;
};

/// Variable reference: `foo`.
struct VariableExpr {
    lexer::Token name;
    SourceSpan span;
};

/// Receiver reference inside a method: `this`.
struct ThisExpr {
    lexer::Token keyword;
    SourceSpan span;
};

/// Superclass method reference: `super.method`.
struct SuperExpr {
    lexer::Token keyword; ///< The `super` token.
    lexer::Token method;  ///< The method name.
    SourceSpan span;
};

// ============================================================================
// Operators
// ============================================================================

/// Unary operators.
enum class UnaryOp {
    Neg, ///< `-x`
    Not, ///< `!x`
};

/// Unary expression: `-x`, `!done`.
struct UnaryExpr {
    UnaryOp op;
    lexer::Token op_token; ///< The operator as written.
    ExprPtr operand;
    SourceSpan span;
};

/// Binary operators.
enum class BinaryOp {
    // Arithmetic
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`

    // Equality
    Eq, ///< `==`
    Ne, ///< `!=`

    // Comparison
    Lt, ///< `<`
    Le, ///< `<=`
    Gt, ///< `>`
    Ge, ///< `>=`
};

/// Binary expression: `a + b`, `x < y`.
///
/// Chains fold to the left: `a - b - c` is `(a - b) - c`.
struct BinaryExpr {
    BinaryOp op;
    lexer::Token op_token;
    ExprPtr left;
    ExprPtr right;
    SourceSpan span;
};

/// Short-circuit operators.
enum class LogicalOp {
    And, ///< `and`
    Or,  ///< `or`
};

/// Logical expression: `a and b`, `a or b`.
///
/// Separate from `BinaryExpr` because the right operand is conditionally evaluated.
struct LogicalExpr {
    LogicalOp op;
    lexer::Token op_token;
    ExprPtr left;
    ExprPtr right;
    SourceSpan span;
};

/// Assignment to a variable: `x = value`.
///
/// Right-associative: `a = b = c` is `a = (b = c)`.
struct AssignExpr {
    lexer::Token name;
    ExprPtr value;
    SourceSpan span;
};

// ============================================================================
// Calls and Access
// ============================================================================

/// Function call: `f(a, b)`.
struct CallExpr {
    ExprPtr callee;
    lexer::Token paren; ///< Closing `)`, used to locate call errors.
    std::vector<ExprPtr> args;
    SourceSpan span;
};

/// Property read: `obj.field`.
struct GetExpr {
    ExprPtr object;
    lexer::Token name;
    SourceSpan span;
};

/// Property write: `obj.field = value`.
struct SetExpr {
    ExprPtr object;
    lexer::Token name;
    ExprPtr value;
    SourceSpan span;
};

// ============================================================================
// Expression Variant
// ============================================================================

/// An expression node.
///
/// A closed sum over all expression kinds; dispatch with `is<T>()` and `as<T>()`
/// or `std::visit` on `kind`.
struct Expr {
    std::variant<LiteralExpr, GroupingExpr, VariableExpr, ThisExpr, SuperExpr, UnaryExpr,
                 BinaryExpr, LogicalExpr, AssignExpr, CallExpr, GetExpr, SetExpr>
        kind;
    SourceSpan span;

    /// Checks if this expression is of kind `T`.
    ///
    /// # Example
    /// ```cpp
    /// if (expr.is<CallExpr>()) { ... }
    /// ```
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this expression as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// Gets this expression as kind `T` (const). Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

} // namespace lox::parser

#endif // LOX_PARSER_AST_EXPRS_HPP
