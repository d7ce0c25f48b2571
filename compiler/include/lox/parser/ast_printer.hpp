//! # AST Printer
//!
//! Renders syntax trees in a parenthesized prefix form, one line per node
//! tree. The output is canonical: the same tree always renders to the same
//! text, which makes it the basis of the `parse` and `ast` CLI commands and
//! of most parser tests.
//!
//! ```text
//! 1 + 2 * 3          =>  (+ 1.0 (* 2.0 3.0))
//! var x = -a;        =>  (var x = (- a))
//! if (c) f(x);       =>  (if c (; (call f x)))
//! ```

#ifndef LOX_PARSER_AST_PRINTER_HPP
#define LOX_PARSER_AST_PRINTER_HPP

#include "lox/parser/ast.hpp"

#include <initializer_list>
#include <string>

namespace lox::parser {

class AstPrinter {
public:
    /// Renders a single expression.
    [[nodiscard]] auto print(const Expr& expr) const -> std::string;

    /// Renders a single statement.
    [[nodiscard]] auto print(const Stmt& stmt) const -> std::string;

    /// Renders every top-level statement, newline-terminated.
    [[nodiscard]] auto print(const Program& program) const -> std::string;

private:
    // Expressions
    [[nodiscard]] auto print_literal(const LiteralExpr& lit) const -> std::string;
    [[nodiscard]] auto print_unary(const UnaryExpr& unary) const -> std::string;
    [[nodiscard]] auto print_binary(const BinaryExpr& bin) const -> std::string;
    [[nodiscard]] auto print_logical(const LogicalExpr& logical) const -> std::string;
    [[nodiscard]] auto print_call(const CallExpr& call) const -> std::string;

    // Statements
    [[nodiscard]] auto print_var(const VarStmt& var) const -> std::string;
    [[nodiscard]] auto print_block(const BlockStmt& block) const -> std::string;
    [[nodiscard]] auto print_if(const IfStmt& if_stmt) const -> std::string;
    [[nodiscard]] auto print_function(const FunctionStmt& func) const -> std::string;
    [[nodiscard]] auto print_return(const ReturnStmt& ret) const -> std::string;
    [[nodiscard]] auto print_class(const ClassStmt& cls) const -> std::string;

    [[nodiscard]] auto parenthesize(const std::string& name,
                                    std::initializer_list<const Expr*> exprs) const
        -> std::string;

    static auto binary_op_str(BinaryOp op) -> std::string;
    static auto unary_op_str(UnaryOp op) -> std::string;
};

} // namespace lox::parser

#endif // LOX_PARSER_AST_PRINTER_HPP
