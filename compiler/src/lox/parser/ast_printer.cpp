//! # AST Printer
//!
//! | Node          | Rendering                         |
//! |---------------|-----------------------------------|
//! | Grouping      | `(group e)`                       |
//! | Unary         | `(op e)`                          |
//! | Binary, Logic | `(op l r)`                        |
//! | Assign, Set   | `(= name v)`, `(=. obj name v)`   |
//! | Call, Get     | `(call f a b)`, `(. obj name)`    |
//! | Super         | `(super name)`                    |
//! | Block         | `(block s1 s2)`                   |
//! | If            | `(if c t)`, `(if-else c t e)`     |
//! | Function      | `(fun name (a b) s1 s2)`          |
//! | Class         | `(class Name < Super m1 m2)`      |

#include "lox/parser/ast_printer.hpp"

#include <sstream>

namespace lox::parser {

// ============================================================================
// Expressions
// ============================================================================

auto AstPrinter::print(const Expr& expr) const -> std::string {
    if (expr.is<LiteralExpr>()) {
        return print_literal(expr.as<LiteralExpr>());
    } else if (expr.is<GroupingExpr>()) {
        return parenthesize("group", {expr.as<GroupingExpr>().expr.get()});
    } else if (expr.is<UnaryExpr>()) {
        return print_unary(expr.as<UnaryExpr>());
    } else if (expr.is<BinaryExpr>()) {
        return print_binary(expr.as<BinaryExpr>());
    } else if (expr.is<LogicalExpr>()) {
        return print_logical(expr.as<LogicalExpr>());
    } else if (expr.is<VariableExpr>()) {
        return expr.as<VariableExpr>().name.lexeme;
    } else if (expr.is<AssignExpr>()) {
        const auto& assign = expr.as<AssignExpr>();
        return "(= " + assign.name.lexeme + " " + print(*assign.value) + ")";
    } else if (expr.is<CallExpr>()) {
        return print_call(expr.as<CallExpr>());
    } else if (expr.is<GetExpr>()) {
        const auto& get = expr.as<GetExpr>();
        return "(. " + print(*get.object) + " " + get.name.lexeme + ")";
    } else if (expr.is<SetExpr>()) {
        const auto& set = expr.as<SetExpr>();
        return "(=. " + print(*set.object) + " " + set.name.lexeme + " " + print(*set.value) +
               ")";
    } else if (expr.is<ThisExpr>()) {
        return "this";
    } else if (expr.is<SuperExpr>()) {
        return "(super " + expr.as<SuperExpr>().method.lexeme + ")";
    }

    return "<unknown expr>";
}

auto AstPrinter::print_literal(const LiteralExpr& lit) const -> std::string {
    if (std::holds_alternative<double>(lit.value)) {
        return lexer::format_number(std::get<double>(lit.value));
    }
    if (std::holds_alternative<std::string>(lit.value)) {
        return std::get<std::string>(lit.value);
    }
    if (std::holds_alternative<bool>(lit.value)) {
        return std::get<bool>(lit.value) ? "true" : "false";
    }
    return "nil";
}

auto AstPrinter::print_unary(const UnaryExpr& unary) const -> std::string {
    return parenthesize(unary_op_str(unary.op), {unary.operand.get()});
}

auto AstPrinter::print_binary(const BinaryExpr& bin) const -> std::string {
    return parenthesize(binary_op_str(bin.op), {bin.left.get(), bin.right.get()});
}

auto AstPrinter::print_logical(const LogicalExpr& logical) const -> std::string {
    const char* name = logical.op == LogicalOp::And ? "and" : "or";
    return parenthesize(name, {logical.left.get(), logical.right.get()});
}

auto AstPrinter::print_call(const CallExpr& call) const -> std::string {
    std::string out = "(call " + print(*call.callee);
    for (const auto& arg : call.args) {
        out += " " + print(*arg);
    }
    out += ")";
    return out;
}

auto AstPrinter::parenthesize(const std::string& name,
                              std::initializer_list<const Expr*> exprs) const -> std::string {
    std::string out = "(" + name;
    for (const Expr* expr : exprs) {
        out += " " + print(*expr);
    }
    out += ")";
    return out;
}

auto AstPrinter::binary_op_str(BinaryOp op) -> std::string {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Ge:
        return ">=";
    }
    return "?";
}

auto AstPrinter::unary_op_str(UnaryOp op) -> std::string {
    switch (op) {
    case UnaryOp::Neg:
        return "-";
    case UnaryOp::Not:
        return "!";
    }
    return "?";
}

// ============================================================================
// Statements
// ============================================================================

auto AstPrinter::print(const Stmt& stmt) const -> std::string {
    if (stmt.is<ExprStmt>()) {
        return "(; " + print(*stmt.as<ExprStmt>().expr) + ")";
    } else if (stmt.is<PrintStmt>()) {
        return "(print " + print(*stmt.as<PrintStmt>().expr) + ")";
    } else if (stmt.is<VarStmt>()) {
        return print_var(stmt.as<VarStmt>());
    } else if (stmt.is<BlockStmt>()) {
        return print_block(stmt.as<BlockStmt>());
    } else if (stmt.is<IfStmt>()) {
        return print_if(stmt.as<IfStmt>());
    } else if (stmt.is<WhileStmt>()) {
        const auto& loop = stmt.as<WhileStmt>();
        return "(while " + print(*loop.condition) + " " + print(*loop.body) + ")";
    } else if (stmt.is<FunctionStmt>()) {
        return print_function(stmt.as<FunctionStmt>());
    } else if (stmt.is<ReturnStmt>()) {
        return print_return(stmt.as<ReturnStmt>());
    } else if (stmt.is<ClassStmt>()) {
        return print_class(stmt.as<ClassStmt>());
    }

    return "<unknown stmt>";
}

auto AstPrinter::print_var(const VarStmt& var) const -> std::string {
    if (!var.init) {
        return "(var " + var.name.lexeme + ")";
    }
    return "(var " + var.name.lexeme + " = " + print(**var.init) + ")";
}

auto AstPrinter::print_block(const BlockStmt& block) const -> std::string {
    std::string out = "(block";
    for (const auto& stmt : block.stmts) {
        out += " " + print(*stmt);
    }
    out += ")";
    return out;
}

auto AstPrinter::print_if(const IfStmt& if_stmt) const -> std::string {
    if (!if_stmt.else_branch) {
        return "(if " + print(*if_stmt.condition) + " " + print(*if_stmt.then_branch) + ")";
    }
    return "(if-else " + print(*if_stmt.condition) + " " + print(*if_stmt.then_branch) + " " +
           print(**if_stmt.else_branch) + ")";
}

auto AstPrinter::print_function(const FunctionStmt& func) const -> std::string {
    std::ostringstream out;
    out << "(fun " << func.name.lexeme << " (";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            out << " ";
        }
        out << func.params[i].lexeme;
    }
    out << ")";
    for (const auto& stmt : func.body) {
        out << " " << print(*stmt);
    }
    out << ")";
    return out.str();
}

auto AstPrinter::print_return(const ReturnStmt& ret) const -> std::string {
    if (!ret.value) {
        return "(return)";
    }
    return "(return " + print(**ret.value) + ")";
}

auto AstPrinter::print_class(const ClassStmt& cls) const -> std::string {
    std::string out = "(class " + cls.name.lexeme;
    if (cls.superclass) {
        out += " < " + print(**cls.superclass);
    }
    for (const auto& method : cls.methods) {
        out += " " + print_function(method);
    }
    out += ")";
    return out;
}

// ============================================================================
// Programs
// ============================================================================

auto AstPrinter::print(const Program& program) const -> std::string {
    std::string out;
    for (const auto& stmt : program.statements) {
        out += print(*stmt);
        out += "\n";
    }
    return out;
}

} // namespace lox::parser
