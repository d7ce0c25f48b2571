#ifndef LOX_PARSER_PARSER_HPP
#define LOX_PARSER_PARSER_HPP

#include "lox/common.hpp"
#include "lox/lexer/lexer.hpp"
#include "lox/parser/ast.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace lox::parser {

// Fixed limits, checked without aborting the parse
namespace limits {
constexpr size_t MAX_ARGUMENTS = 255;  // f(a1, ..., a255)
constexpr size_t MAX_PARAMETERS = 255; // fun f(p1, ..., p255)
} // namespace limits

/// Classification of syntax errors.
enum class ParseErrorKind : uint8_t {
    ExpectedToken,           ///< A required token is missing (P001).
    ExpectedExpression,      ///< No expression starts at this token (P002).
    TooManyArguments,        ///< Call exceeds `limits::MAX_ARGUMENTS` (P003).
    TooManyParameters,       ///< Function exceeds `limits::MAX_PARAMETERS` (P004).
    InvalidAssignmentTarget, ///< Left side of `=` is not assignable (P005).
};

// Parser error
struct ParseError {
    ParseErrorKind kind;
    std::string message;
    SourceSpan span;
    std::string lexeme; // Offending token text (empty at end of input)
    bool at_end = false;
    std::string code;

    [[nodiscard]] auto line() const -> uint32_t {
        return span.start.line;
    }
};

// Output of a full program parse: best-effort tree plus errors in source order
struct ParseResult {
    Program program;
    std::vector<ParseError> errors;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors.empty();
    }
};

// Returns the diagnostic code for a syntax error kind ("P001"..."P005")
[[nodiscard]] auto parse_error_code(ParseErrorKind kind) -> const char*;

// Recursive-descent parser for Lox.
//
// One production per precedence level, lowest to highest:
// assignment, or, and, equality, comparison, term, factor, unary, call, primary.
class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    // Parse declarations until end of input, recovering after each error
    [[nodiscard]] auto parse_program() -> Program;

    // Parse a single expression (the `parse` command entry point)
    [[nodiscard]] auto parse_expression() -> Result<ExprPtr, ParseError>;

    // Errors recorded so far, including non-fatal ones
    [[nodiscard]] auto errors() const -> const std::vector<ParseError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    using Production = Result<ExprPtr, ParseError> (Parser::*)();

    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    size_t block_depth_ = 0; // Open `{ ... }` statement lists
    std::vector<ParseError> errors_;

    // Token access
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto match_any(std::initializer_list<lexer::TokenKind> kinds) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& message)
        -> Result<lexer::Token, ParseError>;

    // Error handling
    [[nodiscard]] auto make_error(ParseErrorKind kind, const std::string& message,
                                  const lexer::Token& token) const -> ParseError;
    void report_error(ParseError error);
    void synchronize();

    // Declaration parsing
    auto parse_declaration_or_recover() -> StmtPtr;
    auto parse_declaration() -> Result<StmtPtr, ParseError>;
    auto parse_class_decl() -> Result<StmtPtr, ParseError>;
    auto parse_function(const std::string& kind) -> Result<FunctionStmt, ParseError>;
    auto parse_var_decl() -> Result<StmtPtr, ParseError>;

    // Statement parsing
    auto parse_statement() -> Result<StmtPtr, ParseError>;
    auto parse_print_stmt() -> Result<StmtPtr, ParseError>;
    auto parse_expr_stmt() -> Result<StmtPtr, ParseError>;
    auto parse_block() -> Result<std::vector<StmtPtr>, ParseError>;
    auto parse_if_stmt() -> Result<StmtPtr, ParseError>;
    auto parse_while_stmt() -> Result<StmtPtr, ParseError>;
    auto parse_for_stmt() -> Result<StmtPtr, ParseError>;
    auto parse_return_stmt() -> Result<StmtPtr, ParseError>;

    // Expression parsing
    auto parse_expr() -> Result<ExprPtr, ParseError>;
    auto parse_assignment() -> Result<ExprPtr, ParseError>;
    auto parse_or() -> Result<ExprPtr, ParseError>;
    auto parse_and() -> Result<ExprPtr, ParseError>;
    auto parse_equality() -> Result<ExprPtr, ParseError>;
    auto parse_comparison() -> Result<ExprPtr, ParseError>;
    auto parse_term() -> Result<ExprPtr, ParseError>;
    auto parse_factor() -> Result<ExprPtr, ParseError>;
    auto parse_unary() -> Result<ExprPtr, ParseError>;
    auto parse_call() -> Result<ExprPtr, ParseError>;
    auto finish_call(ExprPtr callee) -> Result<ExprPtr, ParseError>;
    auto parse_primary() -> Result<ExprPtr, ParseError>;

    // Left fold of `operand (op operand)*` for one binary precedence level
    auto parse_binary_level(std::initializer_list<lexer::TokenKind> operators, Production operand)
        -> Result<ExprPtr, ParseError>;

    // Operator conversion
    static auto token_to_binary_op(lexer::TokenKind kind) -> BinaryOp;
    static auto token_to_unary_op(lexer::TokenKind kind) -> UnaryOp;
};

// Parses a whole program. Never stops at the first error.
[[nodiscard]] auto parse(std::vector<lexer::Token> tokens) -> ParseResult;

// Parses one expression; fails with every recorded error if any occurred
[[nodiscard]] auto parse_expression(std::vector<lexer::Token> tokens)
    -> Result<ExprPtr, std::vector<ParseError>>;

} // namespace lox::parser

#endif // LOX_PARSER_PARSER_HPP
