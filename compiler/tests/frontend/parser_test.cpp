#include "lox/lexer/lexer.hpp"
#include "lox/parser/ast_printer.hpp"
#include "lox/parser/parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace lox;
using namespace lox::parser;

class ParserTest : public ::testing::Test {
protected:
    AstPrinter printer_;

    auto parse_program(const std::string& code) -> ParseResult {
        return parser::parse(lexer::scan(code).tokens);
    }

    auto parse_expr(const std::string& code) -> Result<ExprPtr, std::vector<ParseError>> {
        return parser::parse_expression(lexer::scan(code).tokens);
    }

    // Renders a single expression, failing the test on any error
    auto render_expr(const std::string& code) -> std::string {
        auto result = parse_expr(code);
        EXPECT_TRUE(is_ok(result)) << "failed to parse: " << code;
        if (is_err(result)) {
            return "";
        }
        return printer_.print(*unwrap(result));
    }

    // Renders a whole program, failing the test on any error
    auto render(const std::string& code) -> std::string {
        auto result = parse_program(code);
        EXPECT_FALSE(result.has_errors()) << "errors parsing: " << code;
        return printer_.print(result.program);
    }
};

// ============================================================================
// Expressions
// ============================================================================

TEST_F(ParserTest, Literals) {
    EXPECT_EQ(render_expr("42"), "42.0");
    EXPECT_EQ(render_expr("3.5"), "3.5");
    EXPECT_EQ(render_expr("\"hello\""), "hello");
    EXPECT_EQ(render_expr("true"), "true");
    EXPECT_EQ(render_expr("false"), "false");
    EXPECT_EQ(render_expr("nil"), "nil");
}

TEST_F(ParserTest, LiteralValues) {
    auto result = parse_expr("\"text\"");
    ASSERT_TRUE(is_ok(result));
    const auto& expr = *unwrap(result);
    ASSERT_TRUE(expr.is<LiteralExpr>());
    EXPECT_EQ(std::get<std::string>(expr.as<LiteralExpr>().value), "text");
}

TEST_F(ParserTest, MultiplicationBindsTighterThanAddition) {
    auto result = parse_expr("1 + 2 * 3");
    ASSERT_TRUE(is_ok(result));
    const auto& expr = *unwrap(result);
    ASSERT_TRUE(expr.is<BinaryExpr>());
    const auto& add = expr.as<BinaryExpr>();
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(add.op_token.lexeme, "+");
    ASSERT_TRUE(add.right->is<BinaryExpr>());
    EXPECT_EQ(add.right->as<BinaryExpr>().op, BinaryOp::Mul);

    EXPECT_EQ(printer_.print(expr), "(+ 1.0 (* 2.0 3.0))");
}

TEST_F(ParserTest, GroupingOverridesPrecedence) {
    auto result = parse_expr("(1 + 2) * 3");
    ASSERT_TRUE(is_ok(result));
    const auto& expr = *unwrap(result);
    ASSERT_TRUE(expr.is<BinaryExpr>());
    EXPECT_EQ(expr.as<BinaryExpr>().op, BinaryOp::Mul);
    EXPECT_TRUE(expr.as<BinaryExpr>().left->is<GroupingExpr>());

    EXPECT_EQ(printer_.print(expr), "(* (group (+ 1.0 2.0)) 3.0)");
}

TEST_F(ParserTest, BinaryOperatorsAreLeftAssociative) {
    EXPECT_EQ(render_expr("1 - 2 - 3"), "(- (- 1.0 2.0) 3.0)");
    EXPECT_EQ(render_expr("8 / 4 / 2"), "(/ (/ 8.0 4.0) 2.0)");
    EXPECT_EQ(render_expr("a == b == c"), "(== (== a b) c)");
}

TEST_F(ParserTest, PrecedenceLadder) {
    EXPECT_EQ(render_expr("1 < 2 == true"), "(== (< 1.0 2.0) true)");
    EXPECT_EQ(render_expr("a + b >= c * d"), "(>= (+ a b) (* c d))");
    EXPECT_EQ(render_expr("a != b and c or d"), "(or (and (!= a b) c) d)");
    EXPECT_EQ(render_expr("a or b and c"), "(or a (and b c))");
    EXPECT_EQ(render_expr("-a * -b"), "(* (- a) (- b))");
}

TEST_F(ParserTest, UnaryOperators) {
    EXPECT_EQ(render_expr("!true"), "(! true)");
    EXPECT_EQ(render_expr("!-x"), "(! (- x))");
    EXPECT_EQ(render_expr("!!x"), "(! (! x))");
}

TEST_F(ParserTest, LogicalNodes) {
    auto result = parse_expr("a and b");
    ASSERT_TRUE(is_ok(result));
    const auto& expr = *unwrap(result);
    ASSERT_TRUE(expr.is<LogicalExpr>());
    EXPECT_EQ(expr.as<LogicalExpr>().op, LogicalOp::And);
    EXPECT_EQ(expr.as<LogicalExpr>().op_token.kind, lexer::TokenKind::KwAnd);
}

TEST_F(ParserTest, AssignmentIsRightAssociative) {
    EXPECT_EQ(render_expr("a = b = c"), "(= a (= b c))");
    EXPECT_EQ(render_expr("a = 1 + 2"), "(= a (+ 1.0 2.0))");
}

TEST_F(ParserTest, PropertyAccessAndAssignment) {
    EXPECT_EQ(render_expr("obj.field"), "(. obj field)");
    EXPECT_EQ(render_expr("obj.field = 1"), "(=. obj field 1.0)");
    EXPECT_EQ(render_expr("a.b.c = d"), "(=. (. a b) c d)");
}

TEST_F(ParserTest, Calls) {
    EXPECT_EQ(render_expr("f()"), "(call f)");
    EXPECT_EQ(render_expr("f(1, a + b)"), "(call f 1.0 (+ a b))");
    EXPECT_EQ(render_expr("f(1)(2).g"), "(. (call (call f 1.0) 2.0) g)");
    EXPECT_EQ(render_expr("obj.method(x)"), "(call (. obj method) x)");
}

TEST_F(ParserTest, CallRecordsClosingParen) {
    auto result = parse_expr("f(a,\n b)");
    ASSERT_TRUE(is_ok(result));
    const auto& call = unwrap(result)->as<CallExpr>();
    EXPECT_EQ(call.paren.kind, lexer::TokenKind::RParen);
    EXPECT_EQ(call.paren.line(), 2u);
    EXPECT_EQ(call.args.size(), 2u);
}

TEST_F(ParserTest, ThisAndSuper) {
    EXPECT_EQ(render_expr("this"), "this");
    EXPECT_EQ(render_expr("this.x"), "(. this x)");
    EXPECT_EQ(render_expr("super.method"), "(super method)");
    EXPECT_EQ(render_expr("super.method(1)"), "(call (super method) 1.0)");
}

TEST_F(ParserTest, SpansCoverWholeExpression) {
    auto result = parse_expr("1 + 2");
    ASSERT_TRUE(is_ok(result));
    const auto& expr = *unwrap(result);
    EXPECT_EQ(expr.span.start.column, 1u);
    EXPECT_EQ(expr.span.end.column, 5u);
}

TEST_F(ParserTest, LongOperatorChain) {
    std::string code = "1";
    for (int i = 0; i < 5000; ++i) {
        code += " + 1";
    }
    auto result = parse_expr(code);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result)->is<BinaryExpr>());
}

TEST_F(ParserTest, ExpressionEntryIgnoresTrailingTokens) {
    EXPECT_EQ(render_expr("1 + 2 3"), "(+ 1.0 2.0)");
}

TEST_F(ParserTest, RenderingIsDeterministic) {
    auto result = parse_expr("(a.b(1, \"s\") - -3) * !nil == super.x");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(printer_.print(*unwrap(result)), printer_.print(*unwrap(result)));
}

// ============================================================================
// Expression Errors
// ============================================================================

TEST_F(ParserTest, MissingExpression) {
    auto result = parse_expr(")");
    ASSERT_TRUE(is_err(result));
    const auto& errors = unwrap_err(result);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ParseErrorKind::ExpectedExpression);
    EXPECT_EQ(errors[0].message, "Expect expression.");
    EXPECT_EQ(errors[0].lexeme, ")");
    EXPECT_EQ(errors[0].code, "P002");
}

TEST_F(ParserTest, UnclosedGrouping) {
    auto result = parse_expr("(1 + 2");
    ASSERT_TRUE(is_err(result));
    const auto& errors = unwrap_err(result);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ParseErrorKind::ExpectedToken);
    EXPECT_EQ(errors[0].message, "Expect ')' after expression.");
    EXPECT_TRUE(errors[0].at_end);
}

TEST_F(ParserTest, InvalidAssignmentTarget) {
    auto result = parse_expr("a + b = c");
    ASSERT_TRUE(is_err(result));
    const auto& errors = unwrap_err(result);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ParseErrorKind::InvalidAssignmentTarget);
    EXPECT_EQ(errors[0].message, "Invalid assignment target.");
    EXPECT_EQ(errors[0].lexeme, "=");
    EXPECT_EQ(errors[0].code, "P005");
}

TEST_F(ParserTest, MissingPropertyName) {
    auto result = parse_expr("a.");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result)[0].message, "Expect property name after '.'.");
}

TEST_F(ParserTest, SuperWithoutMethod) {
    auto result = parse_expr("super");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result)[0].message, "Expect '.' after 'super'.");
}

// ============================================================================
// Statements
// ============================================================================

TEST_F(ParserTest, SimpleStatements) {
    EXPECT_EQ(render("print 1;"), "(print 1.0)\n");
    EXPECT_EQ(render("a;"), "(; a)\n");
    EXPECT_EQ(render("var a;"), "(var a)\n");
    EXPECT_EQ(render("var a = 1;"), "(var a = 1.0)\n");
}

TEST_F(ParserTest, StatementsInSourceOrder) {
    auto result = parse_program("var a = 1;\nprint a;\na = 2;");
    EXPECT_FALSE(result.has_errors());
    ASSERT_EQ(result.program.statements.size(), 3u);
    EXPECT_TRUE(result.program.statements[0]->is<VarStmt>());
    EXPECT_TRUE(result.program.statements[1]->is<PrintStmt>());
    EXPECT_TRUE(result.program.statements[2]->is<ExprStmt>());
}

TEST_F(ParserTest, Blocks) {
    EXPECT_EQ(render("{ var a = 1; print a; }"), "(block (var a = 1.0) (print a))\n");
    EXPECT_EQ(render("{}"), "(block)\n");
    EXPECT_EQ(render("{ { a; } }"), "(block (block (; a)))\n");
}

TEST_F(ParserTest, IfStatements) {
    EXPECT_EQ(render("if (a) print 1;"), "(if a (print 1.0))\n");
    EXPECT_EQ(render("if (a) print 1; else print 2;"), "(if-else a (print 1.0) (print 2.0))\n");
}

TEST_F(ParserTest, DanglingElseBindsToNearestIf) {
    EXPECT_EQ(render("if (a) if (b) print 1; else print 2;"),
              "(if a (if-else b (print 1.0) (print 2.0)))\n");
}

TEST_F(ParserTest, WhileStatement) {
    EXPECT_EQ(render("while (x < 3) x = x + 1;"), "(while (< x 3.0) (; (= x (+ x 1.0))))\n");
}

TEST_F(ParserTest, ForDesugarsToWhile) {
    EXPECT_EQ(render("for (var i = 0; i < 3; i = i + 1) print i;"),
              "(block (var i = 0.0) (while (< i 3.0) (block (print i) (; (= i (+ i 1.0))))))\n");
}

TEST_F(ParserTest, ForWithoutClauses) {
    EXPECT_EQ(render("for (;;) print 1;"), "(while true (print 1.0))\n");
    EXPECT_EQ(render("for (i = 0; ; ) print i;"), "(block (; (= i 0.0)) (while true (print i)))\n");
}

TEST_F(ParserTest, ForProducesOnlyBlockAndWhile) {
    auto result = parse_program("for (var i = 0; i < 1; i = i + 1) {}");
    ASSERT_EQ(result.program.statements.size(), 1u);
    const auto& outer = *result.program.statements[0];
    ASSERT_TRUE(outer.is<BlockStmt>());
    const auto& stmts = outer.as<BlockStmt>().stmts;
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_TRUE(stmts[0]->is<VarStmt>());
    EXPECT_TRUE(stmts[1]->is<WhileStmt>());
}

TEST_F(ParserTest, FunctionDeclarations) {
    EXPECT_EQ(render("fun add(a, b) { return a + b; }"), "(fun add (a b) (return (+ a b)))\n");
    EXPECT_EQ(render("fun f() { return; }"), "(fun f () (return))\n");
    EXPECT_EQ(render("fun noop() {}"), "(fun noop ())\n");
}

TEST_F(ParserTest, FunctionNodeFields) {
    auto result = parse_program("fun greet(name) { print name; }");
    ASSERT_EQ(result.program.statements.size(), 1u);
    const auto& func = result.program.statements[0]->as<FunctionStmt>();
    EXPECT_EQ(func.name.lexeme, "greet");
    ASSERT_EQ(func.params.size(), 1u);
    EXPECT_EQ(func.params[0].lexeme, "name");
    EXPECT_EQ(func.body.size(), 1u);
}

TEST_F(ParserTest, ClassDeclarations) {
    EXPECT_EQ(render("class A {}"), "(class A)\n");
    EXPECT_EQ(render("class B < A { init(x) { this.x = x; } get() { return super.get(); } }"),
              "(class B < A (fun init (x) (; (=. this x x))) "
              "(fun get () (return (call (super get)))))\n");
}

TEST_F(ParserTest, ClassNodeFields) {
    auto result = parse_program("class Cat < Animal { speak() {} }");
    ASSERT_EQ(result.program.statements.size(), 1u);
    const auto& cls = result.program.statements[0]->as<ClassStmt>();
    EXPECT_EQ(cls.name.lexeme, "Cat");
    ASSERT_TRUE(cls.superclass.has_value());
    EXPECT_EQ((*cls.superclass)->as<VariableExpr>().name.lexeme, "Animal");
    ASSERT_EQ(cls.methods.size(), 1u);
    EXPECT_EQ(cls.methods[0].name.lexeme, "speak");
}

// ============================================================================
// Error Recovery
// ============================================================================

TEST_F(ParserTest, RecoversAfterMalformedDeclaration) {
    auto result = parse_program("var = 1; var x = 2;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect variable name.");
    EXPECT_EQ(result.errors[0].lexeme, "=");
    EXPECT_EQ(result.errors[0].line(), 1u);

    ASSERT_EQ(result.program.statements.size(), 1u);
    const auto& stmt = *result.program.statements[0];
    ASSERT_TRUE(stmt.is<VarStmt>());
    EXPECT_EQ(stmt.as<VarStmt>().name.lexeme, "x");
}

TEST_F(ParserTest, ReportsMultipleIndependentErrors) {
    auto result = parse_program("print ;\nvar y = 3;\nprint (;\n");
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].line(), 1u);
    EXPECT_EQ(result.errors[1].line(), 3u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::ExpectedExpression);

    ASSERT_EQ(result.program.statements.size(), 1u);
    EXPECT_TRUE(result.program.statements[0]->is<VarStmt>());
}

TEST_F(ParserTest, SynchronizesBeforeStatementKeyword) {
    auto result = parse_program("print 1 + * 2 print 3;\nvar b = 2;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect expression.");
    EXPECT_EQ(result.errors[0].lexeme, "*");

    EXPECT_EQ(printer_.print(result.program), "(print 3.0)\n(var b = 2.0)\n");
}

TEST_F(ParserTest, RecoversInsideBlock) {
    auto result = parse_program("{ var = 1; print 2; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(printer_.print(result.program), "(block (print 2.0))\n");
}

TEST_F(ParserTest, ErrorAtClosingBraceKeepsFollowingStatements) {
    auto result = parse_program("{ 1 + } var x = 2;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect expression.");
    EXPECT_EQ(result.errors[0].lexeme, "}");
    EXPECT_EQ(printer_.print(result.program), "(block)\n(var x = 2.0)\n");
}

TEST_F(ParserTest, RecoveryInsideBlockStopsAtClosingBrace) {
    auto result = parse_program("{ print 1 + * 2 } print 3;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].lexeme, "*");
    EXPECT_EQ(printer_.print(result.program), "(block)\n(print 3.0)\n");
}

TEST_F(ParserTest, ErrorInFunctionBodyKeepsFunction) {
    auto result = parse_program("fun f() { return 1 + ; }\nprint 2;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].line(), 1u);

    ASSERT_EQ(result.program.statements.size(), 2u);
    EXPECT_TRUE(result.program.statements[0]->is<FunctionStmt>());
    EXPECT_TRUE(result.program.statements[1]->is<PrintStmt>());
}

TEST_F(ParserTest, StrayClosingBraceAtTopLevel) {
    auto result = parse_program("} print 1;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect expression.");
    EXPECT_EQ(printer_.print(result.program), "(print 1.0)\n");
}

TEST_F(ParserTest, ErrorAtMultilineStringUsesOpeningLine) {
    auto result = parse_program("print 1 \"a\nb\";");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect ';' after value.");
    EXPECT_EQ(result.errors[0].lexeme, "\"a\nb\"");
    EXPECT_EQ(result.errors[0].line(), 1u);
}

TEST_F(ParserTest, MissingSemicolonAtEnd) {
    auto result = parse_program("print 1");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect ';' after value.");
    EXPECT_TRUE(result.errors[0].at_end);
    EXPECT_EQ(result.errors[0].lexeme, "");
    EXPECT_TRUE(result.program.statements.empty());
}

TEST_F(ParserTest, InvalidAssignmentDoesNotDropStatement) {
    auto result = parse_program("1 = 2;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::InvalidAssignmentTarget);
    EXPECT_EQ(printer_.print(result.program), "(; 1.0)\n");
}

TEST_F(ParserTest, UnclosedBlockReportsAtEnd) {
    auto result = parse_program("{ print 1;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect '}' after block.");
    EXPECT_TRUE(result.errors[0].at_end);
}

TEST_F(ParserTest, FunctionErrors) {
    auto result = parse_program("fun (a) {}");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect function name.");

    result = parse_program("fun f(a, 1) {}");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect parameter name.");

    result = parse_program("class A { m( {} }");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Expect parameter name.");
}

TEST_F(ParserTest, ControlFlowErrors) {
    EXPECT_EQ(parse_program("if a) print 1;").errors[0].message, "Expect '(' after 'if'.");
    EXPECT_EQ(parse_program("while (a print 1;").errors[0].message,
              "Expect ')' after condition.");
    EXPECT_EQ(parse_program("for (var i = 0; i < 1 i) {}").errors[0].message,
              "Expect ';' after loop condition.");
    EXPECT_EQ(parse_program("return 1").errors[0].message, "Expect ';' after return value.");
}

TEST_F(ParserTest, ErrorCodesMatchKinds) {
    EXPECT_STREQ(parse_error_code(ParseErrorKind::ExpectedToken), "P001");
    EXPECT_STREQ(parse_error_code(ParseErrorKind::ExpectedExpression), "P002");
    EXPECT_STREQ(parse_error_code(ParseErrorKind::TooManyArguments), "P003");
    EXPECT_STREQ(parse_error_code(ParseErrorKind::TooManyParameters), "P004");
    EXPECT_STREQ(parse_error_code(ParseErrorKind::InvalidAssignmentTarget), "P005");
}

// ============================================================================
// Limits
// ============================================================================

static auto comma_list(const std::string& item, size_t count) -> std::string {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += item + std::to_string(i);
    }
    return out;
}

TEST_F(ParserTest, MaximumArgumentsAccepted) {
    auto result = parse_program("f(" + comma_list("a", limits::MAX_ARGUMENTS) + ");");
    EXPECT_FALSE(result.has_errors());
}

TEST_F(ParserTest, TooManyArgumentsIsNonFatal) {
    auto result = parse_program("f(" + comma_list("a", limits::MAX_ARGUMENTS + 1) + ");\nprint 1;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::TooManyArguments);
    EXPECT_EQ(result.errors[0].message, "Can't have more than 255 arguments.");
    EXPECT_EQ(result.errors[0].lexeme, "a255");

    ASSERT_EQ(result.program.statements.size(), 2u);
    const auto& call =
        result.program.statements[0]->as<ExprStmt>().expr->as<CallExpr>();
    EXPECT_EQ(call.args.size(), limits::MAX_ARGUMENTS + 1);
}

TEST_F(ParserTest, TooManyParametersIsNonFatal) {
    auto result =
        parse_program("fun f(" + comma_list("p", limits::MAX_PARAMETERS + 1) + ") {}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::TooManyParameters);
    EXPECT_EQ(result.errors[0].message, "Can't have more than 255 parameters.");
    ASSERT_EQ(result.program.statements.size(), 1u);
    EXPECT_EQ(result.program.statements[0]->as<FunctionStmt>().params.size(),
              limits::MAX_PARAMETERS + 1);
}

// ============================================================================
// Token Input
// ============================================================================

TEST_F(ParserTest, AppendsMissingEof) {
    auto tokens = lexer::scan("print 1;").tokens;
    tokens.pop_back();
    Parser parser(std::move(tokens));
    auto program = parser.parse_program();
    EXPECT_FALSE(parser.has_errors());
    EXPECT_EQ(program.statements.size(), 1u);
}

TEST_F(ParserTest, EmptyProgram) {
    auto result = parse_program("");
    EXPECT_FALSE(result.has_errors());
    EXPECT_TRUE(result.program.statements.empty());
}
