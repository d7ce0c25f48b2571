#include "lox/lexer/lexer.hpp"
#include "lox/parser/ast_printer.hpp"
#include "lox/parser/parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace lox;
using namespace lox::parser;
using lexer::Token;
using lexer::TokenKind;

// Hand-built trees, independent of the parser
class AstPrinterTest : public ::testing::Test {
protected:
    AstPrinter printer_;

    static auto tok(TokenKind kind, const std::string& lexeme) -> Token {
        return Token{.kind = kind, .span = {}, .lexeme = lexeme, .value = std::monostate{}};
    }

    static auto num(double value) -> ExprPtr {
        return make_box<Expr>(Expr{.kind = LiteralExpr{.value = value, .span = {}}, .span = {}});
    }

    static auto var(const std::string& name) -> ExprPtr {
        return make_box<Expr>(
            Expr{.kind = VariableExpr{.name = tok(TokenKind::Identifier, name), .span = {}},
                 .span = {}});
    }

    static auto expr_stmt(ExprPtr expr) -> StmtPtr {
        return make_box<Stmt>(Stmt{.kind = ExprStmt{.expr = std::move(expr), .span = {}}, .span = {}});
    }
};

TEST_F(AstPrinterTest, NestedArithmetic) {
    // -123 * (45.67)
    auto negated = make_box<Expr>(Expr{.kind = UnaryExpr{.op = UnaryOp::Neg,
                                                         .op_token = tok(TokenKind::Minus, "-"),
                                                         .operand = num(123),
                                                         .span = {}},
                                       .span = {}});
    auto group = make_box<Expr>(
        Expr{.kind = GroupingExpr{.expr = num(45.67), .span = {}}, .span = {}});
    Expr expr{.kind = BinaryExpr{.op = BinaryOp::Mul,
                                 .op_token = tok(TokenKind::Star, "*"),
                                 .left = std::move(negated),
                                 .right = std::move(group),
                                 .span = {}},
              .span = {}};

    EXPECT_EQ(printer_.print(expr), "(* (- 123.0) (group 45.67))");
}

TEST_F(AstPrinterTest, LiteralKinds) {
    Expr nil{.kind = LiteralExpr{.value = std::monostate{}, .span = {}}, .span = {}};
    Expr yes{.kind = LiteralExpr{.value = true, .span = {}}, .span = {}};
    Expr text{.kind = LiteralExpr{.value = std::string("a b"), .span = {}}, .span = {}};

    EXPECT_EQ(printer_.print(nil), "nil");
    EXPECT_EQ(printer_.print(yes), "true");
    EXPECT_EQ(printer_.print(text), "a b");
}

TEST_F(AstPrinterTest, SmallFractionsAreNotInExponentForm) {
    auto group = make_box<Expr>(
        Expr{.kind = GroupingExpr{.expr = num(0.00001), .span = {}}, .span = {}});
    Expr expr{.kind = BinaryExpr{.op = BinaryOp::Add,
                                 .op_token = tok(TokenKind::Plus, "+"),
                                 .left = num(0.0000001),
                                 .right = std::move(group),
                                 .span = {}},
              .span = {}};

    EXPECT_EQ(printer_.print(expr), "(+ 0.0000001 (group 0.00001))");
}

TEST_F(AstPrinterTest, AllBinaryOperators) {
    struct Case {
        BinaryOp op;
        const char* text;
    };
    for (const auto& c : {Case{BinaryOp::Add, "+"}, Case{BinaryOp::Sub, "-"},
                          Case{BinaryOp::Mul, "*"}, Case{BinaryOp::Div, "/"},
                          Case{BinaryOp::Eq, "=="}, Case{BinaryOp::Ne, "!="},
                          Case{BinaryOp::Lt, "<"}, Case{BinaryOp::Le, "<="},
                          Case{BinaryOp::Gt, ">"}, Case{BinaryOp::Ge, ">="}}) {
        Expr expr{.kind = BinaryExpr{.op = c.op,
                                     .op_token = tok(TokenKind::Plus, c.text),
                                     .left = var("a"),
                                     .right = var("b"),
                                     .span = {}},
                  .span = {}};
        EXPECT_EQ(printer_.print(expr), std::string("(") + c.text + " a b)");
    }
}

TEST_F(AstPrinterTest, CallWithArguments) {
    std::vector<ExprPtr> args;
    args.push_back(num(1));
    args.push_back(var("x"));
    Expr call{.kind = CallExpr{.callee = var("f"),
                               .paren = tok(TokenKind::RParen, ")"),
                               .args = std::move(args),
                               .span = {}},
              .span = {}};

    EXPECT_EQ(printer_.print(call), "(call f 1.0 x)");
}

TEST_F(AstPrinterTest, VarWithAndWithoutInitializer) {
    Stmt bare{.kind = VarStmt{.name = tok(TokenKind::Identifier, "a"), .init = std::nullopt, .span = {}},
              .span = {}};
    Stmt init{.kind = VarStmt{.name = tok(TokenKind::Identifier, "b"), .init = num(2), .span = {}},
              .span = {}};

    EXPECT_EQ(printer_.print(bare), "(var a)");
    EXPECT_EQ(printer_.print(init), "(var b = 2.0)");
}

TEST_F(AstPrinterTest, BlockOfStatements) {
    std::vector<StmtPtr> stmts;
    stmts.push_back(expr_stmt(var("a")));
    stmts.push_back(make_box<Stmt>(Stmt{.kind = PrintStmt{.expr = num(7), .span = {}}, .span = {}}));
    Stmt block{.kind = BlockStmt{.stmts = std::move(stmts), .span = {}}, .span = {}};

    EXPECT_EQ(printer_.print(block), "(block (; a) (print 7.0))");
}

TEST_F(AstPrinterTest, ReturnForms) {
    Stmt bare{.kind = ReturnStmt{.keyword = tok(TokenKind::KwReturn, "return"),
                                 .value = std::nullopt,
                                 .span = {}},
              .span = {}};
    Stmt value{.kind = ReturnStmt{.keyword = tok(TokenKind::KwReturn, "return"),
                                  .value = var("x"),
                                  .span = {}},
               .span = {}};

    EXPECT_EQ(printer_.print(bare), "(return)");
    EXPECT_EQ(printer_.print(value), "(return x)");
}

TEST_F(AstPrinterTest, ProgramOneStatementPerLine) {
    auto result = parse(lexer::scan("var a = 1; print a;").tokens);
    ASSERT_FALSE(result.has_errors());
    EXPECT_EQ(printer_.print(result.program), "(var a = 1.0)\n(print a)\n");
}

TEST_F(AstPrinterTest, EmptyProgramRendersNothing) {
    Program program;
    EXPECT_EQ(printer_.print(program), "");
}

TEST_F(AstPrinterTest, RenderingTwiceIsIdentical) {
    auto result = parse(lexer::scan(R"(
        class Point < Base {
            init(x, y) { this.x = x; this.y = y; }
            len() { return super.len() * 2; }
        }
        for (var i = 0; i < 10; i = i + 1) {
            if (i == 5 or !done) print "half"; else print i / 3;
        }
    )").tokens);
    ASSERT_FALSE(result.has_errors());

    auto first = printer_.print(result.program);
    auto second = printer_.print(result.program);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(first.empty());
}
