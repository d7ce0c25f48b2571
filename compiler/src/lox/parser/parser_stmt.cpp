//! # Parser - Statements and Declarations
//!
//! ## Grammar
//!
//! ```text
//! declaration -> classDecl | funDecl | varDecl | statement
//! classDecl   -> "class" IDENT ( "<" IDENT )? "{" function* "}"
//! funDecl     -> "fun" function
//! function    -> IDENT "(" parameters? ")" block
//! varDecl     -> "var" IDENT ( "=" expression )? ";"
//! statement   -> exprStmt | forStmt | ifStmt | printStmt | returnStmt | whileStmt | block
//! ```
//!
//! `for` has no node of its own; it is rewritten into `Block`/`While`.

#include "lox/parser/parser.hpp"
#include "lox/log/log.hpp"

namespace lox::parser {

using lexer::TokenKind;

// ============================================================================
// Declarations
// ============================================================================

auto Parser::parse_declaration_or_recover() -> StmtPtr {
    auto result = parse_declaration();
    if (is_ok(result)) {
        return std::move(unwrap(result));
    }

    report_error(std::move(unwrap_err(result)));
    synchronize();
    LOX_LOG_TRACE("parser", "Resuming at '" << peek().lexeme << "' on line " << peek().line());
    return nullptr;
}

auto Parser::parse_declaration() -> Result<StmtPtr, ParseError> {
    if (match(TokenKind::KwClass)) {
        return parse_class_decl();
    }

    if (match(TokenKind::KwFun)) {
        auto start_span = previous().span;
        auto func = parse_function("function");
        if (is_err(func)) {
            return unwrap_err(func);
        }
        auto& decl = unwrap(func);
        decl.span = SourceSpan::merge(start_span, decl.span);
        auto span = decl.span;
        return make_box<Stmt>(Stmt{.kind = std::move(decl), .span = span});
    }

    if (match(TokenKind::KwVar)) {
        return parse_var_decl();
    }

    return parse_statement();
}

auto Parser::parse_class_decl() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto name = expect(TokenKind::Identifier, "Expect class name.");
    if (is_err(name)) {
        return unwrap_err(name);
    }

    std::optional<ExprPtr> superclass;
    if (match(TokenKind::Less)) {
        auto super_name = expect(TokenKind::Identifier, "Expect superclass name.");
        if (is_err(super_name)) {
            return unwrap_err(super_name);
        }
        const auto& token = unwrap(super_name);
        superclass = make_box<Expr>(
            Expr{.kind = VariableExpr{.name = token, .span = token.span}, .span = token.span});
    }

    auto lbrace = expect(TokenKind::LBrace, "Expect '{' before class body.");
    if (is_err(lbrace)) {
        return unwrap_err(lbrace);
    }

    std::vector<FunctionStmt> methods;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        auto method = parse_function("method");
        if (is_err(method)) {
            return unwrap_err(method);
        }
        methods.push_back(std::move(unwrap(method)));
    }

    auto rbrace = expect(TokenKind::RBrace, "Expect '}' after class body.");
    if (is_err(rbrace)) {
        return unwrap_err(rbrace);
    }

    auto span = SourceSpan::merge(start_span, unwrap(rbrace).span);
    return make_box<Stmt>(Stmt{.kind = ClassStmt{.name = std::move(unwrap(name)),
                                                 .superclass = std::move(superclass),
                                                 .methods = std::move(methods),
                                                 .span = span},
                               .span = span});
}

auto Parser::parse_function(const std::string& kind) -> Result<FunctionStmt, ParseError> {
    auto name = expect(TokenKind::Identifier, "Expect " + kind + " name.");
    if (is_err(name)) {
        return unwrap_err(name);
    }

    auto lparen = expect(TokenKind::LParen, "Expect '(' after " + kind + " name.");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    std::vector<lexer::Token> params;
    if (!check(TokenKind::RParen)) {
        do {
            if (params.size() == limits::MAX_PARAMETERS) {
                report_error(make_error(ParseErrorKind::TooManyParameters,
                                        "Can't have more than " +
                                            std::to_string(limits::MAX_PARAMETERS) +
                                            " parameters.",
                                        peek()));
            }
            auto param = expect(TokenKind::Identifier, "Expect parameter name.");
            if (is_err(param)) {
                return unwrap_err(param);
            }
            params.push_back(std::move(unwrap(param)));
        } while (match(TokenKind::Comma));
    }

    auto rparen = expect(TokenKind::RParen, "Expect ')' after parameters.");
    if (is_err(rparen)) {
        return unwrap_err(rparen);
    }

    auto lbrace = expect(TokenKind::LBrace, "Expect '{' before " + kind + " body.");
    if (is_err(lbrace)) {
        return unwrap_err(lbrace);
    }

    auto body = parse_block();
    if (is_err(body)) {
        return unwrap_err(body);
    }

    auto span = SourceSpan::merge(unwrap(name).span, previous().span);
    return FunctionStmt{.name = std::move(unwrap(name)),
                        .params = std::move(params),
                        .body = std::move(unwrap(body)),
                        .span = span};
}

auto Parser::parse_var_decl() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto name = expect(TokenKind::Identifier, "Expect variable name.");
    if (is_err(name)) {
        return unwrap_err(name);
    }

    std::optional<ExprPtr> init;
    if (match(TokenKind::Equal)) {
        auto value = parse_expr();
        if (is_err(value)) {
            return unwrap_err(value);
        }
        init = std::move(unwrap(value));
    }

    auto semi = expect(TokenKind::Semicolon, "Expect ';' after variable declaration.");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }

    auto span = SourceSpan::merge(start_span, unwrap(semi).span);
    return make_box<Stmt>(Stmt{
        .kind = VarStmt{.name = std::move(unwrap(name)), .init = std::move(init), .span = span},
        .span = span});
}

// ============================================================================
// Statements
// ============================================================================

auto Parser::parse_statement() -> Result<StmtPtr, ParseError> {
    switch (peek().kind) {
    case TokenKind::KwFor:
        advance();
        return parse_for_stmt();
    case TokenKind::KwIf:
        advance();
        return parse_if_stmt();
    case TokenKind::KwPrint:
        advance();
        return parse_print_stmt();
    case TokenKind::KwReturn:
        advance();
        return parse_return_stmt();
    case TokenKind::KwWhile:
        advance();
        return parse_while_stmt();
    case TokenKind::LBrace: {
        auto start_span = advance().span;
        auto block = parse_block();
        if (is_err(block)) {
            return unwrap_err(block);
        }
        auto span = SourceSpan::merge(start_span, previous().span);
        return make_box<Stmt>(
            Stmt{.kind = BlockStmt{.stmts = std::move(unwrap(block)), .span = span}, .span = span});
    }
    default:
        return parse_expr_stmt();
    }
}

auto Parser::parse_print_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto value = parse_expr();
    if (is_err(value)) {
        return unwrap_err(value);
    }

    auto semi = expect(TokenKind::Semicolon, "Expect ';' after value.");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }

    auto span = SourceSpan::merge(start_span, unwrap(semi).span);
    return make_box<Stmt>(
        Stmt{.kind = PrintStmt{.expr = std::move(unwrap(value)), .span = span}, .span = span});
}

auto Parser::parse_expr_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = peek().span;

    auto expr = parse_expr();
    if (is_err(expr)) {
        return unwrap_err(expr);
    }

    auto semi = expect(TokenKind::Semicolon, "Expect ';' after expression.");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }

    auto span = SourceSpan::merge(start_span, unwrap(semi).span);
    return make_box<Stmt>(
        Stmt{.kind = ExprStmt{.expr = std::move(unwrap(expr)), .span = span}, .span = span});
}

// Expects the opening brace to be consumed already
auto Parser::parse_block() -> Result<std::vector<StmtPtr>, ParseError> {
    std::vector<StmtPtr> stmts;

    ++block_depth_;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        if (auto stmt = parse_declaration_or_recover()) {
            stmts.push_back(std::move(stmt));
        }
    }
    --block_depth_;

    auto rbrace = expect(TokenKind::RBrace, "Expect '}' after block.");
    if (is_err(rbrace)) {
        return unwrap_err(rbrace);
    }

    return std::move(stmts);
}

auto Parser::parse_if_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto lparen = expect(TokenKind::LParen, "Expect '(' after 'if'.");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    auto condition = parse_expr();
    if (is_err(condition)) {
        return unwrap_err(condition);
    }

    auto rparen = expect(TokenKind::RParen, "Expect ')' after if condition.");
    if (is_err(rparen)) {
        return unwrap_err(rparen);
    }

    auto then_branch = parse_statement();
    if (is_err(then_branch)) {
        return unwrap_err(then_branch);
    }

    // A dangling else binds to the nearest if
    std::optional<StmtPtr> else_branch;
    if (match(TokenKind::KwElse)) {
        auto branch = parse_statement();
        if (is_err(branch)) {
            return unwrap_err(branch);
        }
        else_branch = std::move(unwrap(branch));
    }

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Stmt>(Stmt{.kind = IfStmt{.condition = std::move(unwrap(condition)),
                                              .then_branch = std::move(unwrap(then_branch)),
                                              .else_branch = std::move(else_branch),
                                              .span = span},
                               .span = span});
}

auto Parser::parse_while_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto lparen = expect(TokenKind::LParen, "Expect '(' after 'while'.");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    auto condition = parse_expr();
    if (is_err(condition)) {
        return unwrap_err(condition);
    }

    auto rparen = expect(TokenKind::RParen, "Expect ')' after condition.");
    if (is_err(rparen)) {
        return unwrap_err(rparen);
    }

    auto body = parse_statement();
    if (is_err(body)) {
        return unwrap_err(body);
    }

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Stmt>(Stmt{.kind = WhileStmt{.condition = std::move(unwrap(condition)),
                                                 .body = std::move(unwrap(body)),
                                                 .span = span},
                               .span = span});
}

// for (init; cond; incr) body  =>  { init; while (cond) { body; incr; } }
auto Parser::parse_for_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = previous().span;

    auto lparen = expect(TokenKind::LParen, "Expect '(' after 'for'.");
    if (is_err(lparen)) {
        return unwrap_err(lparen);
    }

    std::optional<StmtPtr> initializer;
    if (match(TokenKind::Semicolon)) {
        // No initializer
    } else if (match(TokenKind::KwVar)) {
        auto init = parse_var_decl();
        if (is_err(init)) {
            return unwrap_err(init);
        }
        initializer = std::move(unwrap(init));
    } else {
        auto init = parse_expr_stmt();
        if (is_err(init)) {
            return unwrap_err(init);
        }
        initializer = std::move(unwrap(init));
    }

    std::optional<ExprPtr> condition;
    if (!check(TokenKind::Semicolon)) {
        auto cond = parse_expr();
        if (is_err(cond)) {
            return unwrap_err(cond);
        }
        condition = std::move(unwrap(cond));
    }
    auto cond_semi = expect(TokenKind::Semicolon, "Expect ';' after loop condition.");
    if (is_err(cond_semi)) {
        return unwrap_err(cond_semi);
    }

    std::optional<ExprPtr> increment;
    if (!check(TokenKind::RParen)) {
        auto incr = parse_expr();
        if (is_err(incr)) {
            return unwrap_err(incr);
        }
        increment = std::move(unwrap(incr));
    }
    auto rparen = expect(TokenKind::RParen, "Expect ')' after for clauses.");
    if (is_err(rparen)) {
        return unwrap_err(rparen);
    }

    auto body = parse_statement();
    if (is_err(body)) {
        return unwrap_err(body);
    }

    auto span = SourceSpan::merge(start_span, previous().span);
    StmtPtr loop_body = std::move(unwrap(body));

    if (increment) {
        auto incr_span = (*increment)->span;
        std::vector<StmtPtr> stmts;
        stmts.push_back(std::move(loop_body));
        stmts.push_back(make_box<Stmt>(
            Stmt{.kind = ExprStmt{.expr = std::move(*increment), .span = incr_span},
                 .span = incr_span}));
        loop_body = make_box<Stmt>(
            Stmt{.kind = BlockStmt{.stmts = std::move(stmts), .span = span}, .span = span});
    }

    ExprPtr loop_condition;
    if (condition) {
        loop_condition = std::move(*condition);
    } else {
        loop_condition =
            make_box<Expr>(Expr{.kind = LiteralExpr{.value = true, .span = span}, .span = span});
    }

    StmtPtr loop = make_box<Stmt>(Stmt{.kind = WhileStmt{.condition = std::move(loop_condition),
                                                         .body = std::move(loop_body),
                                                         .span = span},
                                       .span = span});

    if (initializer) {
        std::vector<StmtPtr> stmts;
        stmts.push_back(std::move(*initializer));
        stmts.push_back(std::move(loop));
        loop = make_box<Stmt>(
            Stmt{.kind = BlockStmt{.stmts = std::move(stmts), .span = span}, .span = span});
    }

    return std::move(loop);
}

auto Parser::parse_return_stmt() -> Result<StmtPtr, ParseError> {
    lexer::Token keyword = previous();

    std::optional<ExprPtr> value;
    if (!check(TokenKind::Semicolon)) {
        auto expr = parse_expr();
        if (is_err(expr)) {
            return unwrap_err(expr);
        }
        value = std::move(unwrap(expr));
    }

    auto semi = expect(TokenKind::Semicolon, "Expect ';' after return value.");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }

    auto span = SourceSpan::merge(keyword.span, unwrap(semi).span);
    return make_box<Stmt>(Stmt{
        .kind = ReturnStmt{.keyword = std::move(keyword), .value = std::move(value), .span = span},
        .span = span});
}

} // namespace lox::parser
