//! # Parser - Expressions
//!
//! One method per precedence level, lowest first:
//!
//! ```text
//! expression -> assignment
//! assignment -> ( call "." )? IDENT "=" assignment | logic_or
//! logic_or   -> logic_and ( "or" logic_and )*
//! logic_and  -> equality ( "and" equality )*
//! equality   -> comparison ( ( "!=" | "==" ) comparison )*
//! comparison -> term ( ( ">" | ">=" | "<" | "<=" ) term )*
//! term       -> factor ( ( "-" | "+" ) factor )*
//! factor     -> unary ( ( "/" | "*" ) unary )*
//! unary      -> ( "!" | "-" ) unary | call
//! call       -> primary ( "(" arguments? ")" | "." IDENT )*
//! primary    -> "true" | "false" | "nil" | "this" | NUMBER | STRING
//!             | IDENT | "(" expression ")" | "super" "." IDENT
//! ```
//!
//! Binary levels are left-associative; assignment is right-associative.

#include "lox/parser/parser.hpp"
#include "lox/log/log.hpp"

namespace lox::parser {

using lexer::TokenKind;

namespace {

auto make_literal(LiteralValue value, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = LiteralExpr{.value = std::move(value), .span = span},
                               .span = span});
}

} // namespace

auto Parser::parse_expr() -> Result<ExprPtr, ParseError> {
    return parse_assignment();
}

auto Parser::parse_assignment() -> Result<ExprPtr, ParseError> {
    auto target = parse_or();
    if (is_err(target) || !match(TokenKind::Equal)) {
        return target;
    }

    lexer::Token equals = previous();
    auto value = parse_assignment();
    if (is_err(value)) {
        return value;
    }

    auto& expr = unwrap(target);
    auto span = SourceSpan::merge(expr->span, unwrap(value)->span);

    if (expr->is<VariableExpr>()) {
        lexer::Token name = expr->as<VariableExpr>().name;
        return make_box<Expr>(Expr{
            .kind = AssignExpr{.name = std::move(name), .value = std::move(unwrap(value)), .span = span},
            .span = span});
    }

    if (expr->is<GetExpr>()) {
        auto& get = expr->as<GetExpr>();
        return make_box<Expr>(Expr{.kind = SetExpr{.object = std::move(get.object),
                                                   .name = get.name,
                                                   .value = std::move(unwrap(value)),
                                                   .span = span},
                                   .span = span});
    }

    // Recorded without unwinding: the parser is not confused, only the target is wrong
    report_error(
        make_error(ParseErrorKind::InvalidAssignmentTarget, "Invalid assignment target.", equals));
    return target;
}

auto Parser::parse_or() -> Result<ExprPtr, ParseError> {
    auto left = parse_and();
    if (is_err(left)) {
        return left;
    }
    ExprPtr expr = std::move(unwrap(left));

    while (match(TokenKind::KwOr)) {
        lexer::Token op = previous();
        auto right = parse_and();
        if (is_err(right)) {
            return unwrap_err(right);
        }
        auto span = SourceSpan::merge(expr->span, unwrap(right)->span);
        expr = make_box<Expr>(Expr{.kind = LogicalExpr{.op = LogicalOp::Or,
                                                       .op_token = std::move(op),
                                                       .left = std::move(expr),
                                                       .right = std::move(unwrap(right)),
                                                       .span = span},
                                   .span = span});
    }

    return std::move(expr);
}

auto Parser::parse_and() -> Result<ExprPtr, ParseError> {
    auto left = parse_equality();
    if (is_err(left)) {
        return left;
    }
    ExprPtr expr = std::move(unwrap(left));

    while (match(TokenKind::KwAnd)) {
        lexer::Token op = previous();
        auto right = parse_equality();
        if (is_err(right)) {
            return unwrap_err(right);
        }
        auto span = SourceSpan::merge(expr->span, unwrap(right)->span);
        expr = make_box<Expr>(Expr{.kind = LogicalExpr{.op = LogicalOp::And,
                                                       .op_token = std::move(op),
                                                       .left = std::move(expr),
                                                       .right = std::move(unwrap(right)),
                                                       .span = span},
                                   .span = span});
    }

    return std::move(expr);
}

auto Parser::parse_equality() -> Result<ExprPtr, ParseError> {
    return parse_binary_level({TokenKind::BangEqual, TokenKind::EqualEqual},
                              &Parser::parse_comparison);
}

auto Parser::parse_comparison() -> Result<ExprPtr, ParseError> {
    return parse_binary_level(
        {TokenKind::Greater, TokenKind::GreaterEqual, TokenKind::Less, TokenKind::LessEqual},
        &Parser::parse_term);
}

auto Parser::parse_term() -> Result<ExprPtr, ParseError> {
    return parse_binary_level({TokenKind::Minus, TokenKind::Plus}, &Parser::parse_factor);
}

auto Parser::parse_factor() -> Result<ExprPtr, ParseError> {
    return parse_binary_level({TokenKind::Slash, TokenKind::Star}, &Parser::parse_unary);
}

auto Parser::parse_binary_level(std::initializer_list<lexer::TokenKind> operators,
                                Production operand) -> Result<ExprPtr, ParseError> {
    auto left = (this->*operand)();
    if (is_err(left)) {
        return left;
    }
    ExprPtr expr = std::move(unwrap(left));

    while (match_any(operators)) {
        lexer::Token op = previous();
        auto right = (this->*operand)();
        if (is_err(right)) {
            return unwrap_err(right);
        }
        auto span = SourceSpan::merge(expr->span, unwrap(right)->span);
        auto bin_op = token_to_binary_op(op.kind);
        expr = make_box<Expr>(Expr{.kind = BinaryExpr{.op = bin_op,
                                                      .op_token = std::move(op),
                                                      .left = std::move(expr),
                                                      .right = std::move(unwrap(right)),
                                                      .span = span},
                                   .span = span});
    }

    return std::move(expr);
}

auto Parser::parse_unary() -> Result<ExprPtr, ParseError> {
    if (match_any({TokenKind::Bang, TokenKind::Minus})) {
        lexer::Token op = previous();
        auto operand = parse_unary();
        if (is_err(operand)) {
            return operand;
        }
        auto span = SourceSpan::merge(op.span, unwrap(operand)->span);
        auto unary_op = token_to_unary_op(op.kind);
        return make_box<Expr>(Expr{.kind = UnaryExpr{.op = unary_op,
                                                     .op_token = std::move(op),
                                                     .operand = std::move(unwrap(operand)),
                                                     .span = span},
                                   .span = span});
    }

    return parse_call();
}

auto Parser::parse_call() -> Result<ExprPtr, ParseError> {
    auto primary = parse_primary();
    if (is_err(primary)) {
        return primary;
    }
    ExprPtr expr = std::move(unwrap(primary));

    while (true) {
        if (match(TokenKind::LParen)) {
            auto call = finish_call(std::move(expr));
            if (is_err(call)) {
                return call;
            }
            expr = std::move(unwrap(call));
        } else if (match(TokenKind::Dot)) {
            auto name = expect(TokenKind::Identifier, "Expect property name after '.'.");
            if (is_err(name)) {
                return unwrap_err(name);
            }
            auto span = SourceSpan::merge(expr->span, unwrap(name).span);
            expr = make_box<Expr>(Expr{.kind = GetExpr{.object = std::move(expr),
                                                       .name = std::move(unwrap(name)),
                                                       .span = span},
                                       .span = span});
        } else {
            break;
        }
    }

    return std::move(expr);
}

auto Parser::finish_call(ExprPtr callee) -> Result<ExprPtr, ParseError> {
    std::vector<ExprPtr> args;

    if (!check(TokenKind::RParen)) {
        do {
            // Reported once, parsing carries on with the extra arguments
            if (args.size() == limits::MAX_ARGUMENTS) {
                report_error(make_error(ParseErrorKind::TooManyArguments,
                                        "Can't have more than " +
                                            std::to_string(limits::MAX_ARGUMENTS) +
                                            " arguments.",
                                        peek()));
            }
            auto arg = parse_expr();
            if (is_err(arg)) {
                return arg;
            }
            args.push_back(std::move(unwrap(arg)));
        } while (match(TokenKind::Comma));
    }

    auto paren = expect(TokenKind::RParen, "Expect ')' after arguments.");
    if (is_err(paren)) {
        return unwrap_err(paren);
    }

    auto span = SourceSpan::merge(callee->span, unwrap(paren).span);
    return make_box<Expr>(Expr{.kind = CallExpr{.callee = std::move(callee),
                                                .paren = std::move(unwrap(paren)),
                                                .args = std::move(args),
                                                .span = span},
                               .span = span});
}

auto Parser::parse_primary() -> Result<ExprPtr, ParseError> {
    const lexer::Token& token = peek();

    switch (token.kind) {
    case TokenKind::KwFalse:
        advance();
        return make_literal(false, token.span);
    case TokenKind::KwTrue:
        advance();
        return make_literal(true, token.span);
    case TokenKind::KwNil:
        advance();
        return make_literal(std::monostate{}, token.span);
    case TokenKind::Number:
        advance();
        return make_literal(token.number_value(), token.span);
    case TokenKind::String:
        advance();
        return make_literal(std::string(token.string_value()), token.span);

    case TokenKind::KwThis:
        advance();
        return make_box<Expr>(
            Expr{.kind = ThisExpr{.keyword = token, .span = token.span}, .span = token.span});

    case TokenKind::KwSuper: {
        lexer::Token keyword = advance();
        auto dot = expect(TokenKind::Dot, "Expect '.' after 'super'.");
        if (is_err(dot)) {
            return unwrap_err(dot);
        }
        auto method = expect(TokenKind::Identifier, "Expect superclass method name.");
        if (is_err(method)) {
            return unwrap_err(method);
        }
        auto span = SourceSpan::merge(keyword.span, unwrap(method).span);
        return make_box<Expr>(Expr{.kind = SuperExpr{.keyword = std::move(keyword),
                                                     .method = std::move(unwrap(method)),
                                                     .span = span},
                                   .span = span});
    }

    case TokenKind::Identifier:
        advance();
        return make_box<Expr>(
            Expr{.kind = VariableExpr{.name = token, .span = token.span}, .span = token.span});

    case TokenKind::LParen: {
        auto start_span = advance().span;
        auto inner = parse_expr();
        if (is_err(inner)) {
            return inner;
        }
        auto rparen = expect(TokenKind::RParen, "Expect ')' after expression.");
        if (is_err(rparen)) {
            return unwrap_err(rparen);
        }
        auto span = SourceSpan::merge(start_span, unwrap(rparen).span);
        return make_box<Expr>(Expr{
            .kind = GroupingExpr{.expr = std::move(unwrap(inner)), .span = span}, .span = span});
    }

    default:
        LOX_LOG_TRACE("parser", "No expression starts with '" << token.lexeme << "'");
        return make_error(ParseErrorKind::ExpectedExpression, "Expect expression.", token);
    }
}

} // namespace lox::parser
