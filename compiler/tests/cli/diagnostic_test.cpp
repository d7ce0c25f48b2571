//! # Diagnostic Emitter Tests
//!
//! Text and JSON rendering of lexical and syntax errors, ordering of
//! merged diagnostics, and error-code consistency with the front-end.

#include "lox/cli/diagnostic.hpp"
#include "lox/lexer/lexer.hpp"
#include "lox/parser/parser.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace lox;
using namespace lox::cli;

class DiagnosticTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    DiagnosticEmitter emitter_{out_};

    void SetUp() override {
        emitter_.set_color_enabled(false);
    }

    auto lines() const -> std::vector<std::string> {
        std::vector<std::string> result;
        std::istringstream in(out_.str());
        std::string line;
        while (std::getline(in, line)) {
            result.push_back(line);
        }
        return result;
    }
};

TEST_F(DiagnosticTest, LexicalErrorText) {
    auto scanned = lexer::scan("var a;\n@");
    emitter_.emit_all(scanned.errors);
    EXPECT_EQ(out_.str(), "[line 2] Error: Unexpected character: @\n");
    EXPECT_EQ(emitter_.error_count(), 1u);
}

TEST_F(DiagnosticTest, UnterminatedStringText) {
    auto scanned = lexer::scan("\"abc");
    emitter_.emit_all(scanned.errors);
    EXPECT_EQ(out_.str(), "[line 1] Error: Unterminated string.\n");
}

TEST_F(DiagnosticTest, SyntaxErrorAtToken) {
    auto result = parser::parse(lexer::scan("var = 1;").tokens);
    emitter_.emit_all({}, result.errors);
    EXPECT_EQ(out_.str(), "[line 1] Error at '=': Expect variable name.\n");
}

TEST_F(DiagnosticTest, SyntaxErrorAtEnd) {
    auto result = parser::parse(lexer::scan("print 1").tokens);
    emitter_.emit_all({}, result.errors);
    EXPECT_EQ(out_.str(), "[line 1] Error at end: Expect ';' after value.\n");
}

TEST_F(DiagnosticTest, MergedInSourceOrder) {
    auto scanned = lexer::scan("print ;\n#\nvar = 2;");
    auto result = parser::parse(scanned.tokens);
    emitter_.emit_all(scanned.errors, result.errors);

    auto out = lines();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], "[line 1] Error at ';': Expect expression.");
    EXPECT_EQ(out[1], "[line 2] Error: Unexpected character: #");
    EXPECT_EQ(out[2], "[line 3] Error at '=': Expect variable name.");
    EXPECT_EQ(emitter_.error_count(), 3u);
}

TEST_F(DiagnosticTest, JsonFormat) {
    emitter_.set_format(DiagnosticFormat::JSON);
    auto result = parser::parse(lexer::scan("print )").tokens);
    emitter_.emit_all({}, result.errors);

    EXPECT_EQ(out_.str(), "{\"severity\":\"error\",\"code\":\"P002\",\"message\":\"Expect "
                          "expression.\",\"line\":1,\"column\":7,\"lexeme\":\")\"}\n");
}

TEST_F(DiagnosticTest, JsonLexicalErrorHasNullLexeme) {
    emitter_.set_format(DiagnosticFormat::JSON);
    emitter_.emit_all(lexer::scan("  $").errors);

    EXPECT_EQ(out_.str(), "{\"severity\":\"error\",\"code\":\"L001\",\"message\":\"Unexpected "
                          "character: $\",\"line\":1,\"column\":3,\"lexeme\":null}\n");
}

TEST_F(DiagnosticTest, JsonEscaping) {
    EXPECT_EQ(DiagnosticEmitter::escape_json_string("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(DiagnosticEmitter::escape_json_string(std::string("\x01", 1)), "\\u0001");
}

TEST_F(DiagnosticTest, WarningsDoNotCount) {
    emitter_.emit(Diagnostic{.severity = DiagnosticSeverity::Warning,
                             .code = "P000",
                             .message = "just saying",
                             .span = {},
                             .lexeme = std::nullopt,
                             .at_end = false});
    EXPECT_EQ(emitter_.error_count(), 0u);
    EXPECT_EQ(out_.str(), "[line 1] Warning: just saying\n");
}

TEST_F(DiagnosticTest, ResetCounts) {
    emitter_.emit_all(lexer::scan("@").errors);
    EXPECT_EQ(emitter_.error_count(), 1u);
    emitter_.reset_counts();
    EXPECT_EQ(emitter_.error_count(), 0u);
}

TEST_F(DiagnosticTest, ColoredOutputWrapsSeverity) {
    emitter_.set_color_enabled(true);
    emitter_.emit_all(lexer::scan("@").errors);
    EXPECT_EQ(out_.str(), std::string("[line 1] ") + Colors::Bold + Colors::Red + "Error" +
                              Colors::Reset + ": Unexpected character: @\n");
}

TEST(ErrorCodesTest, MatchFrontEndCodes) {
    EXPECT_EQ(lexer::scan("@").errors[0].code, ErrorCodes::LEX_UNEXPECTED_CHAR);
    EXPECT_EQ(lexer::scan("\"x").errors[0].code, ErrorCodes::LEX_UNTERMINATED_STRING);

    using parser::ParseErrorKind;
    EXPECT_STREQ(parser::parse_error_code(ParseErrorKind::ExpectedToken),
                 ErrorCodes::PARSE_EXPECTED_TOKEN);
    EXPECT_STREQ(parser::parse_error_code(ParseErrorKind::ExpectedExpression),
                 ErrorCodes::PARSE_EXPECTED_EXPR);
    EXPECT_STREQ(parser::parse_error_code(ParseErrorKind::TooManyArguments),
                 ErrorCodes::PARSE_TOO_MANY_ARGS);
    EXPECT_STREQ(parser::parse_error_code(ParseErrorKind::TooManyParameters),
                 ErrorCodes::PARSE_TOO_MANY_PARAMS);
    EXPECT_STREQ(parser::parse_error_code(ParseErrorKind::InvalidAssignmentTarget),
                 ErrorCodes::PARSE_INVALID_ASSIGN);
}
