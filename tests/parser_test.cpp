#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace bfq;
using namespace bfq::lexer;
using namespace bfq::parser;

class ParserTest : public ::testing::Test {
protected:
    std::unique_ptr<Source> source_;

    auto tokens(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>("test.b", code);
        Lexer lexer(*source_);
        return lexer.tokenize();
    }

    auto parse(const std::string& code) -> Program {
        Parser parser(tokens(code));
        auto result = parser.parse_program();
        EXPECT_TRUE(is_ok(result)) << "Parse failed for: " << code;
        if (is_err(result)) {
            return Program{};
        }
        return std::move(unwrap(result));
    }

    auto parse_error(const std::string& code) -> ParseError {
        Parser parser(tokens(code));
        auto result = parser.parse_program();
        EXPECT_TRUE(is_err(result)) << "Expected parse error for: " << code;
        if (is_ok(result)) {
            return ParseError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Statements
// ============================================================================

TEST_F(ParserTest, EmptyProgram) {
    auto program = parse("");
    EXPECT_TRUE(program.empty());
}

TEST_F(ParserTest, CommentaryOnlyProgram) {
    auto program = parse("this program does nothing");
    EXPECT_TRUE(program.empty());
}

TEST_F(ParserTest, StraightLine) {
    auto program = parse("+++>>-<,.");
    ASSERT_EQ(program.size(), 6u);

    ASSERT_TRUE(program.stmts[0].is<AddStmt>());
    EXPECT_EQ(program.stmts[0].as<AddStmt>().count, 3u);
    ASSERT_TRUE(program.stmts[1].is<MoveRightStmt>());
    EXPECT_EQ(program.stmts[1].as<MoveRightStmt>().count, 2u);
    ASSERT_TRUE(program.stmts[2].is<SubtractStmt>());
    EXPECT_EQ(program.stmts[2].as<SubtractStmt>().count, 1u);
    ASSERT_TRUE(program.stmts[3].is<MoveLeftStmt>());
    EXPECT_TRUE(program.stmts[4].is<ReadStmt>());
    EXPECT_TRUE(program.stmts[5].is<WriteStmt>());
}

TEST_F(ParserTest, ClearLoop) {
    auto program = parse("[-]");
    ASSERT_EQ(program.size(), 1u);
    ASSERT_TRUE(program.stmts[0].is<LoopStmt>());

    const auto& body = *program.stmts[0].as<LoopStmt>().body;
    ASSERT_EQ(body.size(), 1u);
    EXPECT_TRUE(body.stmts[0].is<SubtractStmt>());
}

TEST_F(ParserTest, EmptyLoop) {
    auto program = parse("[]");
    ASSERT_EQ(program.size(), 1u);
    EXPECT_TRUE(program.stmts[0].as<LoopStmt>().body->empty());
}

TEST_F(ParserTest, NestedLoops) {
    auto program = parse("+[>[>[-]<]<-]");
    EXPECT_EQ(loop_depth(program), 3u);
    EXPECT_EQ(count_loops(program), 3u);
    EXPECT_EQ(count_stmts(program), 10u);
}

TEST_F(ParserTest, SiblingLoops) {
    auto program = parse("[-][+][.]");
    ASSERT_EQ(program.size(), 3u);
    EXPECT_EQ(loop_depth(program), 1u);
    EXPECT_EQ(count_loops(program), 3u);
}

TEST_F(ParserTest, LoopSpanCoversBrackets) {
    auto program = parse("+ [ - ]");
    ASSERT_EQ(program.size(), 2u);
    const auto& span = program.stmts[1].span;
    EXPECT_EQ(span.start.column, 3u);
    EXPECT_EQ(span.end.column, 7u);
}

TEST_F(ParserTest, ParseStmtLeavesCloseInPlace) {
    Parser parser(tokens("]"));
    auto result = parser.parse_stmt();
    ASSERT_TRUE(is_err(result));
    EXPECT_FALSE(unwrap_err(result).is_fatal());
    EXPECT_EQ(unwrap_err(result).error.kind, ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(parser.position(), 0u);
}

TEST_F(ParserTest, ParseBlockRecordsStopReason) {
    Parser parser(tokens("+-]"));
    auto result = parser.parse_block();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).size(), 2u);
    EXPECT_EQ(parser.position(), 2u);
    ASSERT_TRUE(parser.stop_reason().has_value());
    EXPECT_EQ(parser.stop_reason()->kind, ParseErrorKind::UnexpectedToken);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ParserTest, StrayCloseIsUnexpectedToken) {
    auto error = parse_error("+++]");
    EXPECT_EQ(error.kind, ParseErrorKind::UnexpectedToken);
    ASSERT_TRUE(error.token.has_value());
    EXPECT_EQ(error.token->kind, TokenKind::LoopClose);
    EXPECT_EQ(error.span.start.column, 4u);
    EXPECT_EQ(error.message, "unexpected token `]` (LoopClose)");
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "this `]` has no matching `[`");
}

TEST_F(ParserTest, CloseAfterBalancedLoop) {
    auto error = parse_error("[-]]");
    EXPECT_EQ(error.kind, ParseErrorKind::UnexpectedToken);
    EXPECT_EQ(error.span.start.column, 4u);
}

TEST_F(ParserTest, UnclosedLoopIsEndOfInput) {
    auto error = parse_error("+[");
    EXPECT_EQ(error.kind, ParseErrorKind::EndOfInput);
    EXPECT_FALSE(error.token.has_value());
    EXPECT_EQ(error.message, "unexpected end of input");
    EXPECT_EQ(error.span.start.column, 2u);
    ASSERT_EQ(error.notes.size(), 1u);
    EXPECT_EQ(error.notes[0], "this `[` is never closed");
}

TEST_F(ParserTest, UnclosedOuterLoopPointsAtOuterBracket) {
    auto error = parse_error("[[]");
    EXPECT_EQ(error.kind, ParseErrorKind::EndOfInput);
    EXPECT_EQ(error.span.start.column, 1u);
}

TEST_F(ParserTest, UnclosedInnerLoopPointsAtInnerBracket) {
    auto error = parse_error("[-[+");
    EXPECT_EQ(error.kind, ParseErrorKind::EndOfInput);
    EXPECT_EQ(error.span.start.column, 3u);
}

TEST_F(ParserTest, LoneOpen) {
    auto error = parse_error("[");
    EXPECT_EQ(error.kind, ParseErrorKind::EndOfInput);
    EXPECT_EQ(error.span.start.line, 1u);
    EXPECT_EQ(error.span.start.column, 1u);
}

TEST_F(ParserTest, ErrorKindNames) {
    EXPECT_EQ(parse_error_kind_to_string(ParseErrorKind::UnexpectedToken), "UnexpectedToken");
    EXPECT_EQ(parse_error_kind_to_string(ParseErrorKind::EndOfInput), "EndOfInput");
    EXPECT_EQ(parse_error_kind_to_string(ParseErrorKind::NestingTooDeep), "NestingTooDeep");
}

// ============================================================================
// Nesting limit
// ============================================================================

TEST_F(ParserTest, NestingAtLimit) {
    auto program = parse(std::string(MAX_LOOP_DEPTH, '[') + std::string(MAX_LOOP_DEPTH, ']'));
    EXPECT_EQ(loop_depth(program), MAX_LOOP_DEPTH);
    EXPECT_EQ(count_loops(program), MAX_LOOP_DEPTH);
}

TEST_F(ParserTest, ThousandsOfLevelsReportNestingTooDeep) {
    for (size_t depth : {MAX_LOOP_DEPTH + 1, size_t{5000}, size_t{50000}}) {
        auto error = parse_error(std::string(depth, '[') + std::string(depth, ']'));
        EXPECT_EQ(error.kind, ParseErrorKind::NestingTooDeep) << depth;
        EXPECT_EQ(error.span.start.column, MAX_LOOP_DEPTH + 1) << depth;
        ASSERT_EQ(error.notes.size(), 1u);
        EXPECT_EQ(error.notes[0], "at most 1000 loops may be open at once");
    }
}

TEST_F(ParserTest, DeepUnclosedLoopsReportNestingTooDeep) {
    auto error = parse_error(std::string(5000, '['));
    EXPECT_EQ(error.kind, ParseErrorKind::NestingTooDeep);
}

TEST_F(ParserTest, NestingTooDeepIsFatal) {
    Parser parser(tokens("+" + std::string(MAX_LOOP_DEPTH + 1, '[')));
    auto result = parser.parse_block();
    ASSERT_TRUE(is_err(result));
    EXPECT_TRUE(unwrap_err(result).is_fatal());
    EXPECT_EQ(unwrap_err(result).error.kind, ParseErrorKind::NestingTooDeep);
}

TEST(ParseFailureTest, Severity) {
    auto recoverable = ParseFailure::recoverable(ParseError{});
    auto fatal = ParseFailure::fatal(ParseError{});
    EXPECT_FALSE(recoverable.is_fatal());
    EXPECT_TRUE(fatal.is_fatal());
}

// ============================================================================
// AST
// ============================================================================

TEST_F(ParserTest, PrintAst) {
    auto program = parse("+++[-]");
    EXPECT_EQ(print_ast(program), "Block\n"
                                  "  Add(3)\n"
                                  "  Loop\n"
                                  "    Block\n"
                                  "      Subtract(1)\n");
}

TEST(AstTest, Factories) {
    Block body;
    body.stmts.push_back(make_write());
    body.stmts.push_back(make_move_left(2));

    Block program;
    program.stmts.push_back(make_read());
    program.stmts.push_back(make_loop(std::move(body)));
    program.stmts.push_back(make_move_right(5));

    EXPECT_EQ(print_ast(program), "Block\n"
                                  "  Read\n"
                                  "  Loop\n"
                                  "    Block\n"
                                  "      Write\n"
                                  "      MoveLeft(2)\n"
                                  "  MoveRight(5)\n");
    EXPECT_EQ(loop_depth(program), 1u);
    EXPECT_EQ(count_stmts(program), 5u);
}

TEST(AstTest, EmptyBlockQueries) {
    Block block;
    EXPECT_EQ(loop_depth(block), 0u);
    EXPECT_EQ(count_stmts(block), 0u);
    EXPECT_EQ(count_loops(block), 0u);
    EXPECT_EQ(print_ast(block), "Block\n");
}
