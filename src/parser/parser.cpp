//! # Parser Implementation
//!
//! Statement and block parsing. See `parser/parser.hpp` for the error model.

#include "parser/parser.hpp"

#include "log/log.hpp"

namespace bfq::parser {

auto parse_error_kind_to_string(ParseErrorKind kind) -> std::string_view {
    switch (kind) {
    case ParseErrorKind::UnexpectedToken:
        return "UnexpectedToken";
    case ParseErrorKind::EndOfInput:
        return "EndOfInput";
    case ParseErrorKind::NestingTooDeep:
        return "NestingTooDeep";
    }
    return "unknown";
}

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    return tokens_[pos_];
}

auto Parser::advance() -> const lexer::Token& {
    return tokens_[pos_++];
}

auto Parser::is_at_end() const -> bool {
    return pos_ >= tokens_.size();
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return !is_at_end() && peek().kind == kind;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        ++pos_;
        return true;
    }
    return false;
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::end_span() const -> SourceSpan {
    if (tokens_.empty()) {
        return {};
    }
    auto end = tokens_.back().span.end;
    return {end, end};
}

auto Parser::unexpected_token(const lexer::Token& token) const -> ParseError {
    std::string message = "unexpected token `";
    message += lexer::token_kind_symbol(token.kind);
    message += "` (" + lexer::to_string(token) + ")";

    std::vector<std::string> notes;
    if (token.is(lexer::TokenKind::LoopClose)) {
        notes.emplace_back("this `]` has no matching `[`");
    }

    return ParseError{.kind = ParseErrorKind::UnexpectedToken,
                      .token = token,
                      .message = std::move(message),
                      .span = token.span,
                      .notes = std::move(notes)};
}

auto Parser::end_of_input(SourceSpan span, std::string note) const -> ParseError {
    std::vector<std::string> notes;
    if (!note.empty()) {
        notes.push_back(std::move(note));
    }
    return ParseError{.kind = ParseErrorKind::EndOfInput,
                      .token = std::nullopt,
                      .message = "unexpected end of input",
                      .span = span,
                      .notes = std::move(notes)};
}

auto Parser::nesting_too_deep(const lexer::Token& open) const -> ParseError {
    return ParseError{.kind = ParseErrorKind::NestingTooDeep,
                      .token = open,
                      .message = "loops nested too deeply",
                      .span = open.span,
                      .notes = {"at most " + std::to_string(MAX_LOOP_DEPTH) +
                                " loops may be open at once"}};
}

// ============================================================================
// Statements
// ============================================================================

auto Parser::parse_stmt() -> Result<Stmt, ParseFailure> {
    if (is_at_end()) {
        return ParseFailure::recoverable(end_of_input(end_span(), ""));
    }

    const auto& token = peek();
    switch (token.kind) {
    case lexer::TokenKind::MoveLeft:
        advance();
        return make_move_left(token.count, token.span);
    case lexer::TokenKind::MoveRight:
        advance();
        return make_move_right(token.count, token.span);
    case lexer::TokenKind::Increment:
        advance();
        return make_add(token.count, token.span);
    case lexer::TokenKind::Decrement:
        advance();
        return make_subtract(token.count, token.span);
    case lexer::TokenKind::Read:
        advance();
        return make_read(token.span);
    case lexer::TokenKind::Write:
        advance();
        return make_write(token.span);
    case lexer::TokenKind::LoopOpen:
        return parse_loop();
    case lexer::TokenKind::LoopClose:
        break;
    }

    return ParseFailure::recoverable(unexpected_token(token));
}

auto Parser::parse_loop() -> Result<Stmt, ParseFailure> {
    if (depth_ >= MAX_LOOP_DEPTH) {
        return ParseFailure::fatal(nesting_too_deep(peek()));
    }

    size_t start = pos_;
    auto open_span = advance().span;

    ++depth_;
    auto body_result = parse_block();
    --depth_;
    if (is_err(body_result)) {
        pos_ = start;
        return std::move(unwrap_err(body_result));
    }

    if (match(lexer::TokenKind::LoopClose)) {
        auto span = SourceSpan::merge(open_span, tokens_[pos_ - 1].span);
        BFQ_LOG_TRACE("parser", "Loop at " << open_span.start.line << ":"
                                           << open_span.start.column << " with "
                                           << unwrap(body_result).size() << " statements");
        return make_loop(std::move(unwrap(body_result)), span);
    }

    // Leave the `[` in place so the enclosing block stops on it.
    bool nested_failure = !is_at_end();
    pos_ = start;

    if (nested_failure) {
        // The body stopped on an inner `[` that is itself unclosed; its stop
        // reason is still the latest one.
        return ParseFailure::recoverable(std::move(*stop_reason_));
    }
    return ParseFailure::recoverable(end_of_input(open_span, "this `[` is never closed"));
}

// ============================================================================
// Blocks
// ============================================================================

auto Parser::parse_block() -> Result<Block, ParseFailure> {
    Block block;
    auto start_span = is_at_end() ? end_span() : peek().span;

    while (true) {
        auto stmt_result = parse_stmt();
        if (is_err(stmt_result)) {
            auto& failure = unwrap_err(stmt_result);
            if (failure.is_fatal()) {
                return std::move(failure);
            }
            stop_reason_ = std::move(failure.error);
            break;
        }
        block.stmts.push_back(std::move(unwrap(stmt_result)));
    }

    block.span = block.stmts.empty() ? start_span
                                     : SourceSpan::merge(block.stmts.front().span,
                                                         block.stmts.back().span);
    return std::move(block);
}

auto Parser::parse_program() -> Result<Program, ParseError> {
    auto block_result = parse_block();
    if (is_err(block_result)) {
        return std::move(unwrap_err(block_result).error);
    }

    if (!is_at_end()) {
        // The greedy top-level block stopped early; its stop reason says why.
        auto error = std::move(*stop_reason_);
        BFQ_LOG_DEBUG("parser", "Stopped at token " << pos_ << " of " << tokens_.size() << ": "
                                                    << parse_error_kind_to_string(error.kind));
        return error;
    }

    auto& program = unwrap(block_result);
    BFQ_LOG_DEBUG("parser", "Parsed " << count_stmts(program) << " statements, "
                                      << count_loops(program) << " loops, max depth "
                                      << loop_depth(program));
    return std::move(program);
}

} // namespace bfq::parser
