//! # Parser
//!
//! Recursive-descent parser for the grammar
//!
//! ```text
//! Block      := Statement*
//! Statement  := MoveLeft | MoveRight | Add | Subtract | Read | Write | Loop
//! Loop       := LoopOpen Block LoopClose
//! ```
//!
//! ## Error Model
//!
//! Every alternative returns `Result<T, ParseFailure>`. A `ParseFailure` is
//! either `Recoverable`, meaning "this alternative does not apply here" and
//! nothing was consumed, or `Fatal`, meaning the input is definitely wrong
//! and no caller may backtrack. Blocks are greedy: they collect statements
//! until a `Recoverable` failure, keep that failure as their stop reason,
//! and leave the offending token in place. `Fatal` is passed straight up.
//!
//! The only `Fatal` failure is a loop nested past `MAX_LOOP_DEPTH`.
//!
//! The parser is fail-fast. `parse_program()` either returns the whole tree
//! or exactly one error; there is no recovery and no partial AST.

#ifndef BFQ_PARSER_PARSER_HPP
#define BFQ_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/token.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bfq::parser {

enum class ParseErrorKind {
    UnexpectedToken, ///< A token that cannot start or continue a statement
    EndOfInput,      ///< Input ended inside a loop
    NestingTooDeep,  ///< A `[` past `MAX_LOOP_DEPTH` open loops
};

[[nodiscard]] auto parse_error_kind_to_string(ParseErrorKind kind) -> std::string_view;

/// A parse error.
///
/// For `UnexpectedToken`, `token` is the offending token and `span` is its
/// location. For `EndOfInput` inside a loop, `span` is the `[` that was never
/// closed. For `NestingTooDeep`, `span` is the first `[` over the limit.
struct ParseError {
    ParseErrorKind kind;
    std::optional<lexer::Token> token;
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;
};

enum class Severity {
    Recoverable, ///< Alternative did not match; callers may try something else
    Fatal,       ///< Committed to a construct and it is malformed
};

struct ParseFailure {
    Severity severity;
    ParseError error;

    [[nodiscard]] static auto recoverable(ParseError error) -> ParseFailure {
        return ParseFailure{.severity = Severity::Recoverable, .error = std::move(error)};
    }

    [[nodiscard]] static auto fatal(ParseError error) -> ParseFailure {
        return ParseFailure{.severity = Severity::Fatal, .error = std::move(error)};
    }

    [[nodiscard]] auto is_fatal() const -> bool {
        return severity == Severity::Fatal;
    }
};

class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses all tokens into the top-level block.
    ///
    /// If the top-level block stops before the last token, the block's stop
    /// reason is the error: `EndOfInput` for an unmatched `[`,
    /// `UnexpectedToken` for a stray `]`.
    [[nodiscard]] auto parse_program() -> Result<Program, ParseError>;

    /// Parses statements until the first recoverable failure (for testing).
    [[nodiscard]] auto parse_block() -> Result<Block, ParseFailure>;

    /// Parses one statement (for testing).
    [[nodiscard]] auto parse_stmt() -> Result<Stmt, ParseFailure>;

    /// Why the most recently finished block stopped.
    [[nodiscard]] auto stop_reason() const -> const std::optional<ParseError>& {
        return stop_reason_;
    }

    /// Tokens consumed so far.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

    [[nodiscard]] auto is_at_end() const -> bool;

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0; // loops currently open
    std::optional<ParseError> stop_reason_;

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;

    auto parse_loop() -> Result<Stmt, ParseFailure>;

    [[nodiscard]] auto end_span() const -> SourceSpan;
    [[nodiscard]] auto unexpected_token(const lexer::Token& token) const -> ParseError;
    [[nodiscard]] auto end_of_input(SourceSpan span, std::string note) const -> ParseError;
    [[nodiscard]] auto nesting_too_deep(const lexer::Token& open) const -> ParseError;
};

} // namespace bfq::parser

#endif // BFQ_PARSER_PARSER_HPP
