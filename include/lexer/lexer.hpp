//! # Lexer
//!
//! Turns tape-language source into run-length tokens. Lexing is total: every
//! input produces a token sequence and no errors are ever reported.
//!
//! Characters other than the eight symbols are commentary. They emit nothing,
//! but they do end a run, so `+a+` is two `Increment(1)` tokens rather than
//! one `Increment(2)`.
//!
//! A run longer than the lexer's `max_run` is split into several tokens of
//! the same kind; their counts add up to the run length.

#ifndef BFQ_LEXER_LEXER_HPP
#define BFQ_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace bfq::lexer {

/// Lexical analyzer for one `Source`.
///
/// ```cpp
/// auto source = Source::from_string("++[->+<]");
/// Lexer lexer(source);
/// auto tokens = lexer.tokenize(); // Increment(2), LoopOpen, Decrement(1), ...
/// ```
class Lexer {
public:
    /// Largest count a single token can carry.
    static constexpr uint32_t MAX_RUN_LENGTH = std::numeric_limits<uint32_t>::max();

    /// The source must outlive the lexer and every token it produces.
    /// `max_run` (at least 1) caps the count of one token.
    explicit Lexer(const Source& source, uint32_t max_run = MAX_RUN_LENGTH);

    /// Next token, or `std::nullopt` once the input is exhausted.
    [[nodiscard]] auto next_token() -> std::optional<Token>;

    /// Lexes the remaining input. There is no end-of-file token.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

private:
    const Source& source_;
    uint32_t max_run_;
    size_t pos_ = 0;
    size_t token_start_ = 0;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    /// Skips everything that is not one of the eight symbols.
    void skip_commentary();

    /// Consumes the rest of a run of `c` that starts at `token_start_`,
    /// stopping after `max_run_` characters.
    void consume_run(char c);

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
};

/// True for the eight characters that carry meaning.
[[nodiscard]] auto is_command_char(char c) -> bool;

} // namespace bfq::lexer

#endif // BFQ_LEXER_LEXER_HPP
