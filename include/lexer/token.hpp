//! # Token Definitions
//!
//! The tape language has eight meaningful characters. The four that move the
//! pointer or change a cell are run-length encoded: a run of `k` identical
//! characters becomes one token with `count == k`. The other four are always
//! single tokens.
//!
//! | Source | Kind         | Count          |
//! |--------|--------------|----------------|
//! | `<`    | `MoveLeft`   | run length     |
//! | `>`    | `MoveRight`  | run length     |
//! | `+`    | `Increment`  | run length     |
//! | `-`    | `Decrement`  | run length     |
//! | `,`    | `Read`       | 1 (never read) |
//! | `.`    | `Write`      | 1 (never read) |
//! | `[`    | `LoopOpen`   | 1 (never read) |
//! | `]`    | `LoopClose`  | 1 (never read) |

#ifndef BFQ_LEXER_TOKEN_HPP
#define BFQ_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace bfq::lexer {

enum class TokenKind : uint8_t {
    MoveLeft,  ///< `<`
    MoveRight, ///< `>`
    Increment, ///< `+`
    Decrement, ///< `-`
    Read,      ///< `,`
    Write,     ///< `.`
    LoopOpen,  ///< `[`
    LoopClose, ///< `]`
};

/// A lexical token.
///
/// `span` covers the whole run in the source and is only used for
/// diagnostics; two tokens compare equal when kind and count match.
struct Token {
    TokenKind kind;
    uint32_t count = 1;
    SourceSpan span{};

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// True for the four run-length kinds.
    [[nodiscard]] auto is_run() const -> bool;

    [[nodiscard]] auto operator==(const Token& other) const -> bool {
        return kind == other.kind && count == other.count;
    }
};

/// Kind name as used in debug output ("Increment", "LoopOpen", ...).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// The source character a kind is lexed from.
[[nodiscard]] auto token_kind_symbol(TokenKind kind) -> char;

/// "Increment(3)" for run kinds, the bare kind name otherwise.
[[nodiscard]] auto to_string(const Token& token) -> std::string;

auto operator<<(std::ostream& os, const Token& token) -> std::ostream&;

} // namespace bfq::lexer

#endif // BFQ_LEXER_TOKEN_HPP
