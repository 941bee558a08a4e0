//! # Abstract Syntax Tree
//!
//! The tree is a strict ownership hierarchy: a `Block` owns its statements by
//! value and a `LoopStmt` owns its body through `Box<Block>`. Nothing is
//! shared and the tree is never mutated after parsing.
//!
//! | Statement      | Source run | Payload      |
//! |----------------|------------|--------------|
//! | `MoveLeftStmt` | `<` x n    | `count = n`  |
//! | `MoveRightStmt`| `>` x n    | `count = n`  |
//! | `AddStmt`      | `+` x n    | `count = n`  |
//! | `SubtractStmt` | `-` x n    | `count = n`  |
//! | `ReadStmt`     | `,`        | -            |
//! | `WriteStmt`    | `.`        | -            |
//! | `LoopStmt`     | `[ ... ]`  | `Box<Block>` |

#ifndef BFQ_PARSER_AST_HPP
#define BFQ_PARSER_AST_HPP

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace bfq::parser {

/// Reserved per-node attribute slot. Carries nothing yet.
struct Attr {
    [[nodiscard]] auto operator==(const Attr&) const -> bool = default;
};

struct Block;

/// Deepest loop nesting the parser accepts. Parsing, generation and tree
/// destruction all recurse once per level.
inline constexpr size_t MAX_LOOP_DEPTH = 1000;

// ============================================================================
// Statements
// ============================================================================

/// `<` run: move the pointer `count` cells left.
struct MoveLeftStmt {
    uint32_t count;
};

/// `>` run: move the pointer `count` cells right.
struct MoveRightStmt {
    uint32_t count;
};

/// `+` run: add `count` to the current cell.
struct AddStmt {
    uint32_t count;
};

/// `-` run: subtract `count` from the current cell.
struct SubtractStmt {
    uint32_t count;
};

/// `,`: read one byte from stdin into the current cell.
struct ReadStmt {};

/// `.`: write the current cell to stdout.
struct WriteStmt {};

/// `[ body ]`: run `body` while the current cell is non-zero.
struct LoopStmt {
    Box<Block> body;
};

/// A statement.
///
/// ```cpp
/// if (stmt.is<LoopStmt>()) {
///     walk(*stmt.as<LoopStmt>().body);
/// }
/// ```
struct Stmt {
    std::variant<MoveLeftStmt, MoveRightStmt, AddStmt, SubtractStmt, ReadStmt, WriteStmt,
                 LoopStmt>
        kind;
    Attr attr;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` if the statement is not a `T`.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Blocks
// ============================================================================

/// Ordered statements. May be empty.
struct Block {
    std::vector<Stmt> stmts;
    Attr attr;
    SourceSpan span;

    [[nodiscard]] auto empty() const -> bool {
        return stmts.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        return stmts.size();
    }
};

/// The top-level block.
using Program = Block;

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] auto make_move_left(uint32_t count, SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_move_right(uint32_t count, SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_add(uint32_t count, SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_subtract(uint32_t count, SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_read(SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_write(SourceSpan span = {}) -> Stmt;
[[nodiscard]] auto make_loop(Block body, SourceSpan span = {}) -> Stmt;

// ============================================================================
// Queries and Printing
// ============================================================================

/// Deepest loop nesting in the block. Zero for a block without loops.
[[nodiscard]] auto loop_depth(const Block& block) -> size_t;

/// Number of statements in the block and all nested bodies, loops included.
[[nodiscard]] auto count_stmts(const Block& block) -> size_t;

/// Number of loops in the block and all nested bodies.
[[nodiscard]] auto count_loops(const Block& block) -> size_t;

/// Renders the tree, one node per line, two spaces per nesting level:
///
/// ```text
/// Block
///   Add(3)
///   Loop
///     Block
///       Subtract(1)
/// ```
[[nodiscard]] auto print_ast(const Block& block) -> std::string;

} // namespace bfq::parser

#endif // BFQ_PARSER_AST_HPP
