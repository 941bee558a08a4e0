//! # AST Factories and Printer
//!
//! Each `make_*` helper builds one `Stmt`. `print_ast` is the debug view
//! behind `--emit=ast`.

#include "parser/ast.hpp"

#include <algorithm>
#include <sstream>

namespace bfq::parser {

auto make_move_left(uint32_t count, SourceSpan span) -> Stmt {
    return Stmt{.kind = MoveLeftStmt{count}, .attr = {}, .span = span};
}

auto make_move_right(uint32_t count, SourceSpan span) -> Stmt {
    return Stmt{.kind = MoveRightStmt{count}, .attr = {}, .span = span};
}

auto make_add(uint32_t count, SourceSpan span) -> Stmt {
    return Stmt{.kind = AddStmt{count}, .attr = {}, .span = span};
}

auto make_subtract(uint32_t count, SourceSpan span) -> Stmt {
    return Stmt{.kind = SubtractStmt{count}, .attr = {}, .span = span};
}

auto make_read(SourceSpan span) -> Stmt {
    return Stmt{.kind = ReadStmt{}, .attr = {}, .span = span};
}

auto make_write(SourceSpan span) -> Stmt {
    return Stmt{.kind = WriteStmt{}, .attr = {}, .span = span};
}

auto make_loop(Block body, SourceSpan span) -> Stmt {
    return Stmt{.kind = LoopStmt{make_box<Block>(std::move(body))}, .attr = {}, .span = span};
}

auto loop_depth(const Block& block) -> size_t {
    size_t depth = 0;
    for (const auto& stmt : block.stmts) {
        if (stmt.is<LoopStmt>()) {
            depth = std::max(depth, 1 + loop_depth(*stmt.as<LoopStmt>().body));
        }
    }
    return depth;
}

auto count_stmts(const Block& block) -> size_t {
    size_t count = block.stmts.size();
    for (const auto& stmt : block.stmts) {
        if (stmt.is<LoopStmt>()) {
            count += count_stmts(*stmt.as<LoopStmt>().body);
        }
    }
    return count;
}

auto count_loops(const Block& block) -> size_t {
    size_t count = 0;
    for (const auto& stmt : block.stmts) {
        if (stmt.is<LoopStmt>()) {
            count += 1 + count_loops(*stmt.as<LoopStmt>().body);
        }
    }
    return count;
}

// ============================================================================
// Printer
// ============================================================================

namespace {

void print_block(std::ostringstream& out, const Block& block, size_t depth);

void print_stmt(std::ostringstream& out, const Stmt& stmt, size_t depth) {
    out << std::string(depth * 2, ' ');
    std::visit(
        [&](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, MoveLeftStmt>) {
                out << "MoveLeft(" << s.count << ")\n";
            } else if constexpr (std::is_same_v<T, MoveRightStmt>) {
                out << "MoveRight(" << s.count << ")\n";
            } else if constexpr (std::is_same_v<T, AddStmt>) {
                out << "Add(" << s.count << ")\n";
            } else if constexpr (std::is_same_v<T, SubtractStmt>) {
                out << "Subtract(" << s.count << ")\n";
            } else if constexpr (std::is_same_v<T, ReadStmt>) {
                out << "Read\n";
            } else if constexpr (std::is_same_v<T, WriteStmt>) {
                out << "Write\n";
            } else if constexpr (std::is_same_v<T, LoopStmt>) {
                out << "Loop\n";
                print_block(out, *s.body, depth + 1);
            }
        },
        stmt.kind);
}

void print_block(std::ostringstream& out, const Block& block, size_t depth) {
    out << std::string(depth * 2, ' ') << "Block\n";
    for (const auto& stmt : block.stmts) {
        print_stmt(out, stmt, depth + 1);
    }
}

} // namespace

auto print_ast(const Block& block) -> std::string {
    std::ostringstream out;
    print_block(out, block, 0);
    return out.str();
}

} // namespace bfq::parser
