#pragma once

#include "common.hpp"
#include "parser/ast.hpp"
#include "qbe/qbe.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bfq::codegen {

// QBE generation error
struct CodegenError {
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;
};

// Tape geometry and prologue switches
struct CodegenOptions {
    uint32_t tape_cells = 30000;      // Cells the pointer may address
    uint32_t cell_stride = 1;         // Bytes per cell: 1, 4 or 8
    bool zero_tape = true;            // memset the tape in the prologue
    std::string function_name = "main";
};

// QBE IL generator
//
// One tree walk over the program emits a single exported function. The tape
// is twice `tape_cells * cell_stride` bytes; the guard after every pointer
// move rejects offsets outside the first half (unsigned compare, so moves
// below the base fail too).
class QbeGen {
public:
    explicit QbeGen(CodegenOptions options = {});

    // Generate QBE IL text for a program
    auto generate(const parser::Program& program)
        -> Result<std::string, std::vector<CodegenError>>;

    // Generate the structured module for a program
    auto generate_module(const parser::Program& program)
        -> Result<qbe::Module, std::vector<CodegenError>>;

    [[nodiscard]] auto options() const -> const CodegenOptions& {
        return options_;
    }

    // Size of the alloc8 in the prologue
    [[nodiscard]] auto tape_bytes() const -> uint64_t;

    // Offset limit checked by every guard
    [[nodiscard]] auto tape_limit() const -> uint64_t;

    // Counters from the last generate() call
    [[nodiscard]] auto temp_count() const -> int {
        return temp_counter_;
    }
    [[nodiscard]] auto label_count() const -> int {
        return label_counter_;
    }
    [[nodiscard]] auto guard_count() const -> int {
        return guard_counter_;
    }

private:
    CodegenOptions options_;
    qbe::Function func_;
    int temp_counter_ = 0;
    int label_counter_ = 0;
    int guard_counter_ = 0;
    size_t loop_depth_ = 0; // loops open during the walk
    std::vector<CodegenError> errors_;

    void reset();
    void validate_options();
    void report_error(const std::string& msg, const SourceSpan& span = {},
                      std::vector<std::string> notes = {});

    // Naming
    auto fresh_temp() -> qbe::Value;
    auto fresh_label_id() -> int;

    // Cell access
    [[nodiscard]] auto cell_type() const -> qbe::Type;
    [[nodiscard]] auto cell_value_type() const -> qbe::Type;
    auto load_cell() -> qbe::Value;

    // Lowering
    void gen_prologue();
    void gen_block(const parser::Block& block);
    void gen_stmt(const parser::Stmt& stmt);
    void gen_move(qbe::BinOp op, uint32_t count);
    void gen_cell_update(qbe::BinOp op, uint32_t count);
    void gen_io(const char* callee, int64_t fd);
    void gen_loop(const parser::LoopStmt& loop, const SourceSpan& span);
    void gen_bounds_check();
};

// Pointer and tape temporaries shared by every generated function
inline auto ptr_value() -> qbe::Value {
    return qbe::Value::temp("ptr");
}

inline auto tape_value() -> qbe::Value {
    return qbe::Value::temp("tape");
}

} // namespace bfq::codegen
