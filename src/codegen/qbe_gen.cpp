//! # QBE Generator Core
//!
//! Entry points, counters, the runtime prologue and straight-line statement
//! lowering. Loops and the bounds-check guard live in `qbe_gen_control.cpp`.
//!
//! | Statement      | Lowering                                   |
//! |----------------|--------------------------------------------|
//! | `MoveLeft(n)`  | `%ptr =l sub %ptr, n*stride` + guard       |
//! | `MoveRight(n)` | `%ptr =l add %ptr, n*stride` + guard       |
//! | `Add(n)`       | load cell, `add n`, store cell             |
//! | `Subtract(n)`  | load cell, `sub n`, store cell             |
//! | `Read`         | `call $read(w 0, l %ptr, l 1)`             |
//! | `Write`        | `call $write(w 1, l %ptr, l 1)`            |

#include "codegen/qbe_gen.hpp"

#include "log/log.hpp"

namespace bfq::codegen {

QbeGen::QbeGen(CodegenOptions options) : options_(std::move(options)) {}

auto QbeGen::tape_bytes() const -> uint64_t {
    return 2 * tape_limit();
}

auto QbeGen::tape_limit() const -> uint64_t {
    return static_cast<uint64_t>(options_.tape_cells) * options_.cell_stride;
}

void QbeGen::reset() {
    temp_counter_ = 0;
    label_counter_ = 0;
    guard_counter_ = 0;
    loop_depth_ = 0;
    errors_.clear();
    func_ = qbe::Function{.exported = true,
                          .name = options_.function_name,
                          .return_type = qbe::Type::Word,
                          .blocks = {}};
}

void QbeGen::validate_options() {
    if (options_.tape_cells == 0) {
        report_error("tape must have at least one cell");
    }
    if (options_.cell_stride != 1 && options_.cell_stride != 4 && options_.cell_stride != 8) {
        report_error("unsupported cell stride " + std::to_string(options_.cell_stride),
                     SourceSpan{}, {"supported strides are 1, 4 and 8 bytes"});
    }
    if (options_.function_name.empty()) {
        report_error("generated function needs a name");
    }
}

void QbeGen::report_error(const std::string& msg, const SourceSpan& span,
                          std::vector<std::string> notes) {
    errors_.push_back(CodegenError{msg, span, std::move(notes)});
}

auto QbeGen::generate(const parser::Program& program)
    -> Result<std::string, std::vector<CodegenError>> {
    auto module_result = generate_module(program);
    if (is_err(module_result)) {
        return unwrap_err(module_result);
    }
    return qbe::print_module(unwrap(module_result));
}

auto QbeGen::generate_module(const parser::Program& program)
    -> Result<qbe::Module, std::vector<CodegenError>> {
    reset();
    validate_options();
    if (!errors_.empty()) {
        return errors_;
    }

    func_.add_block("runtime");
    gen_prologue();

    func_.add_block("start");
    gen_block(program);
    if (!errors_.empty()) {
        return errors_;
    }
    func_.set_terminator(qbe::ReturnTerm{qbe::Value::integer(0)});

    for (auto& problem : qbe::verify(func_)) {
        report_error("malformed output: " + problem);
    }
    if (!errors_.empty()) {
        return errors_;
    }

    BFQ_LOG_DEBUG("codegen", "Generated $" << func_.name << ": " << func_.blocks.size()
                                           << " blocks, " << func_.instruction_count()
                                           << " instructions, " << temp_counter_
                                           << " temporaries, " << label_counter_
                                           << " label ids, " << guard_counter_ << " guards");

    qbe::Module module;
    module.functions.push_back(std::move(func_));
    return module;
}

// ============================================================================
// Naming
// ============================================================================

auto QbeGen::fresh_temp() -> qbe::Value {
    return qbe::Value::temp("v" + std::to_string(temp_counter_++));
}

auto QbeGen::fresh_label_id() -> int {
    return label_counter_++;
}

// ============================================================================
// Cells
// ============================================================================

auto QbeGen::cell_type() const -> qbe::Type {
    switch (options_.cell_stride) {
    case 8:
        return qbe::Type::Long;
    case 4:
        return qbe::Type::Word;
    default:
        return qbe::Type::Byte;
    }
}

auto QbeGen::cell_value_type() const -> qbe::Type {
    return cell_type() == qbe::Type::Long ? qbe::Type::Long : qbe::Type::Word;
}

auto QbeGen::load_cell() -> qbe::Value {
    auto value = fresh_temp();
    func_.assign_instr(value, cell_value_type(),
                       qbe::LoadInst{.type = cell_type(), .address = ptr_value()});
    return value;
}

// ============================================================================
// Lowering
// ============================================================================

void QbeGen::gen_prologue() {
    auto bytes = qbe::Value::integer(static_cast<int64_t>(tape_bytes()));

    func_.assign_instr(tape_value(), qbe::Type::Long, qbe::AllocInst{.align = 8, .size = bytes});

    if (options_.zero_tape) {
        func_.add_instr(qbe::CallInst{.target = qbe::Value::global("memset"),
                                      .args = {{qbe::Type::Long, tape_value()},
                                               {qbe::Type::Word, qbe::Value::integer(0)},
                                               {qbe::Type::Long, bytes}}});
    }

    func_.assign_instr(ptr_value(), qbe::Type::Long, qbe::CopyInst{tape_value()});
}

void QbeGen::gen_block(const parser::Block& block) {
    for (const auto& stmt : block.stmts) {
        gen_stmt(stmt);
    }
}

void QbeGen::gen_stmt(const parser::Stmt& stmt) {
    std::visit(
        [&](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, parser::MoveLeftStmt>) {
                gen_move(qbe::BinOp::Sub, s.count);
            } else if constexpr (std::is_same_v<T, parser::MoveRightStmt>) {
                gen_move(qbe::BinOp::Add, s.count);
            } else if constexpr (std::is_same_v<T, parser::AddStmt>) {
                gen_cell_update(qbe::BinOp::Add, s.count);
            } else if constexpr (std::is_same_v<T, parser::SubtractStmt>) {
                gen_cell_update(qbe::BinOp::Sub, s.count);
            } else if constexpr (std::is_same_v<T, parser::ReadStmt>) {
                gen_io("read", 0);
            } else if constexpr (std::is_same_v<T, parser::WriteStmt>) {
                gen_io("write", 1);
            } else if constexpr (std::is_same_v<T, parser::LoopStmt>) {
                gen_loop(s, stmt.span);
            }
        },
        stmt.kind);
}

void QbeGen::gen_move(qbe::BinOp op, uint32_t count) {
    auto delta = static_cast<int64_t>(count) * options_.cell_stride;
    func_.assign_instr(ptr_value(), qbe::Type::Long,
                       qbe::BinaryInst{op, ptr_value(), qbe::Value::integer(delta)});
    gen_bounds_check();
}

void QbeGen::gen_cell_update(qbe::BinOp op, uint32_t count) {
    auto loaded = load_cell();
    auto updated = fresh_temp();
    func_.assign_instr(updated, cell_value_type(),
                       qbe::BinaryInst{op, loaded, qbe::Value::integer(count)});
    func_.add_instr(qbe::StoreInst{.type = cell_type(), .value = updated, .address = ptr_value()});
}

void QbeGen::gen_io(const char* callee, int64_t fd) {
    // ssize_t read/write(int fd, void *buf, size_t count), one byte at a time
    func_.add_instr(qbe::CallInst{.target = qbe::Value::global(callee),
                                  .args = {{qbe::Type::Word, qbe::Value::integer(fd)},
                                           {qbe::Type::Long, ptr_value()},
                                           {qbe::Type::Long, qbe::Value::integer(1)}}});
}

} // namespace bfq::codegen
