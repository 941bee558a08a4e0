//! # QBE Generator: Control Flow
//!
//! Loops and the bounds-check guard. Both end the current block with a
//! `jnz` and open new labeled blocks, so everything emitted afterwards lands
//! in the continuation block.
//!
//! ## Loop
//!
//! ```text
//! 	%v0 =w loadub %ptr
//! 	jnz %v0, @loop3, @end3
//! @loop3
//! 	...body...
//! 	%v7 =w loadub %ptr
//! 	jnz %v7, @loop3, @end3
//! @end3
//! ```
//!
//! ## Guard
//!
//! ```text
//! 	%v1 =l sub %ptr, %tape
//! 	%v2 =w cultl %v1, 30000
//! 	jnz %v2, @cont4, @halt4
//! @halt4
//! 	ret 1
//! @cont4
//! ```

#include "codegen/qbe_gen.hpp"

#include "log/log.hpp"

namespace bfq::codegen {

void QbeGen::gen_loop(const parser::LoopStmt& loop, const SourceSpan& span) {
    // Trees built by hand can exceed what the parser accepts
    if (loop_depth_ >= parser::MAX_LOOP_DEPTH) {
        if (errors_.empty()) {
            report_error("loops nested too deeply", span,
                         {"at most " + std::to_string(parser::MAX_LOOP_DEPTH) +
                          " loops may be open at once"});
        }
        return;
    }

    int id = fresh_label_id();
    std::string label_begin = "loop" + std::to_string(id);
    std::string label_end = "end" + std::to_string(id);

    BFQ_LOG_TRACE("codegen", "Loop @" << label_begin << " at " << span.start.line << ":"
                                      << span.start.column << " (" << loop.body->size()
                                      << " statements)");

    auto entry_cell = load_cell();
    func_.set_terminator(qbe::JnzTerm{entry_cell, label_begin, label_end});

    func_.add_block(label_begin);
    ++loop_depth_;
    gen_block(*loop.body);
    --loop_depth_;

    // The body may have moved the pointer or changed the cell.
    auto exit_cell = load_cell();
    func_.set_terminator(qbe::JnzTerm{exit_cell, label_begin, label_end});

    func_.add_block(label_end);
}

void QbeGen::gen_bounds_check() {
    int id = fresh_label_id();
    std::string label_cont = "cont" + std::to_string(id);
    std::string label_halt = "halt" + std::to_string(id);
    ++guard_counter_;

    auto offset = fresh_temp();
    func_.assign_instr(offset, qbe::Type::Long,
                       qbe::BinaryInst{qbe::BinOp::Sub, ptr_value(), tape_value()});

    auto in_bounds = fresh_temp();
    func_.assign_instr(in_bounds, qbe::Type::Word,
                       qbe::CompareInst{.op = qbe::CmpOp::Ult,
                                        .operand_type = qbe::Type::Long,
                                        .left = offset,
                                        .right = qbe::Value::integer(
                                            static_cast<int64_t>(tape_limit()))});

    func_.set_terminator(qbe::JnzTerm{in_bounds, label_cont, label_halt});

    func_.add_block(label_halt);
    func_.set_terminator(qbe::ReturnTerm{qbe::Value::integer(1)});

    func_.add_block(label_cont);

    BFQ_LOG_TRACE("codegen", "Guard @" << label_cont << "/@" << label_halt);
}

} // namespace bfq::codegen
