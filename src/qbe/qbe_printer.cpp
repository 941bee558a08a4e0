//! # QBE Printer
//!
//! Text rendering of the IR model. Instructions and terminators are
//! tab-indented, labels start in column 0:
//!
//! ```text
//! export function w $main() {
//! @runtime
//! 	%tape =l alloc8 60000
//! 	%ptr =l copy %tape
//! @start
//! 	ret 0
//! }
//! ```

#include "qbe/qbe.hpp"

#include <sstream>

namespace bfq::qbe {

namespace {

auto cmp_op_name(CmpOp op) -> const char* {
    switch (op) {
    case CmpOp::Ult:
        return "ult";
    }
    return "??";
}

auto load_name(const LoadInst& load) -> std::string {
    if (load.type == Type::Byte) {
        return "loadub";
    }
    return std::string("load") + type_suffix(load.type);
}

} // namespace

auto QbePrinter::print_module(const Module& module) -> std::string {
    std::ostringstream out;
    for (size_t i = 0; i < module.functions.size(); ++i) {
        if (i > 0)
            out << "\n";
        out << print_function(module.functions[i]);
    }
    return out.str();
}

auto QbePrinter::print_function(const Function& func) -> std::string {
    std::ostringstream out;

    if (func.exported) {
        out << "export ";
    }
    out << "function ";
    if (func.return_type) {
        out << type_suffix(*func.return_type) << " ";
    }
    out << "$" << func.name << "() {\n";

    for (const auto& block : func.blocks) {
        out << print_block(block);
    }

    out << "}\n";
    return out.str();
}

auto QbePrinter::print_block(const Block& block) -> std::string {
    std::ostringstream out;

    out << "@" << block.label << "\n";

    for (const auto& inst : block.instructions) {
        out << "\t" << print_instruction(inst) << "\n";
    }

    if (block.terminator.has_value()) {
        out << "\t" << print_terminator(*block.terminator) << "\n";
    }

    return out.str();
}

auto QbePrinter::print_instruction(const InstructionData& inst) -> std::string {
    std::ostringstream out;

    if (inst.result.has_value()) {
        out << print_value(*inst.result) << " =" << type_suffix(inst.type) << " ";
    }

    std::visit(
        [&out, this](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, BinaryInst>) {
                out << (i.op == BinOp::Add ? "add " : "sub ") << print_value(i.left) << ", "
                    << print_value(i.right);
            } else if constexpr (std::is_same_v<T, CompareInst>) {
                out << "c" << cmp_op_name(i.op) << type_suffix(i.operand_type) << " "
                    << print_value(i.left) << ", " << print_value(i.right);
            } else if constexpr (std::is_same_v<T, CopyInst>) {
                out << "copy " << print_value(i.value);
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                out << load_name(i) << " " << print_value(i.address);
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                out << "store" << type_suffix(i.type) << " " << print_value(i.value) << ", "
                    << print_value(i.address);
            } else if constexpr (std::is_same_v<T, AllocInst>) {
                out << "alloc" << i.align << " " << print_value(i.size);
            } else if constexpr (std::is_same_v<T, CallInst>) {
                out << "call " << print_value(i.target) << "(";
                for (size_t a = 0; a < i.args.size(); ++a) {
                    if (a > 0)
                        out << ", ";
                    out << type_suffix(i.args[a].type) << " " << print_value(i.args[a].value);
                }
                out << ")";
            }
        },
        inst.inst);

    return out.str();
}

auto QbePrinter::print_terminator(const Terminator& term) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out, this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ReturnTerm>) {
                out << "ret";
                if (t.value.has_value()) {
                    out << " " << print_value(*t.value);
                }
            } else if constexpr (std::is_same_v<T, JumpTerm>) {
                out << "jmp @" << t.target;
            } else if constexpr (std::is_same_v<T, JnzTerm>) {
                out << "jnz " << print_value(t.condition) << ", @" << t.if_nonzero << ", @"
                    << t.if_zero;
            }
        },
        term);

    return out.str();
}

auto QbePrinter::print_value(const Value& val) -> std::string {
    switch (val.kind) {
    case Value::Kind::Temporary:
        return "%" + val.name;
    case Value::Kind::Global:
        return "$" + val.name;
    case Value::Kind::Constant:
        return std::to_string(val.constant);
    }
    return "?";
}

} // namespace bfq::qbe
