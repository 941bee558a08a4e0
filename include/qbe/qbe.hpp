//! # QBE IR Model
//!
//! A structured model of the part of the QBE intermediate language that the
//! code generator emits, plus a printer that renders it as QBE IL text.
//!
//! ## Shape
//!
//! ```text
//! Module
//!   Function (export function w $main())
//!     Block @runtime
//!       InstructionData (%tape =l alloc8 60000)
//!       ...
//!       terminator?      (none = fall through to the next block)
//!     Block @start
//!       ...
//! ```
//!
//! Values are `%temporaries`, `$globals` or integer constants. Every
//! instruction may assign one temporary with a base type (`=w`, `=l`).

#ifndef BFQ_QBE_QBE_HPP
#define BFQ_QBE_QBE_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bfq::qbe {

// ============================================================================
// Types and Values
// ============================================================================

enum class Type : uint8_t {
    Word, ///< 32-bit integer, `w`
    Long, ///< 64-bit integer, `l`
    Byte, ///< 8-bit memory type, `b` (loads and stores only)
};

/// One-letter QBE spelling of a type.
[[nodiscard]] auto type_suffix(Type type) -> char;

/// Operand of an instruction.
struct Value {
    enum class Kind : uint8_t { Temporary, Global, Constant };

    Kind kind = Kind::Constant;
    std::string name; ///< Without the sigil
    int64_t constant = 0;

    [[nodiscard]] static auto temp(std::string name) -> Value {
        return Value{.kind = Kind::Temporary, .name = std::move(name), .constant = 0};
    }

    [[nodiscard]] static auto global(std::string name) -> Value {
        return Value{.kind = Kind::Global, .name = std::move(name), .constant = 0};
    }

    [[nodiscard]] static auto integer(int64_t value) -> Value {
        return Value{.kind = Kind::Constant, .name = {}, .constant = value};
    }

    [[nodiscard]] auto operator==(const Value& other) const -> bool = default;
};

// ============================================================================
// Instructions
// ============================================================================

enum class BinOp : uint8_t { Add, Sub };

/// `add a, b` / `sub a, b`
struct BinaryInst {
    BinOp op;
    Value left;
    Value right;
};

/// Comparison condition. The bounds guard only needs unsigned less-than.
enum class CmpOp : uint8_t { Ult };

/// `c<op><t> a, b`, e.g. `cultl %off, 30000`. The result is 0 or 1.
struct CompareInst {
    CmpOp op;
    Type operand_type; ///< Word or Long
    Value left;
    Value right;
};

/// `copy v`
struct CopyInst {
    Value value;
};

/// `loadw`, `loadl`, or `loadub` for bytes (zero-extended).
struct LoadInst {
    Type type;
    Value address;
};

/// `storew`, `storel`, `storeb`
struct StoreInst {
    Type type;
    Value value;
    Value address;
};

/// `alloc<align> size`
struct AllocInst {
    uint32_t align = 8;
    Value size;
};

struct CallArg {
    Type type;
    Value value;
};

/// `call $f(t a, t b, ...)`
struct CallInst {
    Value target;
    std::vector<CallArg> args;
};

using Instruction =
    std::variant<BinaryInst, CompareInst, CopyInst, LoadInst, StoreInst, AllocInst, CallInst>;

/// An instruction with an optional `%result =t` assignment.
struct InstructionData {
    std::optional<Value> result;
    Type type = Type::Word; ///< Type of the assignment, ignored without a result
    Instruction inst;
};

// ============================================================================
// Terminators
// ============================================================================

/// `ret` / `ret v`
struct ReturnTerm {
    std::optional<Value> value;
};

/// `jmp @target`
struct JumpTerm {
    std::string target;
};

/// `jnz v, @if_nonzero, @if_zero`
struct JnzTerm {
    Value condition;
    std::string if_nonzero;
    std::string if_zero;
};

using Terminator = std::variant<ReturnTerm, JumpTerm, JnzTerm>;

// ============================================================================
// Blocks, Functions, Modules
// ============================================================================

/// A labeled basic block. Without a terminator it falls through to the
/// next block of the function.
struct Block {
    std::string label; ///< Without the `@`
    std::vector<InstructionData> instructions;
    std::optional<Terminator> terminator;
};

struct Function {
    bool exported = true;
    std::string name;
    std::optional<Type> return_type;
    std::vector<Block> blocks;

    /// Starts a new block. Subsequent `add_instr` calls append to it.
    auto add_block(std::string label) -> Block&;

    /// Appends an instruction without a result to the current block.
    void add_instr(Instruction inst);

    /// Appends `result =type inst` to the current block.
    void assign_instr(Value result, Type type, Instruction inst);

    /// Terminates the current block.
    void set_terminator(Terminator term);

    /// The most recently added block. Throws `std::logic_error` if none.
    [[nodiscard]] auto current_block() -> Block&;

    [[nodiscard]] auto find_block(std::string_view label) -> Block*;
    [[nodiscard]] auto find_block(std::string_view label) const -> const Block*;

    /// Instructions across all blocks, terminators excluded.
    [[nodiscard]] auto instruction_count() const -> size_t;
};

struct Module {
    std::vector<Function> functions;
};

// ============================================================================
// Verification
// ============================================================================

/// Structural checks before a function is handed to the backend:
/// at least one block, unique labels, branch targets that exist and a
/// terminator on the last block. Temporaries may be assigned more than
/// once; QBE rebuilds SSA form itself.
///
/// Returns one message per violation; empty means well formed.
[[nodiscard]] auto verify(const Function& func) -> std::vector<std::string>;

// ============================================================================
// Printer
// ============================================================================

/// Renders the model as QBE IL text.
class QbePrinter {
public:
    QbePrinter() = default;

    auto print_module(const Module& module) -> std::string;
    auto print_function(const Function& func) -> std::string;
    auto print_block(const Block& block) -> std::string;
    auto print_instruction(const InstructionData& inst) -> std::string;
    auto print_terminator(const Terminator& term) -> std::string;
    auto print_value(const Value& val) -> std::string;
};

inline auto print_module(const Module& module) -> std::string {
    QbePrinter printer;
    return printer.print_module(module);
}

} // namespace bfq::qbe

#endif // BFQ_QBE_QBE_HPP
