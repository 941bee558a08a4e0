#include "qbe/qbe.hpp"

#include <stdexcept>
#include <unordered_set>

namespace bfq::qbe {

auto type_suffix(Type type) -> char {
    switch (type) {
    case Type::Word:
        return 'w';
    case Type::Long:
        return 'l';
    case Type::Byte:
        return 'b';
    }
    return '?';
}

// ============================================================================
// Function Building
// ============================================================================

auto Function::add_block(std::string label) -> Block& {
    blocks.push_back(Block{.label = std::move(label), .instructions = {}, .terminator = {}});
    return blocks.back();
}

auto Function::current_block() -> Block& {
    if (blocks.empty()) {
        throw std::logic_error("function $" + name + " has no blocks");
    }
    return blocks.back();
}

void Function::add_instr(Instruction inst) {
    current_block().instructions.push_back(
        InstructionData{.result = std::nullopt, .type = Type::Word, .inst = std::move(inst)});
}

void Function::assign_instr(Value result, Type type, Instruction inst) {
    current_block().instructions.push_back(
        InstructionData{.result = std::move(result), .type = type, .inst = std::move(inst)});
}

void Function::set_terminator(Terminator term) {
    current_block().terminator = std::move(term);
}

auto Function::find_block(std::string_view label) -> Block* {
    for (auto& block : blocks) {
        if (block.label == label) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::find_block(std::string_view label) const -> const Block* {
    for (const auto& block : blocks) {
        if (block.label == label) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::instruction_count() const -> size_t {
    size_t count = 0;
    for (const auto& block : blocks) {
        count += block.instructions.size();
    }
    return count;
}

// ============================================================================
// Verification
// ============================================================================

auto verify(const Function& func) -> std::vector<std::string> {
    std::vector<std::string> problems;
    auto where = "function $" + func.name + ": ";

    if (func.blocks.empty()) {
        problems.push_back(where + "no blocks");
        return problems;
    }

    std::unordered_set<std::string> labels;
    for (const auto& block : func.blocks) {
        if (!labels.insert(block.label).second) {
            problems.push_back(where + "duplicate label @" + block.label);
        }
    }

    auto check_target = [&](const std::string& target) {
        if (labels.count(target) == 0) {
            problems.push_back(where + "branch to unknown label @" + target);
        }
    };

    for (const auto& block : func.blocks) {
        if (!block.terminator) {
            continue;
        }
        if (const auto* jmp = std::get_if<JumpTerm>(&*block.terminator)) {
            check_target(jmp->target);
        } else if (const auto* jnz = std::get_if<JnzTerm>(&*block.terminator)) {
            check_target(jnz->if_nonzero);
            check_target(jnz->if_zero);
        }
    }

    if (!func.blocks.back().terminator) {
        problems.push_back(where + "last block @" + func.blocks.back().label +
                           " falls off the end");
    }

    return problems;
}

} // namespace bfq::qbe
