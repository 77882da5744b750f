#include "lsra/Graph.hpp"

#include "lsra/ErrorReporter.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace lsra {

Graph::Graph(): Graph(std::make_shared<ErrorReporter>()) {}

Graph::Graph(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(errorReporter),
    m_entry(Block::kInvalidID),
    m_isFrozen(false) {}

VReg Graph::newVirtualRegister(int32_t registerClass) {
    if (!checkMutable("newVirtualRegister")) { return kInvalidVReg; }
    if (registerClass < 0) {
        m_errorReporter->addError(ErrorCode::kInvalidReference,
                fmt::format("newVirtualRegister: negative register class {}", registerClass));
        return kInvalidVReg;
    }
    VReg vReg = static_cast<VReg>(m_registerClasses.size());
    m_registerClasses.emplace_back(registerClass);
    m_roles.emplace_back(Role::kUnused);
    return vReg;
}

Block::ID Graph::newBlock() {
    if (!checkMutable("newBlock")) { return Block::kInvalidID; }
    Block::ID blockId = static_cast<Block::ID>(m_blocks.size());
    m_blocks.emplace_back(Block(blockId));
    return blockId;
}

bool Graph::setEntry(Block::ID blockId) {
    if (!checkMutable("setEntry")) { return false; }
    if (!checkBlock(blockId, "setEntry")) { return false; }
    m_entry = blockId;
    return true;
}

Instruction::ID Graph::append(Block::ID blockId, std::vector<Operand> uses, std::vector<Operand> defs) {
    if (!checkMutable("append")) { return Instruction::kInvalidID; }
    if (!checkBlock(blockId, "append")) { return Instruction::kInvalidID; }
    for (const auto& use : uses) {
        if (!checkOperand(use.vReg, "append")) { return Instruction::kInvalidID; }
    }
    for (const auto& def : defs) {
        if (!checkOperand(def.vReg, "append")) { return Instruction::kInvalidID; }
    }
    for (const auto& use : uses) {
        m_roles[use.vReg] = Role::kOperand;
    }
    for (const auto& def : defs) {
        m_roles[def.vReg] = Role::kOperand;
    }

    auto& block = m_blocks[blockId];
    Instruction instruction(static_cast<Instruction::ID>(block.instructions.size()));
    instruction.uses = std::move(uses);
    instruction.defs = std::move(defs);
    block.instructions.emplace_back(std::move(instruction));
    return block.instructions.back().id;
}

bool Graph::addUse(Block::ID blockId, Instruction::ID instructionId, VReg vReg, UseKind kind, bool isKill) {
    if (!checkMutable("addUse")) { return false; }
    if (!checkInstruction(blockId, instructionId, "addUse")) { return false; }
    if (!checkOperand(vReg, "addUse")) { return false; }
    m_roles[vReg] = Role::kOperand;
    m_blocks[blockId].instructions[instructionId].uses.emplace_back(Operand{vReg, kind, isKill});
    return true;
}

bool Graph::addDef(Block::ID blockId, Instruction::ID instructionId, VReg vReg, UseKind kind) {
    if (!checkMutable("addDef")) { return false; }
    if (!checkInstruction(blockId, instructionId, "addDef")) { return false; }
    if (!checkOperand(vReg, "addDef")) { return false; }
    m_roles[vReg] = Role::kOperand;
    m_blocks[blockId].instructions[instructionId].defs.emplace_back(Operand{vReg, kind, false});
    return true;
}

bool Graph::setClobbersRegisters(Block::ID blockId, Instruction::ID instructionId) {
    if (!checkMutable("setClobbersRegisters")) { return false; }
    if (!checkInstruction(blockId, instructionId, "setClobbersRegisters")) { return false; }
    m_blocks[blockId].instructions[instructionId].clobbersRegisters = true;
    return true;
}

bool Graph::addTemporary(Block::ID blockId, Instruction::ID instructionId, VReg vReg) {
    if (!checkMutable("addTemporary")) { return false; }
    if (!checkInstruction(blockId, instructionId, "addTemporary")) { return false; }
    if (!checkVReg(vReg, "addTemporary")) { return false; }
    if (m_roles[vReg] != Role::kUnused) {
        m_errorReporter->addError(ErrorCode::kInvalidReference, fmt::format("addTemporary: virtual register {} is "
                "already in use", vReg));
        return false;
    }
    m_roles[vReg] = Role::kTemporary;
    m_blocks[blockId].instructions[instructionId].temporaries.emplace_back(vReg);
    return true;
}

bool Graph::addEdge(Block::ID from, Block::ID to) {
    if (!checkMutable("addEdge")) { return false; }
    if (!checkBlock(from, "addEdge")) { return false; }
    if (!checkBlock(to, "addEdge")) { return false; }

    auto& successors = m_blocks[from].successors;
    if (std::find(successors.begin(), successors.end(), to) != successors.end()) {
        return true;
    }
    successors.emplace_back(to);
    m_blocks[to].predecessors.emplace_back(from);
    return true;
}

const Block* Graph::block(Block::ID blockId) const {
    if (blockId < 0 || blockId >= static_cast<Block::ID>(m_blocks.size())) {
        return nullptr;
    }
    return &m_blocks[blockId];
}

int32_t Graph::numberOfInstructions() const {
    int32_t count = 0;
    for (const auto& block : m_blocks) {
        count += static_cast<int32_t>(block.instructions.size());
    }
    return count;
}

bool Graph::checkMutable(const char* operation) {
    if (m_isFrozen) {
        m_errorReporter->addError(ErrorCode::kGraphFrozen,
                fmt::format("{}: graph is frozen and can no longer be modified", operation));
        return false;
    }
    return true;
}

bool Graph::checkBlock(Block::ID blockId, const char* operation) {
    if (!block(blockId)) {
        m_errorReporter->addError(ErrorCode::kInvalidReference,
                fmt::format("{}: block {} does not exist", operation, blockId));
        return false;
    }
    return true;
}

bool Graph::checkInstruction(Block::ID blockId, Instruction::ID instructionId, const char* operation) {
    if (!checkBlock(blockId, operation)) { return false; }
    if (instructionId < 0 || instructionId >= static_cast<Instruction::ID>(m_blocks[blockId].instructions.size())) {
        m_errorReporter->addError(ErrorCode::kInvalidReference,
                fmt::format("{}: instruction {} does not exist in block {}", operation, instructionId, blockId));
        return false;
    }
    return true;
}

bool Graph::checkVReg(VReg vReg, const char* operation) {
    if (vReg < 0 || vReg >= static_cast<VReg>(m_registerClasses.size())) {
        m_errorReporter->addError(ErrorCode::kInvalidReference,
                fmt::format("{}: virtual register {} does not exist", operation, vReg));
        return false;
    }
    return true;
}

bool Graph::checkOperand(VReg vReg, const char* operation) {
    if (!checkVReg(vReg, operation)) { return false; }
    if (m_roles[vReg] == Role::kTemporary) {
        m_errorReporter->addError(ErrorCode::kInvalidReference,
                fmt::format("{}: virtual register {} is a temporary and cannot be an operand", operation, vReg));
        return false;
    }
    return true;
}

} // namespace lsra
