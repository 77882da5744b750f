#ifndef SRC_LSRA_GRAPH_HPP_
#define SRC_LSRA_GRAPH_HPP_

#include "lsra/Block.hpp"
#include "lsra/Instruction.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace lsra {

class ErrorReporter;

// The control flow graph of a single unit of code, the input to the Pipeline. Blocks, virtual registers and
// instructions are added by the builder methods below in any order. Builder methods validate every reference they are
// given, and report problems to the ErrorReporter instead of modifying the Graph. Once the BlockSerializer has
// assigned positions the Graph is frozen and rejects any further modification.
class Graph {
public:
    Graph();
    explicit Graph(std::shared_ptr<ErrorReporter> errorReporter);
    ~Graph() = default;

    // Returns a new virtual register in |registerClass|, or kInvalidVReg on error.
    VReg newVirtualRegister(int32_t registerClass = 0);
    // Returns the ID of a new empty block, or Block::kInvalidID on error.
    Block::ID newBlock();
    bool setEntry(Block::ID blockId);

    // Appends an instruction to the end of |blockId|, returning its index within the block or Instruction::kInvalidID
    // on error.
    Instruction::ID append(Block::ID blockId, std::vector<Operand> uses, std::vector<Operand> defs);
    bool addUse(Block::ID blockId, Instruction::ID instructionId, VReg vReg, UseKind kind = UseKind::kAny,
                bool isKill = false);
    bool addDef(Block::ID blockId, Instruction::ID instructionId, VReg vReg, UseKind kind = UseKind::kAny);
    bool setClobbersRegisters(Block::ID blockId, Instruction::ID instructionId);
    // Gives the instruction a scratch register. |vReg| must not appear anywhere else in the Graph, not as an operand
    // and not as the temporary of another instruction.
    bool addTemporary(Block::ID blockId, Instruction::ID instructionId, VReg vReg);

    // Adds |to| to the successors of |from| and |from| to the predecessors of |to|. Repeated edges are ignored.
    bool addEdge(Block::ID from, Block::ID to);

    // After freezing, all builder methods fail with ErrorCode::kGraphFrozen. Safe to call more than once.
    void freeze() { m_isFrozen = true; }
    bool isFrozen() const { return m_isFrozen; }

    Block::ID entry() const { return m_entry; }
    const std::vector<Block>& blocks() const { return m_blocks; }
    // Returns nullptr if |blockId| is not a valid block.
    const Block* block(Block::ID blockId) const;
    int32_t numberOfBlocks() const { return static_cast<int32_t>(m_blocks.size()); }
    int32_t numberOfVirtualRegisters() const { return static_cast<int32_t>(m_registerClasses.size()); }
    int32_t registerClass(VReg vReg) const { return m_registerClasses[vReg]; }
    int32_t numberOfInstructions() const;

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    bool checkMutable(const char* operation);
    bool checkBlock(Block::ID blockId, const char* operation);
    bool checkInstruction(Block::ID blockId, Instruction::ID instructionId, const char* operation);
    bool checkVReg(VReg vReg, const char* operation);
    bool checkOperand(VReg vReg, const char* operation);

    enum class Role : int8_t {
        kUnused,
        kOperand,
        kTemporary
    };

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<Block> m_blocks;
    // Index is VReg.
    std::vector<int32_t> m_registerClasses;
    std::vector<Role> m_roles;
    Block::ID m_entry;
    bool m_isFrozen;
};

} // namespace lsra

#endif // SRC_LSRA_GRAPH_HPP_
