#ifndef SRC_LSRA_BLOCK_HPP_
#define SRC_LSRA_BLOCK_HPP_

#include "lsra/Instruction.hpp"

#include <cstdint>
#include <vector>

namespace lsra {

// A basic block. Edges are stored as block identities, the owning Graph keeps the blocks in a dense array indexed by
// identity.
struct Block {
    using ID = int32_t;
    static constexpr ID kInvalidID = -1;

    Block() = delete;
    explicit Block(ID blockId): id(blockId) {}
    ~Block() = default;

    ID id;
    std::vector<Instruction> instructions;
    std::vector<ID> predecessors;
    std::vector<ID> successors;
};

} // namespace lsra

#endif // SRC_LSRA_BLOCK_HPP_
