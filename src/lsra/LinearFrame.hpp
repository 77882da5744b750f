#ifndef SRC_LSRA_LINEAR_FRAME_HPP_
#define SRC_LSRA_LINEAR_FRAME_HPP_

#include "lsra/Block.hpp"
#include "lsra/LifetimeInterval.hpp"
#include "lsra/Location.hpp"

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace lsra {

struct Instruction;

// The positions occupied by a block, [from, to).
struct BlockRange {
    Position from = kInvalidPosition;
    Position to = kInvalidPosition;

    Position first() const { return from; }
    Position last() const { return to - kPositionStride; }
};

// The ordered moves needed to carry every value live across one control flow edge from its location at the exit of
// the predecessor to its location at the entry of the successor.
struct EdgeResolution {
    enum class Placement : int8_t {
        // Predecessor has a single successor, emit moves before the predecessor's branch.
        kPredecessorExit,
        // Successor has a single predecessor, emit moves at the top of the successor.
        kSuccessorEntry,
        // Neither, the code generator must split the edge with a new block holding the moves.
        kCriticalEdge
    };

    Block::ID from = Block::kInvalidID;
    Block::ID to = Block::kInvalidID;
    Placement placement = Placement::kPredecessorExit;
    std::vector<Move> moves;
};

// A Graph flattened into a single ordered instruction stream, plus everything the allocation passes compute about it.
// The BlockSerializer creates the LinearFrame and each subsequent pass fills in more members. The LinearFrame points
// into the Graph it was built from, so the Graph must outlive it.
struct LinearFrame {
    LinearFrame() = default;
    ~LinearFrame() = default;

    // In-order list of each block.
    std::vector<Block::ID> blockOrder;
    // Index is block ID.
    std::vector<BlockRange> blockRanges;
    std::vector<int32_t> loopDepths;
    // For loop headers the position after the last block of the loop, kInvalidPosition for other blocks.
    std::vector<Position> loopEnds;
    // For loop headers the blocks making up the loop, including the header.
    std::map<Block::ID, std::vector<Block::ID>> loopBlocks;
    // Back edges as (source, header) pairs, in order of discovery.
    std::vector<std::pair<Block::ID, Block::ID>> loopEdges;

    // Index is position / kPositionStride. Empty blocks occupy a single position with a nullptr instruction.
    std::vector<const Instruction*> lineNumbers;
    // Index is position / kPositionStride.
    std::vector<Block::ID> lineBlocks;

    // Index is block ID. Values live at the entry of each block.
    std::vector<std::set<VReg>> liveIns;

    // Index is value number. Before register allocation each value has a single interval, afterwards the intervals
    // are sorted by start position and each carries its assigned location.
    std::vector<std::vector<LifetimeInterval>> valueLifetimes;

    // Moves for each control flow edge that needs them.
    std::vector<EdgeResolution> edgeResolutions;
    // Moves reconciling split intervals within a block, keyed by the position of the instruction they execute before.
    std::map<Position, std::vector<Move>> splitMoves;

    // Number of spill slots set after register allocation. We reserve spill slot 0 for temporary storage when breaking
    // copy cycles.
    int32_t numberOfSpillSlots = 1;
    // Count of intervals assigned to spill slots.
    int32_t numberOfSpilledIntervals = 0;

    Position numberOfPositions() const { return static_cast<Position>(lineNumbers.size()) * kPositionStride; }

    // Returns the instruction at |position|, or nullptr if |position| holds no instruction.
    const Instruction* instructionAt(Position position) const;
    bool isBlockStart(Position position) const;

    // Returns the location holding |vReg| at |position|, if any.
    std::optional<Location> locationAt(VReg vReg, Position position) const;
};

} // namespace lsra

#endif // SRC_LSRA_LINEAR_FRAME_HPP_
