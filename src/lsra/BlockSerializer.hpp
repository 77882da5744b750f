#ifndef SRC_LSRA_BLOCK_SERIALIZER_HPP_
#define SRC_LSRA_BLOCK_SERIALIZER_HPP_

#include "lsra/Block.hpp"

#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace lsra {

class ErrorReporter;
class Graph;
struct LinearFrame;

// Serializes a Graph of blocks into a single LinearFrame, assigning every instruction a position. A block is only
// placed after all of its predecessors except those reaching it over a loop back edge, which is a requirement for the
// lifetime analysis and register allocation stages. Among blocks ready for placement the one most deeply nested in
// loops is placed first, keeping loop bodies contiguous, then the one declared first.
class BlockSerializer {
public:
    BlockSerializer() = delete;
    explicit BlockSerializer(std::shared_ptr<ErrorReporter> errorReporter);
    ~BlockSerializer() = default;

    // Freezes |graph| and produces a LinearFrame with blocks serialized in the required order, or nullptr if the graph
    // has no entry or has blocks unreachable from the entry.
    std::unique_ptr<LinearFrame> serialize(Graph* graph);

private:
    // Depth-first traversal from the entry block marking each visited block, and recording every edge that leads back
    // to a block still on the traversal stack.
    void findLoopEdges(const Graph* graph, std::vector<bool>& visited, LinearFrame* linearFrame,
                       std::set<std::pair<Block::ID, Block::ID>>& backEdges);
    void findLoops(const Graph* graph, LinearFrame* linearFrame);
    void orderBlocks(const Graph* graph, const std::set<std::pair<Block::ID, Block::ID>>& backEdges,
                     LinearFrame* linearFrame);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace lsra

#endif // SRC_LSRA_BLOCK_SERIALIZER_HPP_
