#include "lsra/BlockSerializer.hpp"

#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <map>

namespace lsra {

BlockSerializer::BlockSerializer(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}

std::unique_ptr<LinearFrame> BlockSerializer::serialize(Graph* graph) {
    // Positions are about to be computed, so no more changes to the graph are allowed.
    graph->freeze();

    if (graph->entry() == Block::kInvalidID) {
        m_errorReporter->addError(ErrorCode::kUnreachableBlock, "graph has no entry block");
        return nullptr;
    }

    auto linearFrame = std::make_unique<LinearFrame>();
    auto numberOfBlocks = graph->numberOfBlocks();

    std::vector<bool> visited(numberOfBlocks, false);
    std::set<std::pair<Block::ID, Block::ID>> backEdges;
    findLoopEdges(graph, visited, linearFrame.get(), backEdges);

    std::vector<Block::ID> unreachable;
    for (Block::ID blockId = 0; blockId < numberOfBlocks; ++blockId) {
        if (!visited[blockId]) {
            unreachable.emplace_back(blockId);
        }
    }
    if (unreachable.size()) {
        m_errorReporter->addError(ErrorCode::kUnreachableBlock, fmt::format("blocks [{}] are not reachable from "
                "entry block {}", fmt::join(unreachable, ", "), graph->entry()));
        return nullptr;
    }

    findLoops(graph, linearFrame.get());
    orderBlocks(graph, backEdges, linearFrame.get());

    // Assign positions in block order. Empty blocks still receive one position, so that each block has a distinct
    // entry and exit.
    linearFrame->blockRanges.resize(numberOfBlocks);
    for (auto blockId : linearFrame->blockOrder) {
        const auto& block = graph->blocks()[blockId];
        auto& range = linearFrame->blockRanges[blockId];
        range.from = linearFrame->numberOfPositions();
        if (block.instructions.empty()) {
            linearFrame->lineNumbers.emplace_back(nullptr);
            linearFrame->lineBlocks.emplace_back(blockId);
        }
        for (const auto& instruction : block.instructions) {
            linearFrame->lineNumbers.emplace_back(&instruction);
            linearFrame->lineBlocks.emplace_back(blockId);
        }
        range.to = linearFrame->numberOfPositions();
    }

    // Compute the extent of each loop. Loop members positioned before their header can only come from irreducible
    // control flow and are left out.
    linearFrame->loopEnds.resize(numberOfBlocks, kInvalidPosition);
    for (auto& loop : linearFrame->loopBlocks) {
        auto headerFrom = linearFrame->blockRanges[loop.first].from;
        auto& members = loop.second;
        members.erase(std::remove_if(members.begin(), members.end(), [&linearFrame, headerFrom](Block::ID member) {
            return linearFrame->blockRanges[member].from < headerFrom;
        }), members.end());
        Position loopEnd = kInvalidPosition;
        for (auto member : members) {
            loopEnd = std::max(loopEnd, linearFrame->blockRanges[member].to);
        }
        linearFrame->loopEnds[loop.first] = loopEnd;
    }

    // Every value starts out with a single empty lifetime, filled in by the LifetimeAnalyzer.
    linearFrame->liveIns.resize(numberOfBlocks);
    linearFrame->valueLifetimes.reserve(graph->numberOfVirtualRegisters());
    for (VReg vReg = 0; vReg < graph->numberOfVirtualRegisters(); ++vReg) {
        linearFrame->valueLifetimes.emplace_back(std::vector<LifetimeInterval>{LifetimeInterval(vReg)});
    }

    SPDLOG_DEBUG("BlockSerializer block order [{}], {} loop edges, {} positions",
            fmt::join(linearFrame->blockOrder, ", "), linearFrame->loopEdges.size(),
            linearFrame->numberOfPositions());

    return linearFrame;
}

void BlockSerializer::findLoopEdges(const Graph* graph, std::vector<bool>& visited, LinearFrame* linearFrame,
                                    std::set<std::pair<Block::ID, Block::ID>>& backEdges) {
    // Iterative depth-first traversal, each stack entry is a block and the index of its next successor to visit.
    std::vector<bool> onStack(graph->numberOfBlocks(), false);
    std::vector<std::pair<Block::ID, size_t>> stack;
    stack.emplace_back(std::make_pair(graph->entry(), 0));
    visited[graph->entry()] = true;
    onStack[graph->entry()] = true;

    while (stack.size()) {
        auto& top = stack.back();
        const auto& successors = graph->blocks()[top.first].successors;
        if (top.second >= successors.size()) {
            onStack[top.first] = false;
            stack.pop_back();
            continue;
        }

        auto blockId = top.first;
        auto successor = successors[top.second];
        ++top.second;
        if (onStack[successor]) {
            backEdges.emplace(std::make_pair(blockId, successor));
            linearFrame->loopEdges.emplace_back(std::make_pair(blockId, successor));
        } else if (!visited[successor]) {
            visited[successor] = true;
            onStack[successor] = true;
            stack.emplace_back(std::make_pair(successor, 0));
        }
    }
}

void BlockSerializer::findLoops(const Graph* graph, LinearFrame* linearFrame) {
    // The natural loop of a back edge is its header plus every block that reaches the source of the edge without
    // passing through the header. Back edges sharing a header form a single loop.
    std::map<Block::ID, std::set<Block::ID>> loops;
    for (const auto& edge : linearFrame->loopEdges) {
        auto& members = loops[edge.second];
        members.emplace(edge.second);
        std::vector<Block::ID> workList;
        if (members.emplace(edge.first).second) {
            workList.emplace_back(edge.first);
        }
        while (workList.size()) {
            auto blockId = workList.back();
            workList.pop_back();
            for (auto predecessor : graph->blocks()[blockId].predecessors) {
                if (members.emplace(predecessor).second) {
                    workList.emplace_back(predecessor);
                }
            }
        }
    }

    linearFrame->loopDepths.resize(graph->numberOfBlocks(), 0);
    for (const auto& loop : loops) {
        for (auto member : loop.second) {
            ++linearFrame->loopDepths[member];
        }
        linearFrame->loopBlocks.emplace(loop.first, std::vector<Block::ID>(loop.second.begin(), loop.second.end()));
    }
}

void BlockSerializer::orderBlocks(const Graph* graph, const std::set<std::pair<Block::ID, Block::ID>>& backEdges,
                                  LinearFrame* linearFrame) {
    // Count the forward edges arriving at each block.
    std::vector<int32_t> forwardCounts(graph->numberOfBlocks(), 0);
    for (const auto& block : graph->blocks()) {
        for (auto successor : block.successors) {
            if (!backEdges.count(std::make_pair(block.id, successor))) {
                ++forwardCounts[successor];
            }
        }
    }

    // Blocks with all forward predecessors placed, ordered by decreasing loop depth then increasing ID.
    std::set<std::pair<int32_t, Block::ID>> ready;
    ready.emplace(std::make_pair(-linearFrame->loopDepths[graph->entry()], graph->entry()));
    while (ready.size()) {
        auto blockId = ready.begin()->second;
        ready.erase(ready.begin());
        linearFrame->blockOrder.emplace_back(blockId);

        for (auto successor : graph->blocks()[blockId].successors) {
            if (backEdges.count(std::make_pair(blockId, successor))) {
                continue;
            }
            assert(forwardCounts[successor] > 0);
            if (--forwardCounts[successor] == 0) {
                ready.emplace(std::make_pair(-linearFrame->loopDepths[successor], successor));
            }
        }
    }

    assert(linearFrame->blockOrder.size() == graph->blocks().size());
}

} // namespace lsra
