#include "lsra/Resolver.hpp"

#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/MoveScheduler.hpp"

#include "spdlog/spdlog.h"

#include <map>
#include <vector>

/*
Pseudocode taken from [RA5] "Linear Scan Register Allocation on SSA Form." by C. Wimmer and M. Franz.

RESOLVE
for each control flow edge from predecessor to successor do
    for each interval it live at begin of successor do
        if it starts at begin of successor then
            phi = phi function defining it
            opd = phi.inputOf(predecessor)
            if opd is a constant then
                moveFrom = opd
            else
                moveFrom = location of intervals[opd] at end of predecessor
        else
            moveFrom = location of it at end of predecessor
        moveTo = location of it at begin of successor
        if moveFrom ≠ moveTo then
            mapping.add(moveFrom, moveTo)

    mapping.orderAndInsertMoves()

Our input has no phi functions, so moveFrom is always the location at the end of the predecessor. Values split within
a block also need moves wherever one piece ends and the next begins, unless the new piece begins with a definition of
the value. Splits at the start of a block are covered by the edge moves.
*/

namespace lsra {

bool Resolver::resolve(const Graph* graph, LinearFrame* linearFrame) {
    linearFrame->edgeResolutions.clear();
    linearFrame->splitMoves.clear();
    if (!resolveEdges(graph, linearFrame)) { return false; }
    if (!resolveSplits(linearFrame)) { return false; }
    SPDLOG_DEBUG("Resolver added moves on {} edges and at {} split positions", linearFrame->edgeResolutions.size(),
            linearFrame->splitMoves.size());
    return true;
}

bool Resolver::resolveEdges(const Graph* graph, LinearFrame* linearFrame) {
    MoveScheduler moveScheduler;

    for (auto blockNumber : linearFrame->blockOrder) {
        const auto& block = graph->blocks()[blockNumber];
        auto blockRange = linearFrame->blockRanges[blockNumber];

        // for each control flow edge from predecessor to successor do
        for (auto successorNumber : block.successors) {
            const auto& successor = graph->blocks()[successorNumber];
            auto successorRange = linearFrame->blockRanges[successorNumber];
            std::vector<Move> moves;

            // for each interval it live at begin of successor do
            for (auto it : linearFrame->liveIns[successorNumber]) {
                Location moveFrom, moveTo;
                // moveFrom = location of it at end of predecessor
                if (!findAt(it, linearFrame, blockRange.to - 1, moveFrom)) {
                    SPDLOG_CRITICAL("Value {} live into block {} has no location at exit of block {}", it,
                            successorNumber, blockNumber);
                    return false;
                }
                // moveTo = location of it at begin of successor
                if (!findAt(it, linearFrame, successorRange.from, moveTo)) {
                    SPDLOG_CRITICAL("Value {} live into block {} has no location at its entry", it, successorNumber);
                    return false;
                }

                // if moveFrom ≠ moveTo then
                if (moveFrom != moveTo) {
                    // mapping.add(moveFrom, moveTo)
                    moves.emplace_back(Move{moveFrom, moveTo, it});
                }
            }

            if (moves.empty()) {
                continue;
            }

            // mapping.orderAndInsertMoves()
            EdgeResolution resolution;
            resolution.from = blockNumber;
            resolution.to = successorNumber;
            // If the block has only one successor we can simply prepend the moves to the outbound branch. If the
            // successor has only this predecessor we can prepend the moves at the top of the successor. Otherwise the
            // edge is critical and needs its own block.
            if (block.successors.size() == 1) {
                resolution.placement = EdgeResolution::Placement::kPredecessorExit;
            } else if (successor.predecessors.size() == 1) {
                resolution.placement = EdgeResolution::Placement::kSuccessorEntry;
            } else {
                resolution.placement = EdgeResolution::Placement::kCriticalEdge;
            }
            if (!moveScheduler.scheduleMoves(moves, resolution.moves)) {
                SPDLOG_CRITICAL("Failed to schedule moves on edge from block {} to block {}", blockNumber,
                        successorNumber);
                return false;
            }
            linearFrame->edgeResolutions.emplace_back(std::move(resolution));
        }
    }

    return true;
}

bool Resolver::resolveSplits(LinearFrame* linearFrame) {
    std::map<Position, std::vector<Move>> parallelMoves;
    for (const auto& lifetimes : linearFrame->valueLifetimes) {
        // A value split both at an instruction and right after it changes location twice in the same gap. Both moves
        // copy from where the value was before the gap, and a move back into that location is dropped, as the location
        // still holds the value.
        std::map<Position, std::vector<Move>> valueMoves;
        for (size_t i = 1; i < lifetimes.size(); ++i) {
            const auto& previous = lifetimes[i - 1];
            const auto& next = lifetimes[i];
            if (previous.end() != next.start()) {
                continue;
            }
            auto splitPosition = next.start();
            if (linearFrame->isBlockStart(splitPosition)) {
                continue;
            }
            // A piece starting with a definition of the value receives it from the instruction.
            if (splitPosition % kPositionStride != 0 && next.usages.count(splitPosition)) {
                continue;
            }
            if (previous.location() == next.location()) {
                continue;
            }
            auto& moves = valueMoves[gapPosition(splitPosition)];
            auto from = moves.empty() ? previous.location() : moves.front().from;
            if (from != next.location()) {
                moves.emplace_back(Move{from, next.location(), next.valueNumber});
            }
        }
        for (const auto& moves : valueMoves) {
            auto& gapMoves = parallelMoves[moves.first];
            gapMoves.insert(gapMoves.end(), moves.second.begin(), moves.second.end());
        }
    }

    MoveScheduler moveScheduler;
    for (const auto& moves : parallelMoves) {
        auto& ordered = linearFrame->splitMoves[moves.first];
        if (!moveScheduler.scheduleMoves(moves.second, ordered)) {
            SPDLOG_CRITICAL("Failed to schedule split moves at position {}", moves.first);
            return false;
        }
    }

    return true;
}

bool Resolver::findAt(VReg valueNumber, const LinearFrame* linearFrame, Position line, Location& location) {
    auto found = linearFrame->locationAt(valueNumber, line);
    if (!found) {
        return false;
    }
    location = *found;
    return true;
}

} // namespace lsra
