#include "lsra/Validator.hpp"

#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

namespace lsra {

// static
bool Validator::validateLinearFrame(const Graph* graph, const LinearFrame* linearFrame) {
    auto numberOfBlocks = static_cast<size_t>(graph->numberOfBlocks());
    if (linearFrame->blockOrder.size() != numberOfBlocks || linearFrame->blockRanges.size() != numberOfBlocks) {
        SPDLOG_ERROR("Mismatch block count on serialization, expecting: {} blockOrder: {} blockRanges: {}",
                numberOfBlocks, linearFrame->blockOrder.size(), linearFrame->blockRanges.size());
        return false;
    }

    // Index is block ID, value is place in the block order.
    std::vector<int32_t> orderIndex(numberOfBlocks, -1);
    for (size_t i = 0; i < linearFrame->blockOrder.size(); ++i) {
        auto blockId = linearFrame->blockOrder[i];
        if (blockId < 0 || blockId >= static_cast<Block::ID>(numberOfBlocks)) {
            SPDLOG_ERROR("Block number {} out of range", blockId);
            return false;
        }
        if (orderIndex[blockId] != -1) {
            SPDLOG_ERROR("Block {} serialized more than once", blockId);
            return false;
        }
        orderIndex[blockId] = static_cast<int32_t>(i);
    }
    if (orderIndex[graph->entry()] != 0) {
        SPDLOG_ERROR("Entry block {} not serialized first", graph->entry());
        return false;
    }

    // The block order should see the ranges increasing with no gaps and covering all the positions.
    Position blockStart = 0;
    for (auto blockId : linearFrame->blockOrder) {
        const auto& block = graph->blocks()[blockId];
        auto range = linearFrame->blockRanges[blockId];
        if (range.from != blockStart) {
            SPDLOG_ERROR("Block {} not starting on correct position, expecting {} got {}", blockId, blockStart,
                    range.from);
            return false;
        }
        auto numberOfLines = std::max(static_cast<Position>(block.instructions.size()), 1);
        if (range.to - range.from != numberOfLines * kPositionStride || range.to > linearFrame->numberOfPositions()) {
            SPDLOG_ERROR("Block {} range [{}, {}) does not match its {} instructions", blockId, range.from, range.to,
                    block.instructions.size());
            return false;
        }
        for (Position position = range.from; position < range.to; position += kPositionStride) {
            auto line = static_cast<size_t>((position - range.from) / kPositionStride);
            const Instruction* expected = block.instructions.empty() ? nullptr : &block.instructions[line];
            if (linearFrame->instructionAt(position) != expected) {
                SPDLOG_ERROR("Wrong instruction at position {} in block {}", position, blockId);
                return false;
            }
            if (linearFrame->lineBlocks[position / kPositionStride] != blockId) {
                SPDLOG_ERROR("Position {} attributed to block {} instead of {}", position,
                        linearFrame->lineBlocks[position / kPositionStride], blockId);
                return false;
            }
        }
        // Next block should start at the end of this block.
        blockStart = range.to;
    }
    if (linearFrame->numberOfPositions() != blockStart) {
        SPDLOG_ERROR("Final block doesn't end at end of positions");
        return false;
    }

    // Every block follows its forward predecessors, every loop header precedes the sources of its back edges.
    std::set<std::pair<Block::ID, Block::ID>> loopEdges(linearFrame->loopEdges.begin(), linearFrame->loopEdges.end());
    for (const auto& block : graph->blocks()) {
        for (auto successor : block.successors) {
            if (loopEdges.count(std::make_pair(block.id, successor))) {
                if (orderIndex[successor] > orderIndex[block.id]) {
                    SPDLOG_ERROR("Loop header {} placed after back edge source {}", successor, block.id);
                    return false;
                }
            } else if (orderIndex[successor] <= orderIndex[block.id]) {
                SPDLOG_ERROR("Block {} placed before its predecessor {}", successor, block.id);
                return false;
            }
        }
    }

    if (linearFrame->valueLifetimes.size() != static_cast<size_t>(graph->numberOfVirtualRegisters())) {
        SPDLOG_ERROR("Expecting {} value lifetimes, got {}", graph->numberOfVirtualRegisters(),
                linearFrame->valueLifetimes.size());
        return false;
    }
    for (size_t i = 0; i < linearFrame->valueLifetimes.size(); ++i) {
        if (linearFrame->valueLifetimes[i].size() != 1 || !linearFrame->valueLifetimes[i][0].isEmpty()) {
            SPDLOG_ERROR("Expecting single empty lifetime for value {} before lifetime analysis", i);
            return false;
        }
    }

    return true;
}

// static
bool Validator::validateRanges(const LifetimeInterval& lifetime) {
    if (lifetime.isEmpty()) {
        SPDLOG_ERROR("Empty lifetime interval for value {}", lifetime.valueNumber);
        return false;
    }
    Position previousEnd = kInvalidPosition;
    for (const auto& range : lifetime.ranges) {
        if (range.from >= range.to) {
            SPDLOG_ERROR("Empty live range [{}, {}) for value {}", range.from, range.to, lifetime.valueNumber);
            return false;
        }
        if (range.from < previousEnd) {
            SPDLOG_ERROR("Live range [{}, {}) for value {} overlaps or precedes previous range", range.from, range.to,
                    lifetime.valueNumber);
            return false;
        }
        previousEnd = range.to;
    }
    for (const auto& usage : lifetime.usages) {
        if (!lifetime.covers(usage.first)) {
            SPDLOG_ERROR("Value {} has usage at {} outside of its lifetime", lifetime.valueNumber, usage.first);
            return false;
        }
    }
    return true;
}

// There are some subtleties about block ranges and loops, which should be checked for correct behavior in individual
// test cases. The broad invariant this function checks is that all accesses of a value happen while it is live, and
// are also in the usages set.
// static
bool Validator::validateLifetimes(const Graph* graph, const LinearFrame* linearFrame, int32_t registerClass) {
    if (linearFrame->valueLifetimes.size() != static_cast<size_t>(graph->numberOfVirtualRegisters())) {
        SPDLOG_ERROR("Expecting {} value lifetimes, got {}", graph->numberOfVirtualRegisters(),
                linearFrame->valueLifetimes.size());
        return false;
    }

    // The spill slot counter should remain at the default until register allocation.
    if (linearFrame->numberOfSpillSlots != 1) {
        SPDLOG_ERROR("Non-default value of {} for number of spill slots", linearFrame->numberOfSpillSlots);
        return false;
    }

    for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
        if (linearFrame->valueLifetimes[i].size() != 1) {
            SPDLOG_ERROR("Expecting single element in value lifetimes arrays until register allocation");
            return false;
        }
        if (linearFrame->valueLifetimes[i][0].valueNumber != i) {
            SPDLOG_ERROR("Value number mismatch at value {}", i);
            return false;
        }
    }

    std::vector<std::set<Position>> usagePositions(linearFrame->valueLifetimes.size());
    for (Position position = 0; position < linearFrame->numberOfPositions(); position += kPositionStride) {
        const auto* instruction = linearFrame->instructionAt(position);
        if (!instruction) {
            continue;
        }
        for (const auto& use : instruction->uses) {
            if (graph->registerClass(use.vReg) != registerClass) {
                continue;
            }
            const auto& lifetime = linearFrame->valueLifetimes[use.vReg][0];
            if (!lifetime.covers(position) || !lifetime.usages.count(position)) {
                SPDLOG_ERROR("Value {} read outside of lifetime or without usage at position {}", use.vReg, position);
                return false;
            }
            usagePositions[use.vReg].emplace(position);
        }
        for (const auto& def : instruction->defs) {
            if (graph->registerClass(def.vReg) != registerClass) {
                continue;
            }
            const auto& lifetime = linearFrame->valueLifetimes[def.vReg][0];
            if (!lifetime.covers(position + 1) || !lifetime.usages.count(position + 1)) {
                SPDLOG_ERROR("Value {} written outside of lifetime or without usage at position {}", def.vReg,
                        position + 1);
                return false;
            }
            usagePositions[def.vReg].emplace(position + 1);
        }
        for (auto temporary : instruction->temporaries) {
            if (graph->registerClass(temporary) != registerClass) {
                continue;
            }
            const auto& lifetime = linearFrame->valueLifetimes[temporary][0];
            if (lifetime.isEmpty() || lifetime.start() != position || lifetime.end() != position + 1) {
                SPDLOG_ERROR("Temporary {} of the instruction at position {} live outside of it", temporary,
                        position);
                return false;
            }
            auto usage = lifetime.usages.find(position);
            if (usage == lifetime.usages.end() || usage->second != UseKind::kRegister) {
                SPDLOG_ERROR("Temporary {} does not require a register at position {}", temporary, position);
                return false;
            }
            usagePositions[temporary].emplace(position);
        }
    }

    for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
        const auto& lifetimes = linearFrame->valueLifetimes[i];
        if (graph->registerClass(i) != registerClass || usagePositions[i].empty()) {
            if (!lifetimes[0].isEmpty()) {
                SPDLOG_ERROR("Value {} has a lifetime but is not accessed in register class {}", i, registerClass);
                return false;
            }
            continue;
        }
        if (!validateRanges(lifetimes[0])) { return false; }
        if (lifetimes[0].usages.size() != usagePositions[i].size()) {
            SPDLOG_ERROR("Usage count mismatch on value {}", i);
            return false;
        }
    }

    for (Block::ID blockId = 0; blockId < graph->numberOfBlocks(); ++blockId) {
        for (auto vReg : linearFrame->liveIns[blockId]) {
            if (!linearFrame->valueLifetimes[vReg][0].covers(linearFrame->blockRanges[blockId].from)) {
                SPDLOG_ERROR("Value {} live into block {} but its lifetime doesn't cover the block start", vReg,
                        blockId);
                return false;
            }
        }
    }
    if (linearFrame->liveIns[graph->entry()].size()) {
        SPDLOG_ERROR("Entry block {} has live in values", graph->entry());
        return false;
    }

    return true;
}

// Check that at |position| there is exactly one location assigned to |vReg|, and that it is a register if |kind|
// requires one.
// static
bool Validator::validateRegisterCoverage(const LinearFrame* linearFrame, Position position, VReg vReg, UseKind kind) {
    int valueCovered = 0;
    const LifetimeInterval* covering = nullptr;
    for (const auto& lt : linearFrame->valueLifetimes[vReg]) {
        if (lt.covers(position)) {
            ++valueCovered;
            covering = &lt;
        }
    }
    if (valueCovered != 1) {
        SPDLOG_ERROR("Value {} not covered (or over-covered) at {}", vReg, position);
        return false;
    }
    if (!covering->usages.count(position)) {
        SPDLOG_ERROR("Value {} live but no usage at {}", vReg, position);
        return false;
    }
    if (kind == UseKind::kRegister && covering->isSpill) {
        SPDLOG_ERROR("Value {} requires a register at {} but is in spill slot {}", vReg, position,
                covering->spillSlot);
        return false;
    }
    return true;
}

// static
bool Validator::validateAllocation(const LinearFrame* linearFrame, int32_t numberOfRegisters) {
    std::vector<Position> clobbers;
    for (Position position = 0; position < linearFrame->numberOfPositions(); position += kPositionStride) {
        const auto* instruction = linearFrame->instructionAt(position);
        if (instruction && instruction->clobbersRegisters) {
            clobbers.emplace_back(position);
        }
    }

    // Tuples of (from, to, value) for every range held in each register.
    std::vector<std::vector<std::tuple<Position, Position, VReg>>> registerRanges(numberOfRegisters);
    // Tuples of (from, to, value) for the span each spill slot holds a value, from the gap where the value is first
    // stored until the end of its lifetime.
    std::map<int32_t, std::vector<std::tuple<Position, Position, VReg>>> spillSlotSpans;

    for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
        Position previousEnd = kInvalidPosition;
        int32_t valueSpillSlot = kScratchSpillSlot;
        Position firstStore = kInvalidPosition;
        for (const auto& lt : linearFrame->valueLifetimes[i]) {
            // Value numbers should align across the valueLifetimes arrays.
            if (lt.valueNumber != i) {
                SPDLOG_ERROR("Mismatch value number at {}", i);
                return false;
            }
            if (!validateRanges(lt)) { return false; }
            if (lt.start() < previousEnd) {
                SPDLOG_ERROR("Overlapping or unsorted lifetimes for value {} at {}", i, lt.start());
                return false;
            }
            previousEnd = lt.end();

            if (lt.isSpill) {
                if (lt.spillSlot <= kScratchSpillSlot || lt.spillSlot >= linearFrame->numberOfSpillSlots) {
                    SPDLOG_ERROR("Bad spill slot {} for value {}", lt.spillSlot, i);
                    return false;
                }
                if (valueSpillSlot == kScratchSpillSlot) {
                    valueSpillSlot = lt.spillSlot;
                    firstStore = gapPosition(lt.start());
                } else if (valueSpillSlot != lt.spillSlot) {
                    SPDLOG_ERROR("Value {} spilled to both slot {} and slot {}", i, valueSpillSlot, lt.spillSlot);
                    return false;
                }
                continue;
            }

            if (lt.registerNumber < 0 || lt.registerNumber >= numberOfRegisters) {
                SPDLOG_ERROR("Bad register number {} for value {}", lt.registerNumber, i);
                return false;
            }
            for (auto clobber : clobbers) {
                if (lt.covers(clobber)) {
                    SPDLOG_ERROR("Value {} held in register {} across clobbering instruction at {}", i,
                            lt.registerNumber, clobber);
                    return false;
                }
            }
            for (const auto& range : lt.ranges) {
                registerRanges[lt.registerNumber].emplace_back(std::make_tuple(range.from, range.to, i));
            }
        }
        if (valueSpillSlot != kScratchSpillSlot) {
            spillSlotSpans[valueSpillSlot].emplace_back(std::make_tuple(firstStore, previousEnd, i));
        }
    }

    // Ensure no two values are allocated to the same register at the same position.
    for (int32_t reg = 0; reg < numberOfRegisters; ++reg) {
        auto& ranges = registerRanges[reg];
        std::sort(ranges.begin(), ranges.end());
        for (size_t j = 1; j < ranges.size(); ++j) {
            if (std::get<0>(ranges[j]) < std::get<1>(ranges[j - 1])) {
                SPDLOG_ERROR("Duplicate register allocation for register {}, values {} and {}, at position {}", reg,
                        std::get<2>(ranges[j - 1]), std::get<2>(ranges[j]), std::get<0>(ranges[j]));
                return false;
            }
        }
    }

    // A spill slot can only be reused once its previous value is dead.
    for (auto& slot : spillSlotSpans) {
        auto& spans = slot.second;
        std::sort(spans.begin(), spans.end());
        for (size_t j = 1; j < spans.size(); ++j) {
            if (std::get<0>(spans[j]) < std::get<1>(spans[j - 1])) {
                SPDLOG_ERROR("Spill slot {} stores value {} at position {} while value {} is still live", slot.first,
                        std::get<2>(spans[j]), std::get<0>(spans[j]), std::get<2>(spans[j - 1]));
                return false;
            }
        }
    }

    // Every access of every allocated value should find it in a single location.
    for (Position position = 0; position < linearFrame->numberOfPositions(); position += kPositionStride) {
        const auto* instruction = linearFrame->instructionAt(position);
        if (!instruction) {
            continue;
        }
        for (const auto& use : instruction->uses) {
            // Values of other register classes have no lifetimes.
            if (linearFrame->valueLifetimes[use.vReg].empty()) {
                continue;
            }
            if (!validateRegisterCoverage(linearFrame, position, use.vReg, use.kind)) { return false; }
        }
        for (const auto& def : instruction->defs) {
            if (linearFrame->valueLifetimes[def.vReg].empty()) {
                continue;
            }
            if (!validateRegisterCoverage(linearFrame, position + 1, def.vReg, def.kind)) { return false; }
        }
        for (auto temporary : instruction->temporaries) {
            if (linearFrame->valueLifetimes[temporary].empty()) {
                continue;
            }
            if (!validateRegisterCoverage(linearFrame, position, temporary, UseKind::kRegister)) { return false; }
        }
    }

    return true;
}

// static
bool Validator::applyMoves(const std::vector<Move>& moves, std::map<Location, VReg>& machine) {
    for (const auto& move : moves) {
        auto iter = machine.find(move.from);
        if (iter == machine.end() || iter->second != move.vReg) {
            SPDLOG_ERROR("Move of value {} from {} to {} reads a location not holding the value", move.vReg,
                    move.from.toString(), move.to.toString());
            return false;
        }
        machine[move.to] = move.vReg;
    }
    return true;
}

// static
bool Validator::validateResolution(const Graph* graph, const LinearFrame* linearFrame) {
    std::map<std::pair<Block::ID, Block::ID>, const EdgeResolution*> edgeResolutions;
    for (const auto& resolution : linearFrame->edgeResolutions) {
        if (!edgeResolutions.emplace(std::make_pair(resolution.from, resolution.to), &resolution).second) {
            SPDLOG_ERROR("Duplicate resolution for edge from block {} to block {}", resolution.from, resolution.to);
            return false;
        }
    }

    // Every value live across an edge must arrive where the successor expects it.
    size_t edgesChecked = 0;
    for (const auto& block : graph->blocks()) {
        auto exit = linearFrame->blockRanges[block.id].to - 1;
        for (auto successor : block.successors) {
            auto entry = linearFrame->blockRanges[successor].from;
            std::map<Location, VReg> machine;
            for (auto vReg : linearFrame->liveIns[successor]) {
                auto location = linearFrame->locationAt(vReg, exit);
                if (!location) {
                    SPDLOG_ERROR("Value {} live into block {} has no location at exit of block {}", vReg, successor,
                            block.id);
                    return false;
                }
                if (!machine.emplace(*location, vReg).second) {
                    SPDLOG_ERROR("Values {} and {} share {} at exit of block {}", machine[*location], vReg,
                            location->toString(), block.id);
                    return false;
                }
            }

            auto iter = edgeResolutions.find(std::make_pair(block.id, successor));
            if (iter != edgeResolutions.end()) {
                ++edgesChecked;
                auto expected = EdgeResolution::Placement::kCriticalEdge;
                if (block.successors.size() == 1) {
                    expected = EdgeResolution::Placement::kPredecessorExit;
                } else if (graph->blocks()[successor].predecessors.size() == 1) {
                    expected = EdgeResolution::Placement::kSuccessorEntry;
                }
                if (iter->second->placement != expected) {
                    SPDLOG_ERROR("Wrong placement for moves on edge from block {} to block {}", block.id, successor);
                    return false;
                }
                if (!applyMoves(iter->second->moves, machine)) { return false; }
            }

            for (auto vReg : linearFrame->liveIns[successor]) {
                auto location = linearFrame->locationAt(vReg, entry);
                if (!location) {
                    SPDLOG_ERROR("Value {} live into block {} has no location at its entry", vReg, successor);
                    return false;
                }
                auto held = machine.find(*location);
                if (held == machine.end() || held->second != vReg) {
                    SPDLOG_ERROR("Value {} not in {} on entry to block {} from block {}", vReg, location->toString(),
                            successor, block.id);
                    return false;
                }
            }
        }
    }
    if (edgesChecked != edgeResolutions.size()) {
        SPDLOG_ERROR("Resolutions recorded for edges that are not in the graph");
        return false;
    }

    // Collect the transfers each split inside a block requires, keyed by the position the moves execute before. A
    // transfer is the location holding the value before the gap and every location it must be found in after it.
    std::map<Position, std::map<VReg, std::pair<Location, std::vector<Location>>>> transfers;
    for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
        const auto& lifetimes = linearFrame->valueLifetimes[i];
        for (size_t j = 1; j < lifetimes.size(); ++j) {
            auto split = lifetimes[j].start();
            if (lifetimes[j - 1].end() != split || linearFrame->isBlockStart(split)) {
                continue;
            }
            if (split % kPositionStride != 0 && lifetimes[j].usages.count(split)) {
                continue;
            }
            if (lifetimes[j - 1].location() == lifetimes[j].location()) {
                continue;
            }
            auto& gapTransfers = transfers[gapPosition(split)];
            auto transfer = gapTransfers.find(i);
            if (transfer == gapTransfers.end()) {
                gapTransfers.emplace(i, std::make_pair(lifetimes[j - 1].location(),
                        std::vector<Location>({lifetimes[j].location()})));
            } else {
                transfer->second.second.emplace_back(lifetimes[j].location());
            }
        }
    }
    for (const auto& moves : linearFrame->splitMoves) {
        if (!transfers.count(moves.first) && moves.second.size()) {
            SPDLOG_ERROR("Split moves at position {} where no value changes location", moves.first);
            return false;
        }
    }

    for (const auto& gap : transfers) {
        auto position = gap.first;
        std::map<Location, VReg> machine;
        for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
            auto transfer = gap.second.find(i);
            std::optional<Location> before;
            if (transfer != gap.second.end()) {
                before = transfer->second.first;
            } else {
                before = linearFrame->locationAt(i, position);
            }
            if (!before) {
                continue;
            }
            if (!machine.emplace(*before, i).second) {
                SPDLOG_ERROR("Values {} and {} share {} before position {}", machine[*before], i,
                        before->toString(), position);
                return false;
            }
        }

        auto splitMoves = linearFrame->splitMoves.find(position);
        if (splitMoves == linearFrame->splitMoves.end()) {
            SPDLOG_ERROR("Missing split moves at position {}", position);
            return false;
        }
        if (!applyMoves(splitMoves->second, machine)) { return false; }

        for (int32_t i = 0; i < static_cast<int32_t>(linearFrame->valueLifetimes.size()); ++i) {
            auto transfer = gap.second.find(i);
            if (transfer != gap.second.end()) {
                for (const auto& to : transfer->second.second) {
                    auto held = machine.find(to);
                    if (held == machine.end() || held->second != i) {
                        SPDLOG_ERROR("Value {} not moved to {} at position {}", i, to.toString(), position);
                        return false;
                    }
                }
            }
            auto location = linearFrame->locationAt(i, position);
            if (!location) {
                continue;
            }
            auto held = machine.find(*location);
            if (held == machine.end() || held->second != i) {
                SPDLOG_ERROR("Value {} clobbered in {} by split moves at position {}", i, location->toString(),
                        position);
                return false;
            }
        }
    }

    return true;
}

} // namespace lsra
