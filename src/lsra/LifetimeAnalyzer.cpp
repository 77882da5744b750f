#include "lsra/LifetimeAnalyzer.hpp"

#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <cassert>
#include <set>

namespace lsra {

/*
Pseudocode for the lifetime interval building algorithm taken verbatim from [RA5] in the Bibliography, "Linear Scan
Register Allocation on SSA Form" by C. Wimmer and M. Franz.

BUILDINTERVALS
    for each block b in reverse order do
        live = union of successor.liveIn for each successor of b

        for each phi function phi of successors of b do
            live.add(phi.inputOf(b))

        for each opd in live do
            intervals[opd].addRange(b.from, b.to)

        for each operation op of b in reverse order do
            for each output operand opd of op do
                intervals[opd].setFrom(op.id)
                live.remove(opd)
            for each input operand opd of op do
                intervals[opd].addRange(b.from, op.id)
                live.add(opd)

        for each phi function phi of b do
            live.remove(phi.output)

        if b is loop header then
            loopEnd = last block of the loop starting at b
            for each opd in live do
            intervals[opd].addRange(b.from, loopEnd.to)

        b.liveIn = live

There are no phi functions in our input, so those steps are omitted. Inputs are read at op.id and outputs written at
op.id + 1, so input ranges extend to op.id + 1 and outputs start there. An output of a value not live after the
operation gets a short range covering only its definition. Temporaries of an operation cover op.id alone and need a
register there. Values live at a loop header are also added to the liveIn sets of every block in the loop, as those
values must survive the trip around the back edge.
*/

LifetimeAnalyzer::LifetimeAnalyzer(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}

bool LifetimeAnalyzer::buildLifetimes(const Graph* graph, LinearFrame* linearFrame, int32_t registerClass) {
    auto inClass = [graph, registerClass](VReg vReg) { return graph->registerClass(vReg) == registerClass; };

    // for each block b in reverse order do
    for (int32_t i = static_cast<int32_t>(linearFrame->blockOrder.size()) - 1; i >= 0; --i) {
        auto blockNumber = linearFrame->blockOrder[i];
        const auto& block = graph->blocks()[blockNumber];
        auto blockRange = linearFrame->blockRanges[blockNumber];

        // live = union of successor.liveIn for each successor of b
        std::set<VReg> live;
        for (auto successor : block.successors) {
            live.insert(linearFrame->liveIns[successor].begin(), linearFrame->liveIns[successor].end());
        }

        // for each opd in live do
        for (auto opd : live) {
            // intervals[opd].addRange(b.from, b.to)
            linearFrame->valueLifetimes[opd][0].addLiveRange(blockRange.from, blockRange.to);
        }

        // for each operation op of b in reverse order do
        for (Position position = blockRange.last(); position >= blockRange.from; position -= kPositionStride) {
            const auto* instruction = linearFrame->instructionAt(position);
            if (!instruction) {
                continue;
            }

            // for each output operand opd of op do
            for (const auto& def : instruction->defs) {
                if (!inClass(def.vReg)) {
                    continue;
                }
                auto& lifetime = linearFrame->valueLifetimes[def.vReg][0];
                if (live.count(def.vReg)) {
                    // intervals[opd].setFrom(op.id)
                    lifetime.setFrom(position + 1);
                } else {
                    lifetime.addLiveRange(position + 1, position + 2);
                }
                lifetime.addUsage(position + 1, def.kind);
                // live.remove(opd)
                live.erase(def.vReg);
            }

            for (auto temporary : instruction->temporaries) {
                if (!inClass(temporary)) {
                    continue;
                }
                auto& lifetime = linearFrame->valueLifetimes[temporary][0];
                lifetime.addLiveRange(position, position + 1);
                lifetime.addUsage(position, UseKind::kRegister);
            }

            for (const auto& use : instruction->uses) {
                if (use.isKill && inClass(use.vReg) && live.count(use.vReg)) {
                    SPDLOG_WARN("Value {} marked as killed at position {} but is live after it.", use.vReg, position);
                }
            }

            // for each input operand opd of op do
            for (const auto& use : instruction->uses) {
                if (!inClass(use.vReg)) {
                    continue;
                }
                auto& lifetime = linearFrame->valueLifetimes[use.vReg][0];
                // intervals[opd].addRange(b.from, op.id)
                lifetime.addLiveRange(blockRange.from, position + 1);
                lifetime.addUsage(position, use.kind);
                // live.add(opd)
                live.emplace(use.vReg);
            }
        }

        // if b is loop header then
        auto loopEnd = linearFrame->loopEnds[blockNumber];
        if (loopEnd != kInvalidPosition) {
            // for each opd in live do
            for (auto opd : live) {
                // intervals[opd].addRange(b.from, loopEnd.to)
                linearFrame->valueLifetimes[opd][0].addLiveRange(blockRange.from, loopEnd);
            }
            for (auto member : linearFrame->loopBlocks[blockNumber]) {
                linearFrame->liveIns[member].insert(live.begin(), live.end());
            }
        }

        // b.liveIn = live
        linearFrame->liveIns[blockNumber] = std::move(live);
    }

    // Anything live at the entry block is read on some path before it is written.
    const auto& entryLive = linearFrame->liveIns[graph->entry()];
    if (entryLive.size()) {
        m_errorReporter->addError(ErrorCode::kUseBeforeDef, fmt::format("values [{}] are used before they are "
                "defined on some path from entry block {}", fmt::join(entryLive, ", "), graph->entry()));
        return false;
    }

    SPDLOG_DEBUG("LifetimeAnalyzer built lifetimes for {} values", linearFrame->valueLifetimes.size());
    return true;
}

} // namespace lsra
