#include "lsra/RegisterAllocator.hpp"

#include "lsra/ErrorReporter.hpp"
#include "lsra/Instruction.hpp"
#include "lsra/LinearFrame.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <tuple>

/*
Pseudocode for the Linear Scan algorithm copied verbatim from [RA4] "Optimized interval splitting in a linear scan
register allocator", by C. Wimmer and H. Mössenböck.

LINEARSCAN
    unhandled = list of intervals sorted by increasing start positions
    active = { }; inactive = { }; handled = { };

    while unhandled =/= { } do
        current = pick and remove first interval from unhandled
        position = start position of current

        // check for intervals in active that are handled or inactive
        for each interval it in active do
            if it ends before position then
                move it from active to handled
            else if it does not cover position then
                move it from active to inactive

        // check for intervals in inactive that are handled or active
        for each interval it in inactive do
            if it ends before position then
                move it from inactive to handled
            else if it covers position then
                move it from inactive to active

        // find a register for current
        TRYALLOCATEFREEREG
        if allocation failed then ALLOCATEBLOCKEDREG

        if current has a register assigned then
            add current to active

TRYALLOCATEFREEREG
    set freeUntilPos of all physical registers to maxInt

    for each interval it in active do
        freeUntilPos[it.reg] = 0

    for each interval it in inactive intersecting with current do
        freeUntilPos[it.reg] = next intersection of it with current

    reg = register with highest freeUntilPos
    if freeUntilPos[reg] = 0 then
        // no register available without spilling
        allocation failed
    else if current ends before freeUntilPos[reg] then
        // register available for the whole interval
        current.reg = reg
    else
        // register available for the first part of the interval
        current.reg = reg
        split current before freeUntilPos[reg]

ALLOCATEBLOCKEDREG
    set nextUsePos of all physical registers to maxInt

    for each interval it in active do
        nextUsePos[it.reg] = next use of it after start of current

    for each interval it in inactive intersecting with current do
        nextUsePos[it.reg] = next use of it after start of current

    reg = register with highest nextUsePos
    if first usage of current is after nextUsePos[reg] then
        // all other intervals are used before current, so it is best to spill current itself
        assign spill slot to current
        split current before its first use position that requires a register
    else
        // spill intervals that currently block reg
        current.reg = reg
        split active interval for reg at position
        split any inactive interval for reg at the end of its lifetime hole

    // make sure that current does not intersect with
    // the fixed interval for reg
    if current intersects with the fixed interval for reg then
        split current before this intersection

"Use" in ALLOCATEBLOCKEDREG always means a use that requires a register. Where more than one register has the highest
nextUsePos, the one whose intervals end last is chosen, then the one holding the latest declared value, then the lowest
numbered. Current is compared against the chosen register with the same ordering, so ties between current and the
register holders spill the interval ending last.
*/

namespace {
// Comparison operator for making a min heap in m_unhandled, sorted by start time and then by value number.
struct IntervalCompare {
    bool operator()(const lsra::LifetimeInterval& lt1, const lsra::LifetimeInterval& lt2) const {
        if (lt1.start() != lt2.start()) {
            return lt1.start() > lt2.start();
        }
        return lt1.valueNumber > lt2.valueNumber;
    }
};
} // namespace

namespace lsra {

RegisterAllocator::RegisterAllocator(int32_t numberOfRegisters, std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(errorReporter),
    m_numberOfRegisters(numberOfRegisters),
    m_numberOfSpilledIntervals(0) {}

bool RegisterAllocator::allocateRegisters(LinearFrame* linearFrame) {
    assert(m_numberOfRegisters > 0);
    m_active.assign(m_numberOfRegisters, LifetimeInterval());
    m_inactive.assign(m_numberOfRegisters, std::list<LifetimeInterval>());
    m_unhandled.clear();
    m_spillSlotEnds.assign(1, kMaxPosition);
    m_valueSpillSlots.assign(linearFrame->valueLifetimes.size(), 0);
    m_valueEnds.assign(linearFrame->valueLifetimes.size(), kInvalidPosition);
    m_numberOfSpilledIntervals = 0;

    // Inputs to clobbering instructions are read after the registers are reserved, so they have to come from memory.
    for (const auto& lifetimes : linearFrame->valueLifetimes) {
        for (const auto& usage : lifetimes[0].usages) {
            const auto* instruction = linearFrame->instructionAt(usage.first);
            if (usage.second == UseKind::kRegister && usage.first % kPositionStride == 0 && instruction
                    && instruction->clobbersRegisters) {
                m_errorReporter->addError(ErrorCode::kAllocationImpossible, fmt::format("value {} requires a "
                        "register at position {} but the instruction there clobbers all registers",
                        lifetimes[0].valueNumber, usage.first));
                return false;
            }
        }
    }

    // We build a min-heap of nonempty value lifetimes, ordered by start time. Higher-number values are likely to start
    // later in the block, so we add them to the heap in reverse order.
    m_unhandled.reserve(linearFrame->valueLifetimes.size());
    for (int32_t i = static_cast<int32_t>(linearFrame->valueLifetimes.size()) - 1; i >= 0; --i) {
        auto& lifetimes = linearFrame->valueLifetimes[i];
        assert(lifetimes.size() == 1);
        if (!lifetimes[0].isEmpty()) {
            m_valueEnds[i] = lifetimes[0].end();
            m_unhandled.emplace_back(std::move(lifetimes[0]));
        }
        lifetimes.clear();
    }
    std::make_heap(m_unhandled.begin(), m_unhandled.end(), IntervalCompare());

    // unhandled = list of intervals sorted by increasing start positions
    // active = { }; inactive = { }; handled = { };

    // Populate m_inactive with register reservations for every instruction that clobbers registers.
    LifetimeInterval reservation;
    for (Position position = 0; position < linearFrame->numberOfPositions(); position += kPositionStride) {
        const auto* instruction = linearFrame->instructionAt(position);
        if (instruction && instruction->clobbersRegisters) {
            reservation.addLiveRange(position, position + 1);
            reservation.addUsage(position, UseKind::kRegister);
        }
    }
    if (!reservation.isEmpty()) {
        for (int32_t i = 0; i < m_numberOfRegisters; ++i) {
            m_inactive[i].push_back(reservation);
            m_inactive[i].back().registerNumber = i;
        }
    }

    // while unhandled =/= { } do
    while (m_unhandled.size()) {
        // current = pick and remove first interval from unhandled
        std::pop_heap(m_unhandled.begin(), m_unhandled.end(), IntervalCompare());
        m_current = std::move(m_unhandled.back());
        m_unhandled.pop_back();
        assert(!m_current.isEmpty());

        // position = start position of current
        auto position = m_current.start();

        // check for intervals in active that are handled or inactive
        // for each interval it in active do
        for (int32_t reg = 0; reg < m_numberOfRegisters; ++reg) {
            if (m_active[reg].isEmpty()) {
                continue;
            }
            // if it ends before position then
            if (m_active[reg].end() <= position) {
                // move it from active to handled
                handled(std::move(m_active[reg]), linearFrame);
                m_active[reg] = LifetimeInterval();
            } else if (!m_active[reg].covers(position)) {
                // else if it does not cover position then
                //   move it from active to inactive
                m_inactive[reg].emplace_back(std::move(m_active[reg]));
                m_active[reg] = LifetimeInterval();
            }
        }

        // check for intervals in inactive that are handled or active
        // for each interval it in inactive do
        for (int32_t reg = 0; reg < m_numberOfRegisters; ++reg) {
            auto iter = m_inactive[reg].begin();
            while (iter != m_inactive[reg].end()) {
                // if it ends before position then
                if (iter->end() <= position) {
                    // move it from inactive to handled
                    handled(std::move(*iter), linearFrame);
                    iter = m_inactive[reg].erase(iter);
                } else if (iter->covers(position)) {
                    // else if it covers position then
                    //   move it from inactive to active
                    assert(m_active[reg].isEmpty());
                    m_active[reg] = std::move(*iter);
                    iter = m_inactive[reg].erase(iter);
                } else {
                    ++iter;
                }
            }
        }

        // find a register for current
        // TRYALLOCATEFREEREG
        if (!tryAllocateFreeReg(linearFrame)) {
            // if allocation failed then ALLOCATEBLOCKEDREG
            if (!allocateBlockedReg(linearFrame)) {
                return false;
            }
        }
    }

    // Append any final lifetimes to the linearFrame.
    for (int32_t reg = 0; reg < m_numberOfRegisters; ++reg) {
        if (!m_active[reg].isEmpty()) {
            handled(std::move(m_active[reg]), linearFrame);
            m_active[reg] = LifetimeInterval();
        }
        for (auto& interval : m_inactive[reg]) {
            handled(std::move(interval), linearFrame);
        }
        m_inactive[reg].clear();
    }

    for (auto& lifetimes : linearFrame->valueLifetimes) {
        std::sort(lifetimes.begin(), lifetimes.end(), [](const LifetimeInterval& a, const LifetimeInterval& b) {
            return a.start() < b.start();
        });
    }

    linearFrame->numberOfSpillSlots = static_cast<int32_t>(m_spillSlotEnds.size());
    linearFrame->numberOfSpilledIntervals = m_numberOfSpilledIntervals;
    SPDLOG_DEBUG("RegisterAllocator spilled {} intervals using {} spill slots", m_numberOfSpilledIntervals,
            linearFrame->numberOfSpillSlots);
    return true;
}

bool RegisterAllocator::tryAllocateFreeReg(const LinearFrame* linearFrame) {
    // set freeUntilPos of all physical registers to maxInt
    std::vector<Position> freeUntilPos(m_numberOfRegisters, kMaxPosition);

    // for each interval it in active do
    for (int32_t i = 0; i < m_numberOfRegisters; ++i) {
        if (!m_active[i].isEmpty()) {
            // freeUntilPos[it.reg] = 0
            freeUntilPos[i] = 0;
        } else {
            // for each interval it in inactive intersecting with current do
            for (const auto& it : m_inactive[i]) {
                Position nextIntersection = 0;
                if (it.findFirstIntersection(m_current, nextIntersection)) {
                    // freeUntilPos[it.reg] = next intersection of it with current
                    freeUntilPos[i] = std::min(freeUntilPos[i], nextIntersection);
                }
            }
        }
    }

    // reg = register with highest freeUntilPos
    // Any register free for the whole of current will do, so prefer the lowest numbered of those.
    int32_t reg = -1;
    for (int32_t i = 0; i < m_numberOfRegisters; ++i) {
        if (m_current.end() <= freeUntilPos[i]) {
            reg = i;
            break;
        }
    }
    if (reg < 0) {
        reg = 0;
        for (int32_t i = 1; i < m_numberOfRegisters; ++i) {
            if (freeUntilPos[i] > freeUntilPos[reg]) {
                reg = i;
            }
        }
    }
    auto highestFreeUntilPos = freeUntilPos[reg];

    // if freeUntilPos[reg] = 0 then
    if (highestFreeUntilPos == 0) {
        // no register available without spilling
        // allocation failed
        return false;
    } else if (m_current.end() > highestFreeUntilPos) {
        // else
        //   // register available for the first part of the interval
        //   current.reg = reg
        //   split current before freeUntilPos[reg]
        // The remainder may be loaded into another register, which only happens between instructions.
        auto splitPosition = gapPosition(highestFreeUntilPos);
        if (splitPosition <= m_current.start()) {
            return false;
        }
        pushUnhandled(m_current.splitAt(optimalSplitPosition(linearFrame, m_current.start(), splitPosition)));
    }
    // else if current ends before freeUntilPos[reg] then
    //   // register available for the whole interval
    //   current.reg = reg
    m_current.registerNumber = reg;

    assert(m_active[reg].isEmpty());
    m_active[reg] = std::move(m_current);
    m_current = LifetimeInterval();
    return true;
}

bool RegisterAllocator::allocateBlockedReg(LinearFrame* linearFrame) {
    auto position = m_current.start();

    // set nextUsePos of all physical registers to maxInt
    std::vector<Position> nextUsePos(m_numberOfRegisters, kMaxPosition);
    std::vector<Position> blockPos(m_numberOfRegisters, kMaxPosition);
    std::vector<Position> holderEnd(m_numberOfRegisters, kInvalidPosition);
    std::vector<VReg> holderValue(m_numberOfRegisters, kInvalidVReg);

    for (int32_t i = 0; i < m_numberOfRegisters; ++i) {
        // for each interval it in active do
        const auto& active = m_active[i];
        if (!active.isEmpty()) {
            if (active.valueNumber == kInvalidVReg) {
                // Register reserved right now, it cannot be taken.
                nextUsePos[i] = position;
                blockPos[i] = position;
            } else {
                // nextUsePos[it.reg] = next use of it after start of current
                nextUsePos[i] = active.nextRegisterUse(position);
                holderEnd[i] = active.end();
                holderValue[i] = active.valueNumber;
            }
        }

        // for each interval it in inactive intersecting with current do
        for (const auto& it : m_inactive[i]) {
            Position intersection = 0;
            if (!it.findFirstIntersection(m_current, intersection)) {
                continue;
            }
            if (it.valueNumber == kInvalidVReg) {
                nextUsePos[i] = std::min(nextUsePos[i], intersection);
                blockPos[i] = std::min(blockPos[i], intersection);
            } else {
                // nextUsePos[it.reg] = next use of it after start of current
                nextUsePos[i] = std::min(nextUsePos[i], it.nextRegisterUse(position));
                holderEnd[i] = std::max(holderEnd[i], it.end());
                holderValue[i] = std::max(holderValue[i], it.valueNumber);
            }
        }
    }

    // reg = register with highest nextUsePos
    int32_t reg = 0;
    for (int32_t i = 1; i < m_numberOfRegisters; ++i) {
        if (std::make_tuple(nextUsePos[i], holderEnd[i], holderValue[i])
                > std::make_tuple(nextUsePos[reg], holderEnd[reg], holderValue[reg])) {
            reg = i;
        }
    }

    auto currentFirstUsage = m_current.nextRegisterUse(position);
    bool currentIsFurthest = std::make_tuple(currentFirstUsage, m_current.end(), m_current.valueNumber)
            > std::make_tuple(nextUsePos[reg], holderEnd[reg], holderValue[reg]);

    // if first usage of current is after nextUsePos[reg] then
    // Current can only be spilled if it doesn't need a register right away.
    if (currentIsFurthest && currentFirstUsage > position) {
        // all other intervals are used before current, so it is best to spill current itself
        // assign spill slot to current
        // split current before its first use position that requires a register
        if (currentFirstUsage != kMaxPosition) {
            pushUnhandled(m_current.splitAt(optimalSplitPosition(linearFrame, position, currentFirstUsage)));
        }
        spill(std::move(m_current), linearFrame);
        m_current = LifetimeInterval();
        return true;
    }

    // All registers are needed at this position, by current and by the values already holding them.
    if (nextUsePos[reg] <= position) {
        m_errorReporter->addError(ErrorCode::kAllocationImpossible, fmt::format("instruction at position {} needs "
                "more than the {} available registers", gapPosition(position), m_numberOfRegisters));
        return false;
    }

    // else
    //   // spill intervals that currently block reg
    //   current.reg = reg
    m_current.registerNumber = reg;

    //   split active interval for reg at position
    if (!m_active[reg].isEmpty()) {
        assert(m_active[reg].valueNumber != kInvalidVReg);
        auto activeSpill = m_active[reg].splitAt(position);
        // What came before the split is handled, save it.
        handled(std::move(m_active[reg]), linearFrame);
        m_active[reg] = LifetimeInterval();

        // The spilled region for the active interval has to end at the next use of the interval requiring a register.
        assert(!activeSpill.isEmpty());
        auto nextUse = activeSpill.nextRegisterUse(position);
        assert(nextUse > position);
        if (nextUse != kMaxPosition) {
            pushUnhandled(activeSpill.splitAt(optimalSplitPosition(linearFrame, position, nextUse)));
        }
        spill(std::move(activeSpill), linearFrame);
    }

    //   split any inactive interval for reg at the end of its lifetime hole
    auto it = m_inactive[reg].begin();
    while (it != m_inactive[reg].end()) {
        Position intersection = 0;
        // Looking for intervals that are for actual values (instead of register reservations with kInvalidVReg),
        // and that intersect with current, because these have been evicted from the register and will need to be
        // reprocessed after their lifetime hole.
        if (it->valueNumber != kInvalidVReg && it->findFirstIntersection(m_current, intersection)) {
            pushUnhandled(it->splitAt(position));
            handled(std::move(*it), linearFrame);
            it = m_inactive[reg].erase(it);
        } else {
            ++it;
        }
    }

    // make sure that current does not intersect with the fixed interval for reg
    // if current intersects with the fixed interval for reg then
    if (blockPos[reg] < m_current.end()) {
        // split current before this intersection
        auto splitPosition = gapPosition(blockPos[reg]);
        assert(splitPosition > position);
        pushUnhandled(m_current.splitAt(optimalSplitPosition(linearFrame, position, splitPosition)));
    }

    assert(m_active[reg].isEmpty());
    m_active[reg] = std::move(m_current);
    m_current = LifetimeInterval();
    return true;
}

Position RegisterAllocator::optimalSplitPosition(const LinearFrame* linearFrame, Position start, Position end) const {
    assert(start < end);
    if (end >= linearFrame->numberOfPositions()) {
        return end;
    }
    auto endDepth = linearFrame->loopDepths[linearFrame->lineBlocks[end / kPositionStride]];
    auto bestPosition = end;
    auto bestDepth = endDepth;
    for (auto blockNumber : linearFrame->blockOrder) {
        auto blockEnd = linearFrame->blockRanges[blockNumber].to;
        auto depth = linearFrame->loopDepths[blockNumber];
        if (start < blockEnd && blockEnd <= end && depth < endDepth && depth <= bestDepth) {
            bestPosition = blockEnd;
            bestDepth = depth;
        }
    }
    if (bestPosition != end) {
        SPDLOG_DEBUG("Moved split from position {} out to block boundary {} at loop depth {}", end, bestPosition,
                bestDepth);
    }
    return bestPosition;
}

void RegisterAllocator::spill(LifetimeInterval interval, LinearFrame* linearFrame) {
    // No spilling of register reservations.
    assert(interval.valueNumber != kInvalidVReg);
    assert(!interval.isEmpty());

    // All pieces of a value share one spill slot, held until the end of the value's lifetime. The store into the slot
    // happens in the gap before the instruction at or below the start of the interval, while that instruction may
    // still read the previous owner of the slot.
    auto spillSlot = m_valueSpillSlots[interval.valueNumber];
    if (spillSlot == 0) {
        for (int32_t i = 1; i < static_cast<int32_t>(m_spillSlotEnds.size()); ++i) {
            if (m_spillSlotEnds[i] <= gapPosition(interval.start())) {
                spillSlot = i;
                break;
            }
        }
        // Create a new spillSlot if needed.
        if (spillSlot == 0) {
            spillSlot = static_cast<int32_t>(m_spillSlotEnds.size());
            m_spillSlotEnds.emplace_back(kMaxPosition);
        }
        m_spillSlotEnds[spillSlot] = m_valueEnds[interval.valueNumber];
        m_valueSpillSlots[interval.valueNumber] = spillSlot;
    }
    // Ensure we are reserving spill slot 0 for move cycles.
    assert(spillSlot > kScratchSpillSlot);

    interval.isSpill = true;
    interval.spillSlot = spillSlot;
    ++m_numberOfSpilledIntervals;
    auto valueNumber = interval.valueNumber;
    linearFrame->valueLifetimes[valueNumber].emplace_back(std::move(interval));
}

void RegisterAllocator::handled(LifetimeInterval interval, LinearFrame* linearFrame) {
    // Register reservations are dropped.
    if (interval.valueNumber == kInvalidVReg || interval.isEmpty()) {
        return;
    }
    assert(!interval.isSpill);
    auto valueNumber = interval.valueNumber;
    linearFrame->valueLifetimes[valueNumber].emplace_back(std::move(interval));
}

void RegisterAllocator::pushUnhandled(LifetimeInterval interval) {
    assert(!interval.isEmpty());
    m_unhandled.emplace_back(std::move(interval));
    std::push_heap(m_unhandled.begin(), m_unhandled.end(), IntervalCompare());
}

} // namespace lsra
