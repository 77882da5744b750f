#ifndef SRC_LSRA_REGISTER_ALLOCATOR_HPP_
#define SRC_LSRA_REGISTER_ALLOCATOR_HPP_

#include "lsra/LifetimeInterval.hpp"

#include <cstdint>
#include <list>
#include <memory>
#include <vector>

namespace lsra {

class ErrorReporter;
struct LinearFrame;

// The RegisterAllocator takes a LinearFrame with lifetime intervals and outputs a register allocation schedule for each
// value, splitting intervals where a value moves between registers and spill slots.
//
// This class implements the Linear Scan algorithm detailed in [RA4] in the bibliography, "Optimized Interval Splitting
// in a Linear Scan Register Allocator", by C. Wimmer and H. Mössenböck.
class RegisterAllocator {
public:
    RegisterAllocator() = delete;
    RegisterAllocator(int32_t numberOfRegisters, std::shared_ptr<ErrorReporter> errorReporter);
    ~RegisterAllocator() = default;

    // Returns false if some instruction requires more registers than are available.
    bool allocateRegisters(LinearFrame* linearFrame);

private:
    bool tryAllocateFreeReg(const LinearFrame* linearFrame);
    bool allocateBlockedReg(LinearFrame* linearFrame);
    // Returns the position in (|start|, |end|] to split at so the moves for the split stay out of loops. That is the
    // last block end in the range with the shallowest loop depth below that of the block holding |end|, or |end|.
    Position optimalSplitPosition(const LinearFrame* linearFrame, Position start, Position end) const;
    void spill(LifetimeInterval interval, LinearFrame* linearFrame);
    void handled(LifetimeInterval interval, LinearFrame* linearFrame);
    void pushUnhandled(LifetimeInterval interval);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    int32_t m_numberOfRegisters;

    LifetimeInterval m_current;
    // Min heap ordered by start position.
    std::vector<LifetimeInterval> m_unhandled;
    // Index is register number, an empty interval means the register is free.
    std::vector<LifetimeInterval> m_active;
    std::vector<std::list<LifetimeInterval>> m_inactive;

    // Index is spill slot, the position at which the slot is free for reuse. Slot 0 is never handed out.
    std::vector<Position> m_spillSlotEnds;
    // Index is value number, 0 if the value has not been spilled yet.
    std::vector<int32_t> m_valueSpillSlots;
    // Index is value number, the end of the unsplit lifetime.
    std::vector<Position> m_valueEnds;
    int32_t m_numberOfSpilledIntervals;
};

} // namespace lsra

#endif // SRC_LSRA_REGISTER_ALLOCATOR_HPP_
