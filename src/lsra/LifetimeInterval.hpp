#ifndef SRC_LSRA_LIFETIME_INTERVAL_HPP_
#define SRC_LSRA_LIFETIME_INTERVAL_HPP_

#include "lsra/Instruction.hpp"
#include "lsra/Location.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <list>
#include <map>

namespace lsra {

// Positions number the serialized instructions. Instruction n in the linear order is at position n * kPositionStride,
// it reads its inputs at that position and writes its outputs one position later.
using Position = int32_t;
static constexpr Position kPositionStride = 2;
static constexpr Position kInvalidPosition = -1;
static constexpr Position kMaxPosition = std::numeric_limits<Position>::max();

// Returns the gap position a move at |position| executes in, which is before the instruction at the even position at or
// below |position|.
inline Position gapPosition(Position position) { return position - (position % kPositionStride); }

// The Linear Scan literature refers to a collection of LiveRanges as a single "lifetime interval," that may or may not
// contain "lifetime holes." These structs are named to respect that convention. We also include an in-order map of
// use positions, as the spill heuristics order candidates by time of next use that requires a register.

// LiveRanges are [from, to) meaning usage is starting at |from| and ending, but not including, |to|.
struct LiveRange {
    LiveRange() = delete;
    LiveRange(Position f, Position t): from(f), to(t) {}
    ~LiveRange() = default;

    Position from;
    Position to;
};

struct LifetimeInterval {
    LifetimeInterval() = default;
    explicit LifetimeInterval(VReg vReg): valueNumber(vReg) {}
    ~LifetimeInterval() = default;

    // Adds a range in sorted order to list, merging it with any overlapping or adjacent ranges. Empty ranges are
    // ignored.
    void addLiveRange(Position from, Position to);

    // Moves the start of the first range to |from|. Used when a definition is found during the backward liveness pass.
    void setFrom(Position from);

    // Records a use at |position|. A register requirement at a position takes precedence over kAny.
    void addUsage(Position position, UseKind kind);

    // Keeps all ranges before |splitTime|, return a new LifetimeInterval with all ranges after |splitTime|. If
    // |splitTime| is within a LiveRange it will also be split. Also splits the usages map.
    LifetimeInterval splitAt(Position splitTime);

    // Returns true if p is within a LiveRange inside this LifetimeInterval.
    bool covers(Position p) const;

    // Returns true if this and |lt| intersect, meaning there is some value |first| contained in a LiveRange for
    // both objects. Will set |first| to that value if true, will not modify first if false.
    bool findFirstIntersection(const LifetimeInterval& lt, Position& first) const;

    // Returns the first use requiring a register at or after |p|, or kMaxPosition if there is none.
    Position nextRegisterUse(Position p) const;

    bool isEmpty() const { return ranges.size() == 0; }
    Position start() const { assert(!isEmpty()); return ranges.front().from; }
    Position end() const { assert(!isEmpty()); return ranges.back().to; }

    Location location() const {
        return isSpill ? Location::makeSpill(spillSlot) : Location::makeRegister(registerNumber);
    }

    std::list<LiveRange> ranges;
    std::map<Position, UseKind> usages;

    // Register reservations for clobbering instructions have no value and are marked with kInvalidVReg.
    VReg valueNumber = kInvalidVReg;
    int32_t registerNumber = 0;
    // False for the interval built by lifetime analysis, true for every piece split off it.
    bool isSplit = false;
    bool isSpill = false;
    int32_t spillSlot = 0;
};

} // namespace lsra

#endif // SRC_LSRA_LIFETIME_INTERVAL_HPP_
