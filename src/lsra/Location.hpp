#ifndef SRC_LSRA_LOCATION_HPP_
#define SRC_LSRA_LOCATION_HPP_

#include "lsra/Instruction.hpp"

#include <cstdint>
#include <string>

namespace lsra {

// Storage for a value at some position in the program, either a physical register or a spill slot.
struct Location {
    enum class Kind : int8_t {
        kRegister,
        kSpill
    };

    static Location makeRegister(int32_t registerNumber) { return Location{Kind::kRegister, registerNumber}; }
    static Location makeSpill(int32_t spillSlot) { return Location{Kind::kSpill, spillSlot}; }

    bool isRegister() const { return kind == Kind::kRegister; }
    bool isSpill() const { return kind == Kind::kSpill; }

    bool operator==(const Location& location) const { return kind == location.kind && number == location.number; }
    bool operator!=(const Location& location) const { return !(*this == location); }
    // Registers order before spill slots.
    bool operator<(const Location& location) const {
        return kind < location.kind || (kind == location.kind && number < location.number);
    }

    // Returns "r<number>" for registers and "s<number>" for spill slots.
    std::string toString() const;

    Kind kind = Kind::kRegister;
    int32_t number = 0;
};

// Spill slot 0 is reserved as temporary storage to break cycles in parallel moves.
static constexpr int32_t kScratchSpillSlot = 0;

// Copies the value of |vReg| from one Location to another.
struct Move {
    Location from;
    Location to;
    VReg vReg = kInvalidVReg;

    bool operator==(const Move& move) const { return from == move.from && to == move.to && vReg == move.vReg; }
};

} // namespace lsra

#endif // SRC_LSRA_LOCATION_HPP_
