#ifndef SRC_LSRA_INSTRUCTION_HPP_
#define SRC_LSRA_INSTRUCTION_HPP_

#include <cstdint>
#include <vector>

namespace lsra {

// Virtual registers are numbered densely in declaration order.
using VReg = int32_t;
static constexpr VReg kInvalidVReg = -1;

// Describes where an instruction is able to access an operand. Operands marked kAny may be read from or written to a
// spill slot directly, kRegister operands must be in a physical register at the time of the instruction.
enum class UseKind : int8_t {
    kAny,
    kRegister
};

struct Operand {
    VReg vReg = kInvalidVReg;
    UseKind kind = UseKind::kAny;
    // Marks the last use of |vReg| in the instruction stream. Informational only, liveness is computed from the
    // control flow graph and inconsistent kill flags are logged as warnings.
    bool isKill = false;
};

struct Instruction {
    using ID = int32_t;
    static constexpr ID kInvalidID = -1;

    Instruction() = default;
    explicit Instruction(ID instructionId): id(instructionId) {}
    ~Instruction() = default;

    // Index of this instruction within its Block.
    ID id = kInvalidID;
    std::vector<Operand> uses;
    std::vector<Operand> defs;
    // Scratch values needing a register only while the instruction executes. Each is live at the instruction alone.
    std::vector<VReg> temporaries;
    // Set on instructions like calls that destroy the contents of every physical register.
    bool clobbersRegisters = false;
};

} // namespace lsra

#endif // SRC_LSRA_INSTRUCTION_HPP_
