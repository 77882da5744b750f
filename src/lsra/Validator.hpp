#ifndef SRC_LSRA_VALIDATOR_HPP_
#define SRC_LSRA_VALIDATOR_HPP_

#include "lsra/Instruction.hpp"
#include "lsra/LifetimeInterval.hpp"
#include "lsra/Location.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace lsra {

class Graph;
struct LinearFrame;

// The validator can check the artifacts of each stage of the allocation pipeline for internal consistency. Each
// method logs the first problem it finds and returns false.
class Validator {
public:
    // Checks that every block was serialized exactly once, contiguously, after all of its forward predecessors, and
    // that every position maps back to the right instruction.
    static bool validateLinearFrame(const Graph* graph, const LinearFrame* linearFrame);
    // Checks that each value in |registerClass| has a single well-formed interval covering every access.
    static bool validateLifetimes(const Graph* graph, const LinearFrame* linearFrame, int32_t registerClass);
    // Checks that no two values share a register at any position and that register uses are served from registers.
    // No value may stay in a register across an instruction that clobbers registers.
    static bool validateAllocation(const LinearFrame* linearFrame, int32_t numberOfRegisters);
    // Runs the edge and split moves over a model of the machine and checks every value arrives where it is expected.
    static bool validateResolution(const Graph* graph, const LinearFrame* linearFrame);

private:
    static bool validateRanges(const LifetimeInterval& lifetime);
    static bool validateRegisterCoverage(const LinearFrame* linearFrame, Position position, VReg vReg, UseKind kind);
    static bool applyMoves(const std::vector<Move>& moves, std::map<Location, VReg>& machine);
};

} // namespace lsra

#endif // SRC_LSRA_VALIDATOR_HPP_
