#ifndef SRC_LSRA_RESOLVER_HPP_
#define SRC_LSRA_RESOLVER_HPP_

#include "lsra/Instruction.hpp"
#include "lsra/LifetimeInterval.hpp"
#include "lsra/Location.hpp"

#include <memory>

namespace lsra {

class ErrorReporter;
class Graph;
struct LinearFrame;

// The Resolver takes a LinearFrame that has completed register allocation, and schedules the various register transfers
// required both to keep values consistent across register allocation changes as well as between different blocks across
// control flow. This class implements the RESOLVE algorithm described in [RA5], "Linear Scan Register Allocation on SSA
// Form." by C. Wimmer and M. Franz.
class Resolver {
public:
    Resolver() = default;
    ~Resolver() = default;

    // Fills in edgeResolutions and splitMoves in |linearFrame|. Returns false on internal inconsistency in the
    // allocation.
    bool resolve(const Graph* graph, LinearFrame* linearFrame);

private:
    bool resolveEdges(const Graph* graph, LinearFrame* linearFrame);
    bool resolveSplits(LinearFrame* linearFrame);
    bool findAt(VReg valueNumber, const LinearFrame* linearFrame, Position line, Location& location);
};

} // namespace lsra

#endif // SRC_LSRA_RESOLVER_HPP_
