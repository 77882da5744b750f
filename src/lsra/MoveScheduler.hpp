#ifndef SRC_LSRA_MOVE_SCHEDULER_HPP_
#define SRC_LSRA_MOVE_SCHEDULER_HPP_

#include "lsra/Location.hpp"

#include <vector>

namespace lsra {

// Resolution moves are assumed to happen all simultaneously. The MoveScheduler determines an order for all moves so
// that no value gets overwritten by another move before it is read. Cycles of moves are broken by saving one value to
// the scratch spill slot.
class MoveScheduler {
public:
    MoveScheduler() = default;
    ~MoveScheduler() = default;

    // Appends the moves in a safe sequential order to |ordered|. Moves with the same source and destination are
    // dropped. Returns false if the moves cannot be scheduled because they are ambiguous (>1 move has same
    // destination) or because one of them writes to the scratch slot.
    bool scheduleMoves(const std::vector<Move>& moves, std::vector<Move>& ordered);
};

} // namespace lsra

#endif // SRC_LSRA_MOVE_SCHEDULER_HPP_
