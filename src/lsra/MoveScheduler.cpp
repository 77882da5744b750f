#include "lsra/MoveScheduler.hpp"

#include "spdlog/spdlog.h"

#include <map>

namespace lsra {

bool MoveScheduler::scheduleMoves(const std::vector<Move>& moves, std::vector<Move>& ordered) {
    const Location scratch = Location::makeSpill(kScratchSpillSlot);

    // Build the reverse map of destination to move, and count how many pending moves read from each location.
    std::map<Location, Move> reverseMoves;
    std::map<Location, int32_t> readers;
    for (const auto& move : moves) {
        if (move.from == move.to) {
            continue;
        }
        if (move.to == scratch) {
            SPDLOG_ERROR("Move of value {} targets the reserved scratch slot.", move.vReg);
            return false;
        }
        auto emplace = reverseMoves.emplace(move.to, move);
        // Ambiguous move caused by a destination having multiple origins.
        if (!emplace.second) {
            SPDLOG_ERROR("Ambiguous moves of values {} and {} into {}.", emplace.first->second.vReg, move.vReg,
                    move.to.toString());
            return false;
        }
        ++readers[move.from];
    }

    while (reverseMoves.size()) {
        // Base case is that this destination is not the origin for another pending move, so it can be safely
        // scheduled.
        bool scheduled = false;
        auto iter = reverseMoves.begin();
        while (iter != reverseMoves.end()) {
            if (readers[iter->first] == 0) {
                ordered.emplace_back(iter->second);
                --readers[iter->second.from];
                iter = reverseMoves.erase(iter);
                scheduled = true;
            } else {
                ++iter;
            }
        }
        if (scheduled) {
            continue;
        }

        // Everything remaining is part of a copy cycle, or a chain hanging off one. Save a register in the cycle to
        // the scratch slot, then redirect its readers to the scratch slot, which unblocks the move into the register.
        // Since every value owns its spill slot there is always a register in a cycle, prefer it to avoid a memory to
        // memory copy.
        iter = reverseMoves.begin();
        for (auto search = reverseMoves.begin(); search != reverseMoves.end(); ++search) {
            if (search->first.isRegister() && readers[search->first] > 0) {
                iter = search;
                break;
            }
        }
        auto saved = iter->first;
        VReg savedValue = kInvalidVReg;
        for (auto& pending : reverseMoves) {
            if (pending.second.from == saved) {
                savedValue = pending.second.vReg;
                pending.second.from = scratch;
                --readers[saved];
                ++readers[scratch];
            }
        }
        ordered.emplace_back(Move{saved, scratch, savedValue});
    }

    return true;
}

} // namespace lsra
