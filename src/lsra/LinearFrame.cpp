#include "lsra/LinearFrame.hpp"

namespace lsra {

const Instruction* LinearFrame::instructionAt(Position position) const {
    if (position < 0 || position >= numberOfPositions()) {
        return nullptr;
    }
    return lineNumbers[position / kPositionStride];
}

bool LinearFrame::isBlockStart(Position position) const {
    if (position < 0 || position >= numberOfPositions() || position % kPositionStride != 0) {
        return false;
    }
    return blockRanges[lineBlocks[position / kPositionStride]].from == position;
}

std::optional<Location> LinearFrame::locationAt(VReg vReg, Position position) const {
    if (vReg < 0 || vReg >= static_cast<VReg>(valueLifetimes.size())) {
        return std::nullopt;
    }
    for (const auto& lifetime : valueLifetimes[vReg]) {
        if (lifetime.covers(position)) {
            return lifetime.location();
        }
    }
    return std::nullopt;
}

} // namespace lsra
