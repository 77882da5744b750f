#include "lsra/MoveScheduler.hpp"

#include "doctest/doctest.h"

#include <map>
#include <vector>

namespace {

lsra::Location reg(int32_t n) { return lsra::Location::makeRegister(n); }
lsra::Location slot(int32_t n) { return lsra::Location::makeSpill(n); }

// Runs the moves in order over a machine where each location initially holds the value assigned by the parallel
// moves' sources, then checks every destination holds the value its move carried.
void checkParallelSemantics(const std::vector<lsra::Move>& moves, const std::vector<lsra::Move>& ordered) {
    std::map<lsra::Location, lsra::VReg> machine;
    for (const auto& move : moves) {
        machine[move.from] = move.vReg;
    }
    for (const auto& move : ordered) {
        REQUIRE(machine.count(move.from));
        machine[move.to] = machine[move.from];
    }
    for (const auto& move : moves) {
        CHECK_EQ(machine[move.to], move.vReg);
    }
}

} // namespace

namespace lsra {

TEST_CASE("MoveScheduler simple") {
    SUBCASE("empty set") {
        MoveScheduler ms;
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves({}, ordered));
        CHECK(ordered.size() == 0);
    }

    SUBCASE("no-op move dropped") {
        MoveScheduler ms;
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves({Move{reg(1), reg(1), 0}}, ordered));
        CHECK(ordered.size() == 0);
    }

    SUBCASE("register to register") {
        MoveScheduler ms;
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves({Move{reg(2), reg(3), 7}}, ordered));
        REQUIRE(ordered.size() == 1);
        CHECK(ordered[0] == Move{reg(2), reg(3), 7});
    }

    SUBCASE("register to spill and back") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), slot(1), 0}, Move{slot(2), reg(1), 1}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        REQUIRE(ordered.size() == 2);
        checkParallelSemantics(moves, ordered);
    }

    SUBCASE("ambiguous destination") {
        MoveScheduler ms;
        std::vector<Move> ordered;
        CHECK(!ms.scheduleMoves({Move{reg(0), reg(2), 0}, Move{reg(1), reg(2), 1}}, ordered));
    }

    SUBCASE("scratch slot destination") {
        MoveScheduler ms;
        std::vector<Move> ordered;
        CHECK(!ms.scheduleMoves({Move{reg(0), slot(kScratchSpillSlot), 0}}, ordered));
    }
}

TEST_CASE("MoveScheduler Chains") {
    SUBCASE("Shortest Chain") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), reg(1), 0}, Move{reg(1), reg(2), 1}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        REQUIRE(ordered.size() == 2);
        // The r1 -> r2 move needs to happen before the r0 -> r1 move.
        CHECK(ordered[0] == Move{reg(1), reg(2), 1});
        CHECK(ordered[1] == Move{reg(0), reg(1), 0});
    }

    SUBCASE("Long chain through a spill slot") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(3), reg(4), 3}, Move{slot(1), reg(3), 1}, Move{reg(4), slot(5), 4},
                Move{reg(2), reg(0), 2}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        CHECK(ordered.size() == 4);
        checkParallelSemantics(moves, ordered);
    }

    SUBCASE("Fan out from one source") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), reg(1), 0}, Move{reg(0), slot(1), 0}, Move{reg(1), reg(2), 1}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        CHECK(ordered.size() == 3);
        checkParallelSemantics(moves, ordered);
    }
}

TEST_CASE("MoveScheduler Cycles") {
    SUBCASE("Swap") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), reg(1), 0}, Move{reg(1), reg(0), 1}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        REQUIRE(ordered.size() == 3);
        CHECK(ordered[0] == Move{reg(0), slot(kScratchSpillSlot), 0});
        CHECK(ordered[1] == Move{reg(1), reg(0), 1});
        CHECK(ordered[2] == Move{slot(kScratchSpillSlot), reg(1), 0});
        checkParallelSemantics(moves, ordered);
    }

    SUBCASE("Three cycle") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), reg(1), 0}, Move{reg(1), reg(2), 1}, Move{reg(2), reg(0), 2}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        CHECK(ordered.size() == 4);
        checkParallelSemantics(moves, ordered);
    }

    SUBCASE("Cycle through spill slot saves a register") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{slot(1), reg(0), 0}, Move{reg(0), slot(1), 1}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        REQUIRE(ordered.size() == 3);
        CHECK(ordered[0].from == reg(0));
        CHECK(ordered[0].to == slot(kScratchSpillSlot));
        checkParallelSemantics(moves, ordered);
    }

    SUBCASE("Two cycles and a chain") {
        MoveScheduler ms;
        std::vector<Move> moves({Move{reg(0), reg(1), 0}, Move{reg(1), reg(0), 1}, Move{reg(2), reg(3), 2},
                Move{reg(3), reg(4), 3}, Move{reg(4), reg(2), 4}, Move{reg(5), reg(6), 5}});
        std::vector<Move> ordered;
        REQUIRE(ms.scheduleMoves(moves, ordered));
        CHECK(ordered.size() == 8);
        checkParallelSemantics(moves, ordered);
    }
}

} // namespace lsra
