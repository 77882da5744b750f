#include "lsra/RegisterAllocator.hpp"

#include "lsra/BlockSerializer.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LifetimeAnalyzer.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/Validator.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace {

// Runs the stages up to and including register allocation, returning nullptr if allocation fails.
std::unique_ptr<lsra::LinearFrame> allocateRegisters(lsra::Graph* graph, int32_t numberOfRegisters) {
    lsra::BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph);
    REQUIRE(linearFrame);
    lsra::LifetimeAnalyzer analyzer(graph->errorReporter());
    REQUIRE(analyzer.buildLifetimes(graph, linearFrame.get(), 0));
    lsra::RegisterAllocator allocator(numberOfRegisters, graph->errorReporter());
    if (!allocator.allocateRegisters(linearFrame.get())) {
        return nullptr;
    }
    CHECK(lsra::Validator::validateAllocation(linearFrame.get(), numberOfRegisters));
    return linearFrame;
}

// Summarizes each piece of a value as (start, end, location).
std::vector<std::tuple<lsra::Position, lsra::Position, lsra::Location>> piecesOf(const lsra::LinearFrame* linearFrame,
        lsra::VReg vReg) {
    std::vector<std::tuple<lsra::Position, lsra::Position, lsra::Location>> pieces;
    for (const auto& lifetime : linearFrame->valueLifetimes[vReg]) {
        pieces.emplace_back(std::make_tuple(lifetime.start(), lifetime.end(), lifetime.location()));
    }
    return pieces;
}

using Pieces = std::vector<std::tuple<lsra::Position, lsra::Position, lsra::Location>>;

lsra::Location reg(int32_t n) { return lsra::Location::makeRegister(n); }
lsra::Location slot(int32_t n) { return lsra::Location::makeSpill(n); }

} // namespace

namespace lsra {

TEST_CASE("RegisterAllocator no pressure") {
    SUBCASE("disjoint values share a register") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {Operand{v0}}, {Operand{v1}});
        graph.append(b0, {Operand{v1}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 3, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 5, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpillSlots, 1);
        CHECK_EQ(linearFrame->numberOfSpilledIntervals, 0);
    }

    SUBCASE("lowest free register chosen") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1}});
        graph.append(b0, {Operand{v0}}, {Operand{v2}});
        graph.append(b0, {Operand{v1}, Operand{v2}}, {});

        auto linearFrame = allocateRegisters(&graph, 4);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 5, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 7, reg(1)}}));
        // v0 is dead after position 4 so v2 can reuse its register.
        CHECK_EQ(piecesOf(linearFrame.get(), v2), Pieces({{5, 7, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpilledIntervals, 0);
    }

    SUBCASE("values of other register classes are not allocated") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto f0 = graph.newVirtualRegister(1);
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}, Operand{f0}});
        graph.append(b0, {Operand{v0}, Operand{f0}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 3, reg(0)}}));
        CHECK(linearFrame->valueLifetimes[f0].empty());
        CHECK(!linearFrame->locationAt(f0, 2));
    }
}

TEST_CASE("RegisterAllocator spilling") {
    SUBCASE("three values and one register") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1}});
        graph.append(b0, {}, {Operand{v2}});
        graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v1, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v2, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        // v0 has the nearest register use, so it keeps the register while the others wait in spill slots.
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 7, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 8, slot(1)}, {8, 9, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v2), Pieces({{5, 10, slot(2)}, {10, 11, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpilledIntervals, 2);
        CHECK_EQ(linearFrame->numberOfSpillSlots, 3);
    }

    SUBCASE("furthest register use is evicted") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        std::vector<VReg> v;
        for (int i = 0; i < 4; ++i) {
            v.emplace_back(graph.newVirtualRegister());
        }
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        for (int i = 0; i < 4; ++i) {
            graph.append(b0, {}, {Operand{v[i]}});
        }
        graph.append(b0, {Operand{v[3], UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v[1], UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v[0], UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v[2], UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 2);
        REQUIRE(linearFrame);

        // All four values are live at position 7, the two with the nearest register use hold the registers.
        int inRegisters = 0;
        for (int i = 0; i < 4; ++i) {
            auto location = linearFrame->locationAt(v[i], 7);
            REQUIRE(location);
            if (location->isRegister()) {
                ++inRegisters;
            }
        }
        CHECK_EQ(inRegisters, 2);
        CHECK(linearFrame->locationAt(v[3], 7)->isRegister());
        CHECK(linearFrame->locationAt(v[1], 7)->isRegister());
        CHECK(linearFrame->locationAt(v[0], 7)->isSpill());
        CHECK(linearFrame->locationAt(v[2], 7)->isSpill());

        // v0 is evicted when v3 is defined, and reloaded before its use.
        CHECK_EQ(piecesOf(linearFrame.get(), v[0]), Pieces({{1, 7, reg(0)}, {7, 12, slot(2)}, {12, 13, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[2]), Pieces({{5, 14, slot(1)}, {14, 15, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[3]), Pieces({{7, 9, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpilledIntervals, 2);
    }

    SUBCASE("spill slot reused after value ends") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto v3 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1}});
        graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v1, UseKind::kRegister}}, {});
        graph.append(b0, {}, {Operand{v2}});
        graph.append(b0, {}, {Operand{v3}});
        graph.append(b0, {Operand{v2, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v3, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 6, slot(1)}, {6, 7, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v3), Pieces({{11, 14, slot(1)}, {14, 15, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpillSlots, 2);
    }

    SUBCASE("spill slot not reused while its value is read by the storing instruction") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}, Operand{v1}});
        // v0 dies here, and v1 is pushed out of the register by v2. Its store runs before this instruction reads v0.
        graph.append(b0, {Operand{v0}}, {Operand{v2, UseKind::kRegister}});
        graph.append(b0, {Operand{v2, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v1, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 3, slot(1)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{1, 3, reg(0)}, {3, 6, slot(2)}, {6, 7, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v2), Pieces({{3, 5, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpillSlots, 3);
    }
}

TEST_CASE("RegisterAllocator split positions") {
    // v0 is defined before a loop and read in a register inside it. v1 pushes v0 out of the only register before
    // the loop.
    Graph graph(std::make_shared<ErrorReporter>(true));
    auto v0 = graph.newVirtualRegister();
    auto v1 = graph.newVirtualRegister();
    for (int i = 0; i < 4; ++i) {
        graph.newBlock();
    }
    graph.setEntry(0);
    graph.addEdge(0, 1);
    graph.addEdge(1, 2);
    graph.addEdge(2, 1);
    graph.addEdge(1, 3);
    graph.append(0, {}, {Operand{v0}});
    graph.append(0, {}, {Operand{v1}});
    graph.append(0, {Operand{v1, UseKind::kRegister}}, {});
    graph.append(1, {}, {});
    graph.append(2, {Operand{v0, UseKind::kRegister}}, {});

    auto linearFrame = allocateRegisters(&graph, 1);
    REQUIRE(linearFrame);
    REQUIRE_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
    // The reload happens on entry to the loop rather than in the loop body at 8.
    CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 3, reg(0)}, {3, 6, slot(1)}, {6, 10, reg(0)}}));
    CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 5, reg(0)}}));
}

TEST_CASE("RegisterAllocator temporaries") {
    SUBCASE("temporary gets a register apart from the inputs") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto t0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1}});
        auto add = graph.append(b0, {Operand{v0, UseKind::kRegister}, Operand{v1, UseKind::kRegister}}, {});
        REQUIRE(graph.addTemporary(b0, add, t0));

        auto linearFrame = allocateRegisters(&graph, 3);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 5, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 5, reg(1)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), t0), Pieces({{4, 5, reg(2)}}));
    }

    SUBCASE("temporary pushes out a value live through the instruction") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto t0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto scratch = graph.append(b0, {}, {});
        REQUIRE(graph.addTemporary(b0, scratch, t0));
        graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 2, reg(0)}, {2, 4, slot(1)}, {4, 5, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), t0), Pieces({{2, 3, reg(0)}}));
    }

    SUBCASE("temporaries count against the registers of an instruction") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto t0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto use = graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});
        REQUIRE(graph.addTemporary(b0, use, t0));

        CHECK(allocateRegisters(&graph, 1) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kAllocationImpossible));
    }

    SUBCASE("temporary of a call is impossible") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto t0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        auto call = graph.append(b0, {}, {});
        REQUIRE(graph.addTemporary(b0, call, t0));
        graph.setClobbersRegisters(b0, call);

        CHECK(allocateRegisters(&graph, 2) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kAllocationImpossible));
    }
}

TEST_CASE("RegisterAllocator clobbering instructions") {
    SUBCASE("values live across a call are spilled") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto call = graph.append(b0, {}, {Operand{v1}});
        graph.setClobbersRegisters(b0, call);
        graph.append(b0, {Operand{v0, UseKind::kRegister}, Operand{v1, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 2);
        REQUIRE(linearFrame);
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 2, reg(0)}, {2, 4, slot(1)}, {4, 5, reg(1)}}));
        // The result of the call is written after the registers are clobbered.
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 5, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpilledIntervals, 1);
    }

    SUBCASE("call arguments may come from memory") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto call = graph.append(b0, {Operand{v0}}, {});
        graph.setClobbersRegisters(b0, call);

        auto linearFrame = allocateRegisters(&graph, 1);
        REQUIRE(linearFrame);
        auto location = linearFrame->locationAt(v0, 2);
        REQUIRE(location);
        CHECK(location->isSpill());
    }

    SUBCASE("register operand of a call is impossible") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto call = graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});
        graph.setClobbersRegisters(b0, call);

        CHECK(allocateRegisters(&graph, 4) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kAllocationImpossible));
    }
}

TEST_CASE("RegisterAllocator too many register operands") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Graph graph(errorReporter);
    auto v0 = graph.newVirtualRegister();
    auto v1 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    graph.setEntry(b0);
    graph.append(b0, {}, {Operand{v0}});
    graph.append(b0, {}, {Operand{v1}});
    graph.append(b0, {Operand{v0, UseKind::kRegister}, Operand{v1, UseKind::kRegister}}, {});

    CHECK(allocateRegisters(&graph, 1) == nullptr);
    REQUIRE_EQ(errorReporter->errorCount(), 1);
    CHECK_EQ(errorReporter->errors()[0].code, ErrorCode::kAllocationImpossible);
}

} // namespace lsra
