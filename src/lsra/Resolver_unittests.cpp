#include "lsra/Resolver.hpp"

#include "lsra/BlockSerializer.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LifetimeAnalyzer.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/RegisterAllocator.hpp"
#include "lsra/Validator.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <vector>

namespace {

lsra::Location reg(int32_t n) { return lsra::Location::makeRegister(n); }
lsra::Location slot(int32_t n) { return lsra::Location::makeSpill(n); }

// Runs every stage before the Resolver.
std::unique_ptr<lsra::LinearFrame> allocateRegisters(lsra::Graph* graph, int32_t numberOfRegisters) {
    lsra::BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph);
    REQUIRE(linearFrame);
    lsra::LifetimeAnalyzer analyzer(graph->errorReporter());
    REQUIRE(analyzer.buildLifetimes(graph, linearFrame.get(), 0));
    lsra::RegisterAllocator allocator(numberOfRegisters, graph->errorReporter());
    REQUIRE(allocator.allocateRegisters(linearFrame.get()));
    return linearFrame;
}

// Makes an interval piece of |vReg| over [from, to), with usages at the given positions.
lsra::LifetimeInterval makePiece(lsra::VReg vReg, lsra::Position from, lsra::Position to, lsra::Location location,
        const std::vector<lsra::Position>& usages) {
    lsra::LifetimeInterval piece(vReg);
    piece.addLiveRange(from, to);
    for (auto usage : usages) {
        piece.addUsage(usage, lsra::UseKind::kAny);
    }
    if (location.isSpill()) {
        piece.isSpill = true;
        piece.spillSlot = location.number;
    } else {
        piece.registerNumber = location.number;
    }
    return piece;
}

} // namespace

namespace lsra {

TEST_CASE("Resolver edges") {
    SUBCASE("value spilled on one path is reloaded before the merge") {
        // Block 0 defines R, then branches to 1 which does nothing and to 2 which needs the only register for T.
        // Both paths join at 3, which needs R in a register.
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto r = graph.newVirtualRegister();
        auto t = graph.newVirtualRegister();
        for (int i = 0; i < 4; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.addEdge(1, 3);
        graph.addEdge(2, 3);
        graph.append(0, {}, {Operand{r}});
        graph.append(1, {}, {});
        graph.append(2, {}, {Operand{t}});
        graph.append(2, {Operand{t, UseKind::kRegister}}, {});
        graph.append(3, {Operand{r, UseKind::kRegister}}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));

        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 1);
        const auto& resolution = linearFrame->edgeResolutions[0];
        CHECK_EQ(resolution.from, 2);
        CHECK_EQ(resolution.to, 3);
        CHECK_EQ(resolution.placement, EdgeResolution::Placement::kPredecessorExit);
        REQUIRE_EQ(resolution.moves.size(), 1);
        CHECK(resolution.moves[0] == Move{slot(1), reg(0), r});

        // R is stored to its spill slot before T is written.
        REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
        REQUIRE(linearFrame->splitMoves.count(4));
        REQUIRE_EQ(linearFrame->splitMoves[4].size(), 1);
        CHECK(linearFrame->splitMoves[4][0] == Move{reg(0), slot(1), r});
    }

    SUBCASE("placement of moves") {
        // 0 -> 1 (loop header) -> 2 (loop body), 2 -> 1 and 2 -> 3. The body calls a function, so the value used
        // in the header is spilled there, and the back edge is critical.
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        for (int i = 0; i < 4; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(1, 2);
        graph.addEdge(2, 1);
        graph.addEdge(2, 3);
        graph.append(0, {}, {Operand{v0}});
        graph.append(1, {Operand{v0, UseKind::kRegister}}, {});
        auto call = graph.append(2, {}, {});
        graph.setClobbersRegisters(2, call);
        graph.append(3, {}, {});

        auto linearFrame = allocateRegisters(&graph, 1);
        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));

        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 2);
        const auto& toBody = linearFrame->edgeResolutions[0];
        CHECK_EQ(toBody.from, 1);
        CHECK_EQ(toBody.to, 2);
        CHECK_EQ(toBody.placement, EdgeResolution::Placement::kPredecessorExit);
        REQUIRE_EQ(toBody.moves.size(), 1);
        CHECK(toBody.moves[0] == Move{reg(0), slot(1), v0});

        const auto& backEdge = linearFrame->edgeResolutions[1];
        CHECK_EQ(backEdge.from, 2);
        CHECK_EQ(backEdge.to, 1);
        CHECK_EQ(backEdge.placement, EdgeResolution::Placement::kCriticalEdge);
        REQUIRE_EQ(backEdge.moves.size(), 1);
        CHECK(backEdge.moves[0] == Move{slot(1), reg(0), v0});
        CHECK(linearFrame->splitMoves.empty());
    }

    SUBCASE("move to successor entry") {
        // Block 0 branches to 1 and 2, 1 has only block 0 as predecessor.
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        graph.newBlock();
        graph.newBlock();
        graph.newBlock();
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.append(0, {}, {Operand{v0}});
        graph.append(1, {Operand{v0}}, {});
        graph.append(2, {}, {});

        BlockSerializer serializer(graph.errorReporter());
        auto linearFrame = serializer.serialize(&graph);
        REQUIRE(linearFrame);
        linearFrame->valueLifetimes[v0].clear();
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 1, 2, reg(0), {1}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 2, 3, reg(1), {2}));
        linearFrame->liveIns[1] = {v0};

        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));
        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 1);
        CHECK_EQ(linearFrame->edgeResolutions[0].placement, EdgeResolution::Placement::kSuccessorEntry);
        REQUIRE_EQ(linearFrame->edgeResolutions[0].moves.size(), 1);
        CHECK(linearFrame->edgeResolutions[0].moves[0] == Move{reg(0), reg(1), v0});
    }

    SUBCASE("swap across an edge uses the scratch slot") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        graph.newBlock();
        graph.newBlock();
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.append(0, {}, {Operand{v0}, Operand{v1}});
        graph.append(1, {Operand{v0}, Operand{v1}}, {});

        BlockSerializer serializer(graph.errorReporter());
        auto linearFrame = serializer.serialize(&graph);
        REQUIRE(linearFrame);
        linearFrame->valueLifetimes[v0].clear();
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 1, 2, reg(0), {1}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 2, 3, reg(1), {2}));
        linearFrame->valueLifetimes[v1].clear();
        linearFrame->valueLifetimes[v1].emplace_back(makePiece(v1, 1, 2, reg(1), {1}));
        linearFrame->valueLifetimes[v1].emplace_back(makePiece(v1, 2, 3, reg(0), {2}));
        linearFrame->liveIns[1] = {v0, v1};

        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));
        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 1);
        const auto& moves = linearFrame->edgeResolutions[0].moves;
        REQUIRE_EQ(moves.size(), 3);
        CHECK(moves[0] == Move{reg(0), slot(kScratchSpillSlot), v0});
        CHECK(moves[1] == Move{reg(1), reg(0), v1});
        CHECK(moves[2] == Move{slot(kScratchSpillSlot), reg(1), v0});
    }

    SUBCASE("value without a location is an internal error") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        graph.newBlock();
        graph.newBlock();
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.append(0, {}, {});
        graph.append(1, {}, {});

        BlockSerializer serializer(graph.errorReporter());
        auto linearFrame = serializer.serialize(&graph);
        REQUIRE(linearFrame);
        linearFrame->valueLifetimes[v0].clear();
        linearFrame->liveIns[1] = {v0};

        Resolver resolver;
        CHECK(!resolver.resolve(&graph, linearFrame.get()));
    }
}

TEST_CASE("Resolver splits inside a block") {
    Graph graph(std::make_shared<ErrorReporter>(true));
    auto v0 = graph.newVirtualRegister();
    auto v1 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    graph.setEntry(b0);
    graph.append(b0, {}, {Operand{v0}, Operand{v1}});
    graph.append(b0, {Operand{v0}}, {Operand{v1}});
    graph.append(b0, {Operand{v0}, Operand{v1}}, {});

    BlockSerializer serializer(graph.errorReporter());
    auto linearFrame = serializer.serialize(&graph);
    REQUIRE(linearFrame);
    // v0 moves from a register to a spill slot between instructions.
    linearFrame->valueLifetimes[v0].clear();
    linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 1, 4, reg(0), {1, 2}));
    linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 4, 5, slot(1), {4}));
    // v1 is redefined at 3 into another register, which needs no move.
    linearFrame->valueLifetimes[v1].clear();
    linearFrame->valueLifetimes[v1].emplace_back(makePiece(v1, 1, 3, reg(1), {1}));
    linearFrame->valueLifetimes[v1].emplace_back(makePiece(v1, 3, 5, reg(2), {3, 4}));
    linearFrame->numberOfSpillSlots = 2;

    Resolver resolver;
    REQUIRE(resolver.resolve(&graph, linearFrame.get()));
    CHECK(Validator::validateResolution(&graph, linearFrame.get()));
    CHECK(linearFrame->edgeResolutions.empty());
    REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
    REQUIRE(linearFrame->splitMoves.count(4));
    REQUIRE_EQ(linearFrame->splitMoves[4].size(), 1);
    CHECK(linearFrame->splitMoves[4][0] == Move{reg(0), slot(1), v0});
}

TEST_CASE("Resolver value split twice around one instruction") {
    Graph graph(std::make_shared<ErrorReporter>(true));
    auto v0 = graph.newVirtualRegister();
    auto v1 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    graph.setEntry(b0);
    graph.append(b0, {}, {Operand{v0}});
    graph.append(b0, {}, {});
    graph.append(b0, {Operand{v0, UseKind::kRegister}}, {Operand{v1, UseKind::kRegister}});
    graph.append(b0, {Operand{v1, UseKind::kRegister}}, {});
    graph.append(b0, {Operand{v0}}, {});

    BlockSerializer serializer(graph.errorReporter());
    auto linearFrame = serializer.serialize(&graph);
    REQUIRE(linearFrame);
    // v1 takes the register v0 was loaded into as soon as the instruction at 4 has read v0, so v0 holds the register
    // for the single position 4.
    linearFrame->valueLifetimes[v1].clear();
    linearFrame->valueLifetimes[v1].emplace_back(makePiece(v1, 5, 7, reg(0), {5, 6}));
    linearFrame->numberOfSpillSlots = 2;

    SUBCASE("reload from the slot still holding the value") {
        linearFrame->valueLifetimes[v0].clear();
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 1, 4, slot(1), {1}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 4, 5, reg(0), {4}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 5, 9, slot(1), {8}));

        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));
        REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
        REQUIRE_EQ(linearFrame->splitMoves[4].size(), 1);
        CHECK(linearFrame->splitMoves[4][0] == Move{slot(1), reg(0), v0});
    }

    SUBCASE("both moves copy from the register held before") {
        linearFrame->valueLifetimes[v0].clear();
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 1, 4, reg(1), {1}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 4, 5, reg(0), {4}));
        linearFrame->valueLifetimes[v0].emplace_back(makePiece(v0, 5, 9, slot(1), {8}));

        Resolver resolver;
        REQUIRE(resolver.resolve(&graph, linearFrame.get()));
        CHECK(Validator::validateResolution(&graph, linearFrame.get()));
        REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
        REQUIRE_EQ(linearFrame->splitMoves[4].size(), 2);
        CHECK(linearFrame->splitMoves[4][0] == Move{reg(1), reg(0), v0});
        CHECK(linearFrame->splitMoves[4][1] == Move{reg(1), slot(1), v0});
    }
}

} // namespace lsra
