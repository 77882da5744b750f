#include "lsra/Validator.hpp"

#include "lsra/BlockSerializer.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LifetimeAnalyzer.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/RegisterAllocator.hpp"
#include "lsra/Resolver.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace {

// Single block defining two values and then reading both from registers.
std::unique_ptr<lsra::Graph> buildStraightLine() {
    auto graph = std::make_unique<lsra::Graph>(std::make_shared<lsra::ErrorReporter>(true));
    auto v0 = graph->newVirtualRegister();
    auto v1 = graph->newVirtualRegister();
    auto b0 = graph->newBlock();
    graph->setEntry(b0);
    graph->append(b0, {}, {lsra::Operand{v0}});
    graph->append(b0, {}, {lsra::Operand{v1}});
    graph->append(b0, {lsra::Operand{v0, lsra::UseKind::kRegister}, lsra::Operand{v1, lsra::UseKind::kRegister}}, {});
    return graph;
}

// Block 0 defines a value that block 1 reads.
std::unique_ptr<lsra::Graph> buildTwoBlocks() {
    auto graph = std::make_unique<lsra::Graph>(std::make_shared<lsra::ErrorReporter>(true));
    auto v0 = graph->newVirtualRegister();
    auto b0 = graph->newBlock();
    auto b1 = graph->newBlock();
    graph->setEntry(b0);
    graph->addEdge(b0, b1);
    graph->append(b0, {}, {lsra::Operand{v0}});
    graph->append(b1, {lsra::Operand{v0}}, {});
    return graph;
}

std::unique_ptr<lsra::LinearFrame> analyze(lsra::Graph* graph) {
    lsra::BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph);
    REQUIRE(linearFrame);
    lsra::LifetimeAnalyzer analyzer(graph->errorReporter());
    REQUIRE(analyzer.buildLifetimes(graph, linearFrame.get(), 0));
    return linearFrame;
}

} // namespace

namespace lsra {

TEST_CASE("Validator linear frame") {
    auto graph = buildTwoBlocks();
    BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph.get());
    REQUIRE(linearFrame);
    REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));

    SUBCASE("blocks out of order") {
        linearFrame->blockOrder = {1, 0};
        CHECK(!Validator::validateLinearFrame(graph.get(), linearFrame.get()));
    }

    SUBCASE("block serialized twice") {
        linearFrame->blockOrder = {0, 0};
        CHECK(!Validator::validateLinearFrame(graph.get(), linearFrame.get()));
    }

    SUBCASE("gap between blocks") {
        linearFrame->blockRanges[1].from = 4;
        CHECK(!Validator::validateLinearFrame(graph.get(), linearFrame.get()));
    }

    SUBCASE("position attributed to the wrong block") {
        linearFrame->lineBlocks[1] = 0;
        CHECK(!Validator::validateLinearFrame(graph.get(), linearFrame.get()));
    }

    SUBCASE("lifetimes already built") {
        linearFrame->valueLifetimes[0][0].addLiveRange(1, 3);
        CHECK(!Validator::validateLinearFrame(graph.get(), linearFrame.get()));
    }
}

TEST_CASE("Validator lifetimes") {
    auto graph = buildStraightLine();
    auto linearFrame = analyze(graph.get());
    REQUIRE(Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));

    SUBCASE("missing usage") {
        linearFrame->valueLifetimes[0][0].usages.erase(4);
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));
    }

    SUBCASE("lifetime ends before last read") {
        linearFrame->valueLifetimes[1][0].ranges.back().to = 4;
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));
    }

    SUBCASE("usage outside of lifetime") {
        linearFrame->valueLifetimes[1][0].usages.emplace(0, UseKind::kAny);
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));
    }

    SUBCASE("values of another class have no lifetime") {
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 1));
    }

    SUBCASE("spill slots assigned early") {
        linearFrame->numberOfSpillSlots = 2;
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));
    }

    SUBCASE("entry block with live ins") {
        linearFrame->liveIns[0].insert(0);
        CHECK(!Validator::validateLifetimes(graph.get(), linearFrame.get(), 0));
    }
}

TEST_CASE("Validator allocation") {
    auto graph = buildStraightLine();
    auto linearFrame = analyze(graph.get());
    RegisterAllocator allocator(2, graph->errorReporter());
    REQUIRE(allocator.allocateRegisters(linearFrame.get()));
    REQUIRE(Validator::validateAllocation(linearFrame.get(), 2));
    REQUIRE_EQ(linearFrame->valueLifetimes[0].size(), 1);
    REQUIRE_EQ(linearFrame->valueLifetimes[1].size(), 1);
    auto& v0 = linearFrame->valueLifetimes[0][0];
    auto& v1 = linearFrame->valueLifetimes[1][0];
    CHECK_NE(v0.registerNumber, v1.registerNumber);

    SUBCASE("two values in one register") {
        v1.registerNumber = v0.registerNumber;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }

    SUBCASE("register out of range") {
        v1.registerNumber = 2;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }

    SUBCASE("register use served from a spill slot") {
        v1.isSpill = true;
        v1.spillSlot = 1;
        linearFrame->numberOfSpillSlots = 2;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }

    SUBCASE("value in the scratch slot") {
        v1.isSpill = true;
        v1.spillSlot = kScratchSpillSlot;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }

    SUBCASE("pieces overlap") {
        auto piece = v0;
        linearFrame->valueLifetimes[0].emplace_back(piece);
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }

    SUBCASE("value held across a call") {
        Instruction call = *linearFrame->lineNumbers[1];
        call.clobbersRegisters = true;
        linearFrame->lineNumbers[1] = &call;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 2));
    }
}

TEST_CASE("Validator resolution") {
    auto graph = buildTwoBlocks();
    BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph.get());
    REQUIRE(linearFrame);

    // The value changes register across the edge.
    LifetimeInterval atExit(0);
    atExit.addLiveRange(1, 2);
    atExit.addUsage(1, UseKind::kAny);
    atExit.registerNumber = 0;
    LifetimeInterval atEntry(0);
    atEntry.addLiveRange(2, 3);
    atEntry.addUsage(2, UseKind::kAny);
    atEntry.registerNumber = 1;
    linearFrame->valueLifetimes[0] = {atExit, atEntry};
    linearFrame->liveIns[1] = {0};

    SUBCASE("missing edge moves") {
        CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
    }

    SUBCASE("resolved") {
        Resolver resolver;
        REQUIRE(resolver.resolve(graph.get(), linearFrame.get()));
        CHECK(Validator::validateResolution(graph.get(), linearFrame.get()));

        SUBCASE("move to the wrong register") {
            linearFrame->edgeResolutions[0].moves[0].to = Location::makeRegister(2);
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }

        SUBCASE("move reads the wrong location") {
            linearFrame->edgeResolutions[0].moves[0].from = Location::makeRegister(3);
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }

        SUBCASE("wrong placement") {
            linearFrame->edgeResolutions[0].placement = EdgeResolution::Placement::kCriticalEdge;
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }

        SUBCASE("resolution for a missing edge") {
            auto resolution = linearFrame->edgeResolutions[0];
            resolution.from = 1;
            resolution.to = 0;
            linearFrame->edgeResolutions.emplace_back(resolution);
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }

        SUBCASE("stray split moves") {
            linearFrame->splitMoves[2].emplace_back(Move{Location::makeRegister(1), Location::makeSpill(1), 0});
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }
    }
}

TEST_CASE("Validator split resolution") {
    auto graph = buildStraightLine();
    auto linearFrame = analyze(graph.get());
    // v0 is spilled after its definition and reloaded for the read at 4.
    auto pieces = linearFrame->valueLifetimes[0][0].splitAt(2);
    auto reload = pieces.splitAt(4);
    linearFrame->valueLifetimes[0][0].registerNumber = 0;
    pieces.isSpill = true;
    pieces.spillSlot = 1;
    reload.registerNumber = 0;
    linearFrame->valueLifetimes[0].emplace_back(pieces);
    linearFrame->valueLifetimes[0].emplace_back(reload);
    linearFrame->valueLifetimes[1][0].registerNumber = 1;
    linearFrame->numberOfSpillSlots = 2;
    REQUIRE(Validator::validateAllocation(linearFrame.get(), 2));

    SUBCASE("missing split moves") {
        CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
    }

    SUBCASE("resolved") {
        Resolver resolver;
        REQUIRE(resolver.resolve(graph.get(), linearFrame.get()));
        CHECK(linearFrame->edgeResolutions.empty());
        CHECK_EQ(linearFrame->splitMoves.size(), 2);
        CHECK(Validator::validateResolution(graph.get(), linearFrame.get()));

        SUBCASE("reload overwrites another value") {
            linearFrame->splitMoves[4][0].to = Location::makeRegister(1);
            CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
        }
    }
}

TEST_CASE("Validator spill slot reuse") {
    // v0 is read at 2 by the instruction that defines v2. With a single register v1 is spilled at 3 to make room for
    // v2, and its store into a slot happens in the gap before 2.
    auto graph = std::make_unique<Graph>(std::make_shared<ErrorReporter>(true));
    auto v0 = graph->newVirtualRegister();
    auto v1 = graph->newVirtualRegister();
    auto v2 = graph->newVirtualRegister();
    auto b0 = graph->newBlock();
    graph->setEntry(b0);
    graph->append(b0, {}, {Operand{v0}, Operand{v1}});
    graph->append(b0, {Operand{v0}}, {Operand{v2, UseKind::kRegister}});
    graph->append(b0, {Operand{v2, UseKind::kRegister}}, {});
    graph->append(b0, {Operand{v1, UseKind::kRegister}}, {});
    auto linearFrame = analyze(graph.get());
    RegisterAllocator allocator(1, graph->errorReporter());
    REQUIRE(allocator.allocateRegisters(linearFrame.get()));
    REQUIRE(Validator::validateAllocation(linearFrame.get(), 1));

    REQUIRE_EQ(linearFrame->valueLifetimes[v0].size(), 1);
    REQUIRE(linearFrame->valueLifetimes[v0][0].isSpill);
    REQUIRE_EQ(linearFrame->valueLifetimes[v1].size(), 3);
    auto& stored = linearFrame->valueLifetimes[v1][1];
    REQUIRE(stored.isSpill);
    CHECK_EQ(stored.start(), 3);
    CHECK_NE(stored.spillSlot, linearFrame->valueLifetimes[v0][0].spillSlot);

    SUBCASE("slot taken over while the previous value is read") {
        stored.spillSlot = linearFrame->valueLifetimes[v0][0].spillSlot;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 1));
    }

    SUBCASE("value spilled to two slots") {
        auto reload = linearFrame->valueLifetimes[v1][2];
        linearFrame->valueLifetimes[v1][2] = stored.splitAt(4);
        linearFrame->valueLifetimes[v1][2].isSpill = true;
        linearFrame->valueLifetimes[v1][2].spillSlot = linearFrame->numberOfSpillSlots;
        linearFrame->valueLifetimes[v1].emplace_back(reload);
        ++linearFrame->numberOfSpillSlots;
        CHECK(!Validator::validateAllocation(linearFrame.get(), 1));
    }
}

TEST_CASE("Validator value split twice around one instruction") {
    auto graph = std::make_unique<Graph>(std::make_shared<ErrorReporter>(true));
    auto v0 = graph->newVirtualRegister();
    auto v1 = graph->newVirtualRegister();
    auto b0 = graph->newBlock();
    graph->setEntry(b0);
    graph->append(b0, {}, {Operand{v0}});
    graph->append(b0, {Operand{v0, UseKind::kRegister}}, {Operand{v1, UseKind::kRegister}});
    graph->append(b0, {Operand{v1, UseKind::kRegister}, Operand{v0}}, {});
    BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph.get());
    REQUIRE(linearFrame);

    // v0 is reloaded into r0 for the read at 2, and v1 is written to r0 at 3.
    LifetimeInterval before(v0);
    before.addLiveRange(1, 2);
    before.addUsage(1, UseKind::kAny);
    before.isSpill = true;
    before.spillSlot = 1;
    LifetimeInterval loaded(v0);
    loaded.addLiveRange(2, 3);
    loaded.addUsage(2, UseKind::kRegister);
    LifetimeInterval after(v0);
    after.addLiveRange(3, 5);
    after.addUsage(4, UseKind::kAny);
    after.isSpill = true;
    after.spillSlot = 1;
    linearFrame->valueLifetimes[v0] = {before, loaded, after};
    LifetimeInterval defined(v1);
    defined.addLiveRange(3, 5);
    defined.addUsage(3, UseKind::kRegister);
    defined.addUsage(4, UseKind::kRegister);
    linearFrame->valueLifetimes[v1] = {defined};
    linearFrame->numberOfSpillSlots = 2;
    REQUIRE(Validator::validateAllocation(linearFrame.get(), 1));

    SUBCASE("reload alone") {
        linearFrame->splitMoves[2] = {Move{Location::makeSpill(1), Location::makeRegister(0), v0}};
        CHECK(Validator::validateResolution(graph.get(), linearFrame.get()));
    }

    SUBCASE("reload and store treated as a swap") {
        linearFrame->splitMoves[2] = {Move{Location::makeRegister(0), Location::makeSpill(kScratchSpillSlot), v0},
                Move{Location::makeSpill(1), Location::makeRegister(0), v0},
                Move{Location::makeSpill(kScratchSpillSlot), Location::makeSpill(1), v0}};
        CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
    }

    SUBCASE("reload missing") {
        linearFrame->splitMoves[2] = {};
        CHECK(!Validator::validateResolution(graph.get(), linearFrame.get()));
    }
}

} // namespace lsra
