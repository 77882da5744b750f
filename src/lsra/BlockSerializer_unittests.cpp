#include "lsra/BlockSerializer.hpp"

#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/Validator.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <utility>
#include <vector>

namespace {

// Builds a graph of |numberOfBlocks| blocks, each holding a single instruction without operands, entered at block 0.
std::unique_ptr<lsra::Graph> buildGraph(int32_t numberOfBlocks,
        const std::vector<std::pair<lsra::Block::ID, lsra::Block::ID>>& edges) {
    auto graph = std::make_unique<lsra::Graph>(std::make_shared<lsra::ErrorReporter>(true));
    for (int32_t i = 0; i < numberOfBlocks; ++i) {
        auto blockId = graph->newBlock();
        REQUIRE_EQ(graph->append(blockId, {}, {}), 0);
    }
    REQUIRE(graph->setEntry(0));
    for (const auto& edge : edges) {
        REQUIRE(graph->addEdge(edge.first, edge.second));
    }
    return graph;
}

} // namespace

namespace lsra {

TEST_CASE("BlockSerializer base cases") {
    SUBCASE("single block") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {Operand{v0}}, {});
        graph.append(b0, {}, {});
        REQUIRE(graph.setEntry(b0));

        BlockSerializer serializer(errorReporter);
        auto linearFrame = serializer.serialize(&graph);
        REQUIRE(linearFrame);
        CHECK(graph.isFrozen());
        REQUIRE(Validator::validateLinearFrame(&graph, linearFrame.get()));

        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0}));
        CHECK_EQ(linearFrame->blockRanges[0].from, 0);
        CHECK_EQ(linearFrame->blockRanges[0].to, 6);
        CHECK_EQ(linearFrame->blockRanges[0].last(), 4);
        CHECK_EQ(linearFrame->numberOfPositions(), 6);
        CHECK(linearFrame->instructionAt(0) == &graph.block(0)->instructions[0]);
        CHECK(linearFrame->instructionAt(4) == &graph.block(0)->instructions[2]);
        CHECK(linearFrame->instructionAt(6) == nullptr);
        CHECK(linearFrame->isBlockStart(0));
        CHECK(!linearFrame->isBlockStart(2));
        CHECK(linearFrame->loopEdges.empty());
        CHECK(linearFrame->loopBlocks.empty());
        CHECK_EQ(linearFrame->loopDepths[0], 0);
        CHECK_EQ(linearFrame->loopEnds[0], kInvalidPosition);
        REQUIRE_EQ(linearFrame->valueLifetimes.size(), 1);
        REQUIRE_EQ(linearFrame->valueLifetimes[0].size(), 1);
        CHECK(linearFrame->valueLifetimes[0][0].isEmpty());
        CHECK_EQ(linearFrame->valueLifetimes[0][0].valueNumber, 0);
        CHECK_EQ(errorReporter->errorCount(), 0);
    }

    SUBCASE("empty blocks occupy one position") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto b0 = graph.newBlock();
        auto b1 = graph.newBlock();
        REQUIRE(graph.setEntry(b0));
        REQUIRE(graph.addEdge(b0, b1));

        BlockSerializer serializer(errorReporter);
        auto linearFrame = serializer.serialize(&graph);
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(&graph, linearFrame.get()));
        CHECK_EQ(linearFrame->numberOfPositions(), 4);
        CHECK_EQ(linearFrame->blockRanges[1].from, 2);
        CHECK_EQ(linearFrame->blockRanges[1].to, 4);
        CHECK(linearFrame->instructionAt(0) == nullptr);
        CHECK(linearFrame->instructionAt(2) == nullptr);
        CHECK(linearFrame->isBlockStart(2));
        CHECK_EQ(linearFrame->lineBlocks, std::vector<Block::ID>({0, 1}));
    }

    SUBCASE("no entry block") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        graph.newBlock();
        BlockSerializer serializer(errorReporter);
        CHECK(serializer.serialize(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kUnreachableBlock));
    }

    SUBCASE("unreachable blocks") {
        auto graph = buildGraph(4, {{0, 1}, {2, 3}, {3, 1}});
        auto errorReporter = graph->errorReporter();
        BlockSerializer serializer(errorReporter);
        CHECK(serializer.serialize(graph.get()) == nullptr);
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].code, ErrorCode::kUnreachableBlock);
        CHECK(errorReporter->errors()[0].message.find("2, 3") != std::string::npos);
        // Serialization freezes the graph even when it fails.
        CHECK(graph->isFrozen());
    }
}

TEST_CASE("BlockSerializer acyclic ordering") {
    SUBCASE("diamond") {
        auto graph = buildGraph(4, {{0, 1}, {0, 2}, {1, 3}, {2, 3}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
        CHECK(linearFrame->loopEdges.empty());
    }

    SUBCASE("ready blocks placed in declaration order") {
        // Successors are listed in reverse, placement still follows block identity.
        auto graph = buildGraph(4, {{0, 3}, {0, 2}, {0, 1}, {1, 3}, {2, 3}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
    }

    SUBCASE("block waits for all predecessors") {
        // Block 1 is a successor of the entry but also of block 3, so it must come last.
        auto graph = buildGraph(4, {{0, 1}, {0, 2}, {2, 3}, {3, 1}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 2, 3, 1}));
        CHECK_EQ(linearFrame->blockRanges[1].from, 6);
    }
}

TEST_CASE("BlockSerializer loops") {
    SUBCASE("loop body placed before exit") {
        // 0 -> 1 (header) -> 3 (body) -> 1, and 1 -> 2 (exit). The exit is declared first but the body is nested
        // deeper so it is placed first.
        auto graph = buildGraph(4, {{0, 1}, {1, 2}, {1, 3}, {3, 1}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 3, 2}));
        REQUIRE_EQ(linearFrame->loopEdges.size(), 1);
        CHECK_EQ(linearFrame->loopEdges[0], std::make_pair(3, 1));
        CHECK_EQ(linearFrame->loopDepths, std::vector<int32_t>({0, 1, 0, 1}));
        REQUIRE_EQ(linearFrame->loopBlocks.size(), 1);
        CHECK_EQ(linearFrame->loopBlocks[1], std::vector<Block::ID>({1, 3}));
        CHECK_EQ(linearFrame->loopEnds[1], linearFrame->blockRanges[3].to);
        CHECK_EQ(linearFrame->loopEnds[0], kInvalidPosition);
        CHECK_EQ(linearFrame->loopEnds[3], kInvalidPosition);
    }

    SUBCASE("self loop") {
        auto graph = buildGraph(3, {{0, 1}, {1, 1}, {1, 2}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2}));
        REQUIRE_EQ(linearFrame->loopEdges.size(), 1);
        CHECK_EQ(linearFrame->loopEdges[0], std::make_pair(1, 1));
        CHECK_EQ(linearFrame->loopBlocks[1], std::vector<Block::ID>({1}));
        CHECK_EQ(linearFrame->loopEnds[1], 4);
    }

    SUBCASE("nested loops") {
        // 0 entry, 1 outer header, 2 inner header, 3 inner body, 4 outer latch, 5 exit.
        auto graph = buildGraph(6, {{0, 1}, {1, 2}, {1, 5}, {2, 3}, {2, 4}, {3, 2}, {4, 1}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3, 4, 5}));
        REQUIRE_EQ(linearFrame->loopEdges.size(), 2);
        CHECK_EQ(linearFrame->loopEdges[0], std::make_pair(3, 2));
        CHECK_EQ(linearFrame->loopEdges[1], std::make_pair(4, 1));
        CHECK_EQ(linearFrame->loopDepths, std::vector<int32_t>({0, 1, 2, 2, 1, 0}));
        CHECK_EQ(linearFrame->loopBlocks[1], std::vector<Block::ID>({1, 2, 3, 4}));
        CHECK_EQ(linearFrame->loopBlocks[2], std::vector<Block::ID>({2, 3}));
        CHECK_EQ(linearFrame->loopEnds[2], 8);
        CHECK_EQ(linearFrame->loopEnds[1], 10);
    }

    SUBCASE("two back edges to one header") {
        // 1 -> 2 -> 1 and 1 -> 3 -> 1 form a single loop.
        auto graph = buildGraph(5, {{0, 1}, {1, 2}, {1, 3}, {2, 1}, {3, 1}, {1, 4}});
        BlockSerializer serializer(graph->errorReporter());
        auto linearFrame = serializer.serialize(graph.get());
        REQUIRE(linearFrame);
        REQUIRE(Validator::validateLinearFrame(graph.get(), linearFrame.get()));
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3, 4}));
        CHECK_EQ(linearFrame->loopEdges.size(), 2);
        REQUIRE_EQ(linearFrame->loopBlocks.size(), 1);
        CHECK_EQ(linearFrame->loopBlocks[1], std::vector<Block::ID>({1, 2, 3}));
        CHECK_EQ(linearFrame->loopEnds[1], linearFrame->blockRanges[3].to);
    }
}

} // namespace lsra
