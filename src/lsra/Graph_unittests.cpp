#include "lsra/Graph.hpp"

#include "lsra/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <vector>

namespace lsra {

TEST_CASE("Graph building") {
    SUBCASE("empty graph") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        CHECK_EQ(graph.entry(), Block::kInvalidID);
        CHECK_EQ(graph.numberOfBlocks(), 0);
        CHECK_EQ(graph.numberOfVirtualRegisters(), 0);
        CHECK_EQ(graph.numberOfInstructions(), 0);
        CHECK(!graph.isFrozen());
        CHECK(graph.block(0) == nullptr);
    }

    SUBCASE("identities are dense and in declaration order") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        CHECK_EQ(graph.newVirtualRegister(), 0);
        CHECK_EQ(graph.newVirtualRegister(1), 1);
        CHECK_EQ(graph.newVirtualRegister(), 2);
        CHECK_EQ(graph.registerClass(0), 0);
        CHECK_EQ(graph.registerClass(1), 1);
        CHECK_EQ(graph.newBlock(), 0);
        CHECK_EQ(graph.newBlock(), 1);
        REQUIRE(graph.block(1) != nullptr);
        CHECK_EQ(graph.block(1)->id, 1);
        CHECK_EQ(graph.errorReporter()->errorCount(), 0);
    }

    SUBCASE("instructions and operands") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto b = graph.newBlock();
        REQUIRE(graph.setEntry(b));
        CHECK_EQ(graph.entry(), b);

        auto first = graph.append(b, {}, {Operand{v0, UseKind::kAny}});
        CHECK_EQ(first, 0);
        auto second = graph.append(b, {Operand{v0, UseKind::kRegister, true}}, {});
        CHECK_EQ(second, 1);
        REQUIRE(graph.addDef(b, second, v1, UseKind::kRegister));
        REQUIRE(graph.addUse(b, second, v1));
        REQUIRE(graph.setClobbersRegisters(b, first));
        CHECK_EQ(graph.numberOfInstructions(), 2);

        const auto& instructions = graph.block(b)->instructions;
        REQUIRE_EQ(instructions.size(), 2);
        CHECK(instructions[0].clobbersRegisters);
        CHECK(!instructions[1].clobbersRegisters);
        REQUIRE_EQ(instructions[1].uses.size(), 2);
        CHECK_EQ(instructions[1].uses[0].vReg, v0);
        CHECK_EQ(instructions[1].uses[0].kind, UseKind::kRegister);
        CHECK(instructions[1].uses[0].isKill);
        CHECK_EQ(instructions[1].uses[1].vReg, v1);
        CHECK_EQ(instructions[1].uses[1].kind, UseKind::kAny);
        CHECK(!instructions[1].uses[1].isKill);
        REQUIRE_EQ(instructions[1].defs.size(), 1);
        CHECK_EQ(instructions[1].defs[0].vReg, v1);
        CHECK_EQ(graph.errorReporter()->errorCount(), 0);
    }

    SUBCASE("edges") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto b0 = graph.newBlock();
        auto b1 = graph.newBlock();
        auto b2 = graph.newBlock();
        REQUIRE(graph.addEdge(b0, b1));
        REQUIRE(graph.addEdge(b0, b2));
        REQUIRE(graph.addEdge(b1, b2));
        // Repeated edges are ignored.
        REQUIRE(graph.addEdge(b0, b1));
        REQUIRE(graph.addEdge(b2, b2));

        CHECK_EQ(graph.block(b0)->successors, std::vector<Block::ID>({b1, b2}));
        CHECK(graph.block(b0)->predecessors.empty());
        CHECK_EQ(graph.block(b1)->predecessors, std::vector<Block::ID>({b0}));
        CHECK_EQ(graph.block(b2)->predecessors, std::vector<Block::ID>({b0, b1, b2}));
        CHECK_EQ(graph.block(b2)->successors, std::vector<Block::ID>({b2}));
    }
}

TEST_CASE("Graph invalid references") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Graph graph(errorReporter);
    auto v0 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    graph.append(b0, {}, {Operand{v0}});

    SUBCASE("unknown block") {
        CHECK(!graph.setEntry(3));
        CHECK_EQ(graph.append(-1, {}, {}), Instruction::kInvalidID);
        CHECK(!graph.addEdge(b0, 7));
        CHECK_EQ(errorReporter->errorCount(), 3);
        for (const auto& error : errorReporter->errors()) {
            CHECK_EQ(error.code, ErrorCode::kInvalidReference);
        }
        CHECK_EQ(graph.entry(), Block::kInvalidID);
        CHECK(graph.block(b0)->successors.empty());
    }

    SUBCASE("unknown virtual register") {
        CHECK_EQ(graph.append(b0, {Operand{5}}, {}), Instruction::kInvalidID);
        CHECK_EQ(graph.append(b0, {}, {Operand{kInvalidVReg}}), Instruction::kInvalidID);
        CHECK(!graph.addUse(b0, 0, 1));
        CHECK(!graph.addDef(b0, 0, -2));
        CHECK_EQ(errorReporter->errorCount(), 4);
        CHECK(errorReporter->hasError(ErrorCode::kInvalidReference));
        // Nothing was modified.
        CHECK_EQ(graph.numberOfInstructions(), 1);
        CHECK(graph.block(b0)->instructions[0].uses.empty());
        CHECK_EQ(graph.block(b0)->instructions[0].defs.size(), 1);
    }

    SUBCASE("unknown instruction") {
        CHECK(!graph.addUse(b0, 1, v0));
        CHECK(!graph.setClobbersRegisters(b0, -1));
        CHECK_EQ(errorReporter->errorCount(), 2);
        CHECK(errorReporter->hasError(ErrorCode::kInvalidReference));
    }

    SUBCASE("temporaries") {
        auto t0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto i1 = graph.append(b0, {Operand{v0}}, {Operand{v1}});
        CHECK(graph.addTemporary(b0, i1, t0));
        CHECK_EQ(graph.block(b0)->instructions[1].temporaries, std::vector<VReg>({t0}));
        CHECK_EQ(errorReporter->errorCount(), 0);

        // A temporary is not an operand of any instruction, and belongs to a single instruction.
        CHECK_EQ(graph.append(b0, {Operand{t0}}, {}), Instruction::kInvalidID);
        CHECK(!graph.addDef(b0, 0, t0));
        CHECK(!graph.addTemporary(b0, 0, t0));
        CHECK(!graph.addTemporary(b0, i1, v0));
        CHECK(!graph.addTemporary(b0, 5, graph.newVirtualRegister()));
        CHECK_EQ(errorReporter->errorCount(), 5);
        for (const auto& error : errorReporter->errors()) {
            CHECK_EQ(error.code, ErrorCode::kInvalidReference);
        }
        CHECK_EQ(graph.numberOfInstructions(), 2);
        CHECK(graph.block(b0)->instructions[0].temporaries.empty());
        CHECK_EQ(graph.block(b0)->instructions[1].temporaries.size(), 1);
    }

    SUBCASE("negative register class") {
        CHECK_EQ(graph.newVirtualRegister(-1), kInvalidVReg);
        CHECK_EQ(graph.numberOfVirtualRegisters(), 1);
        CHECK(errorReporter->hasError(ErrorCode::kInvalidReference));
    }
}

TEST_CASE("Graph frozen") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Graph graph(errorReporter);
    auto v0 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    auto i0 = graph.append(b0, {}, {Operand{v0}});
    graph.freeze();
    graph.freeze();
    CHECK(graph.isFrozen());

    CHECK_EQ(graph.newVirtualRegister(), kInvalidVReg);
    CHECK_EQ(graph.newBlock(), Block::kInvalidID);
    CHECK(!graph.setEntry(b0));
    CHECK_EQ(graph.append(b0, {}, {}), Instruction::kInvalidID);
    CHECK(!graph.addUse(b0, i0, v0));
    CHECK(!graph.addDef(b0, i0, v0));
    CHECK(!graph.setClobbersRegisters(b0, i0));
    CHECK(!graph.addEdge(b0, b0));
    CHECK(!graph.addTemporary(b0, i0, v0));

    REQUIRE_EQ(errorReporter->errorCount(), 9);
    for (const auto& error : errorReporter->errors()) {
        CHECK_EQ(error.code, ErrorCode::kGraphFrozen);
    }
    CHECK_EQ(graph.numberOfBlocks(), 1);
    CHECK_EQ(graph.numberOfVirtualRegisters(), 1);
    CHECK_EQ(graph.numberOfInstructions(), 1);
    CHECK(graph.block(b0)->successors.empty());
}

} // namespace lsra
