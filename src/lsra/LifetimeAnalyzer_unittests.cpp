#include "lsra/LifetimeAnalyzer.hpp"

#include "lsra/BlockSerializer.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/Validator.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace {

// Serializes |graph| and builds lifetimes for |registerClass|, returning nullptr if the analysis fails.
std::unique_ptr<lsra::LinearFrame> buildLifetimes(lsra::Graph* graph, int32_t registerClass = 0) {
    lsra::BlockSerializer serializer(graph->errorReporter());
    auto linearFrame = serializer.serialize(graph);
    REQUIRE(linearFrame);
    lsra::LifetimeAnalyzer analyzer(graph->errorReporter());
    if (!analyzer.buildLifetimes(graph, linearFrame.get(), registerClass)) {
        return nullptr;
    }
    CHECK(lsra::Validator::validateLifetimes(graph, linearFrame.get(), registerClass));
    return linearFrame;
}

std::vector<std::pair<lsra::Position, lsra::Position>> rangesOf(const lsra::LifetimeInterval& lifetime) {
    std::vector<std::pair<lsra::Position, lsra::Position>> ranges;
    for (const auto& range : lifetime.ranges) {
        ranges.emplace_back(std::make_pair(range.from, range.to));
    }
    return ranges;
}

using Ranges = std::vector<std::pair<lsra::Position, lsra::Position>>;

} // namespace

namespace lsra {

TEST_CASE("LifetimeAnalyzer single block") {
    SUBCASE("defs and uses") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1, UseKind::kRegister}});
        graph.append(b0, {Operand{v0, UseKind::kRegister}, Operand{v1}}, {Operand{v2}});
        graph.append(b0, {Operand{v2, UseKind::kAny, true}}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        REQUIRE_EQ(linearFrame->valueLifetimes.size(), 3);

        const auto& lt0 = linearFrame->valueLifetimes[0][0];
        CHECK_EQ(rangesOf(lt0), Ranges({{1, 5}}));
        CHECK_EQ(lt0.usages.size(), 2);
        CHECK_EQ(lt0.usages.at(1), UseKind::kAny);
        CHECK_EQ(lt0.usages.at(4), UseKind::kRegister);
        CHECK_EQ(lt0.nextRegisterUse(0), 4);

        const auto& lt1 = linearFrame->valueLifetimes[1][0];
        CHECK_EQ(rangesOf(lt1), Ranges({{3, 5}}));
        CHECK_EQ(lt1.usages.at(3), UseKind::kRegister);
        CHECK_EQ(lt1.usages.at(4), UseKind::kAny);

        const auto& lt2 = linearFrame->valueLifetimes[2][0];
        CHECK_EQ(rangesOf(lt2), Ranges({{5, 7}}));
        CHECK_EQ(lt2.nextRegisterUse(0), kMaxPosition);

        CHECK(linearFrame->liveIns[0].empty());
    }

    SUBCASE("temporaries") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto t0 = graph.newVirtualRegister();
        auto f0 = graph.newVirtualRegister(1);
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        auto i1 = graph.append(b0, {Operand{v0}}, {});
        REQUIRE(graph.addTemporary(b0, i1, t0));
        REQUIRE(graph.addTemporary(b0, i1, f0));

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        // Only the instruction's own position, overlapping its inputs but not its outputs.
        const auto& lt1 = linearFrame->valueLifetimes[t0][0];
        CHECK_EQ(rangesOf(lt1), Ranges({{2, 3}}));
        REQUIRE_EQ(lt1.usages.size(), 1);
        CHECK_EQ(lt1.usages.at(2), UseKind::kRegister);
        CHECK(linearFrame->valueLifetimes[f0][0].isEmpty());
        CHECK(linearFrame->liveIns[0].empty());
    }

    SUBCASE("unused def") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {});
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[0][0]), Ranges({{3, 4}}));
        CHECK_EQ(linearFrame->valueLifetimes[0][0].usages.size(), 1);
    }

    SUBCASE("undeclared value stays empty") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v1}});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK(linearFrame->valueLifetimes[0][0].isEmpty());
        CHECK(!linearFrame->valueLifetimes[1][0].isEmpty());
    }

    SUBCASE("redefinition leaves a hole") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {Operand{v0}}, {});
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {Operand{v0}}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        const auto& lt = linearFrame->valueLifetimes[0][0];
        CHECK_EQ(rangesOf(lt), Ranges({{1, 3}, {5, 7}}));
        CHECK_EQ(lt.usages.size(), 4);
        CHECK(!lt.covers(4));
    }

    SUBCASE("read and write of same value in one instruction") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {Operand{v0, UseKind::kAny, true}}, {Operand{v0}});
        graph.append(b0, {Operand{v0}}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[0][0]), Ranges({{1, 5}}));
        CHECK_EQ(linearFrame->valueLifetimes[0][0].usages.size(), 4);
    }
}

TEST_CASE("LifetimeAnalyzer control flow") {
    SUBCASE("value live on one side of a diamond") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        for (int i = 0; i < 4; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.addEdge(1, 3);
        graph.addEdge(2, 3);
        graph.append(0, {}, {Operand{v0}});
        graph.append(1, {}, {});
        graph.append(2, {Operand{v0}}, {});
        graph.append(3, {}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[0][0]), Ranges({{1, 2}, {4, 5}}));
        CHECK(linearFrame->liveIns[1].empty());
        CHECK_EQ(linearFrame->liveIns[2], std::set<VReg>({v0}));
        CHECK(linearFrame->liveIns[3].empty());
    }

    SUBCASE("value live through a block") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister();
        for (int i = 0; i < 3; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(1, 2);
        graph.append(0, {}, {Operand{v0}});
        graph.append(1, {}, {});
        graph.append(1, {}, {});
        graph.append(2, {Operand{v0}}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[0][0]), Ranges({{1, 7}}));
        CHECK_EQ(linearFrame->liveIns[1], std::set<VReg>({v0}));
        CHECK_EQ(linearFrame->liveIns[2], std::set<VReg>({v0}));
    }

    SUBCASE("value defined before loop and used inside it lives to the loop end") {
        // 0 defines the value, 1 is the loop header, 2 the loop body reading the value early on, and 3 the exit.
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
        graph.append(1, {}, {});
        graph.append(2, {Operand{v0, UseKind::kRegister}}, {Operand{v1}});
        graph.append(2, {Operand{v1}}, {});
        graph.append(2, {}, {});
        graph.append(3, {}, {});

        auto linearFrame = buildLifetimes(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
        CHECK_EQ(linearFrame->loopEnds[1], 10);

        // The last read is at 4, but the value must survive the trip around the back edge.
        const auto& lt0 = linearFrame->valueLifetimes[0][0];
        CHECK_EQ(rangesOf(lt0), Ranges({{1, 10}}));
        CHECK_EQ(lt0.nextRegisterUse(0), 4);
        CHECK_EQ(linearFrame->liveIns[1], std::set<VReg>({v0}));
        CHECK_EQ(linearFrame->liveIns[2], std::set<VReg>({v0}));
        CHECK(linearFrame->liveIns[3].empty());

        // Values local to the loop body are not extended.
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[1][0]), Ranges({{5, 7}}));
    }
}

TEST_CASE("LifetimeAnalyzer errors and register classes") {
    SUBCASE("use before def in a single block") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {Operand{v0}}, {});
        graph.append(b0, {}, {Operand{v0}});

        CHECK(buildLifetimes(&graph) == nullptr);
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].code, ErrorCode::kUseBeforeDef);
    }

    SUBCASE("use before def on one path") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        for (int i = 0; i < 4; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.addEdge(1, 3);
        graph.addEdge(2, 3);
        graph.append(1, {}, {Operand{v0}});
        graph.append(3, {Operand{v0}}, {});

        CHECK(buildLifetimes(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kUseBeforeDef));
    }

    SUBCASE("only the configured register class is analyzed") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister(0);
        auto f0 = graph.newVirtualRegister(1);
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}, Operand{f0}});
        graph.append(b0, {Operand{v0}, Operand{f0}}, {});

        auto linearFrame = buildLifetimes(&graph, 0);
        REQUIRE(linearFrame);
        CHECK_EQ(rangesOf(linearFrame->valueLifetimes[0][0]), Ranges({{1, 3}}));
        CHECK(linearFrame->valueLifetimes[1][0].isEmpty());
    }

    SUBCASE("other classes ignored when checking use before def") {
        Graph graph(std::make_shared<ErrorReporter>(true));
        auto v0 = graph.newVirtualRegister(0);
        auto f0 = graph.newVirtualRegister(1);
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {Operand{f0}}, {Operand{v0}});

        auto linearFrame = buildLifetimes(&graph, 0);
        REQUIRE(linearFrame);
        CHECK(linearFrame->valueLifetimes[1][0].isEmpty());
    }
}

} // namespace lsra
