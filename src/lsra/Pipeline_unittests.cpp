#define LSRA_PIPELINE_VALIDATE 1
#include "lsra/Pipeline.hpp"

#include "lsra/Arch.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using Pieces = std::vector<std::tuple<lsra::Position, lsra::Position, lsra::Location>>;

Pieces piecesOf(const lsra::LinearFrame* linearFrame, lsra::VReg vReg) {
    Pieces pieces;
    for (const auto& lifetime : linearFrame->valueLifetimes[vReg]) {
        pieces.emplace_back(std::make_tuple(lifetime.start(), lifetime.end(), lifetime.location()));
    }
    return pieces;
}

lsra::Location reg(int32_t n) { return lsra::Location::makeRegister(n); }
lsra::Location slot(int32_t n) { return lsra::Location::makeSpill(n); }

// Three values defined in a row, then each read from a register.
std::unique_ptr<lsra::Graph> buildThreeValues(std::shared_ptr<lsra::ErrorReporter> errorReporter) {
    auto graph = std::make_unique<lsra::Graph>(errorReporter);
    auto v0 = graph->newVirtualRegister();
    auto v1 = graph->newVirtualRegister();
    auto v2 = graph->newVirtualRegister();
    auto b0 = graph->newBlock();
    graph->setEntry(b0);
    graph->append(b0, {}, {lsra::Operand{v0}});
    graph->append(b0, {}, {lsra::Operand{v1}});
    graph->append(b0, {}, {lsra::Operand{v2}});
    graph->append(b0, {lsra::Operand{v0, lsra::UseKind::kRegister}}, {});
    graph->append(b0, {lsra::Operand{v1, lsra::UseKind::kRegister}}, {});
    graph->append(b0, {lsra::Operand{v2, lsra::UseKind::kRegister}}, {});
    return graph;
}

// A value defined before a branch, pushed out of the only register on one side and needed in a register after the
// merge.
std::unique_ptr<lsra::Graph> buildDiamond(std::shared_ptr<lsra::ErrorReporter> errorReporter) {
    auto graph = std::make_unique<lsra::Graph>(errorReporter);
    auto r = graph->newVirtualRegister();
    auto t = graph->newVirtualRegister();
    for (int i = 0; i < 4; ++i) {
        graph->newBlock();
    }
    graph->setEntry(0);
    graph->addEdge(0, 1);
    graph->addEdge(0, 2);
    graph->addEdge(1, 3);
    graph->addEdge(2, 3);
    graph->append(0, {}, {lsra::Operand{r}});
    graph->append(1, {}, {});
    graph->append(2, {}, {lsra::Operand{t}});
    graph->append(2, {lsra::Operand{t, lsra::UseKind::kRegister}}, {});
    graph->append(3, {lsra::Operand{r, lsra::UseKind::kRegister}}, {});
    return graph;
}

// Deterministic pseudo-random numbers, so a failing seed always rebuilds the same graph.
class Lcg {
public:
    explicit Lcg(uint32_t seed): m_state(seed) {}

    // Returns a number in [0, bound).
    int32_t next(int32_t bound) {
        m_state = m_state * 1664525u + 1013904223u;
        return static_cast<int32_t>((m_state >> 8) % static_cast<uint32_t>(bound));
    }
    bool oneIn(int32_t chance) { return next(chance) == 0; }

private:
    uint32_t m_state;
};

// Builds a random graph that always allocates: values are defined in the entry block or used only later in the block
// defining them, every loop has a single entry, no instruction needs more registers than |numberOfRegisters|, and
// calls take no register operands.
std::unique_ptr<lsra::Graph> buildRandomGraph(uint32_t seed, int32_t numberOfRegisters,
        std::shared_ptr<lsra::ErrorReporter> errorReporter) {
    Lcg lcg(seed);
    auto graph = std::make_unique<lsra::Graph>(errorReporter);
    int32_t numberOfBlocks = 1 + lcg.next(6);
    for (int32_t i = 0; i < numberOfBlocks; ++i) {
        graph->newBlock();
    }
    graph->setEntry(0);

    std::vector<std::pair<int32_t, int32_t>> forwardEdges;
    for (int32_t i = 0; i + 1 < numberOfBlocks; ++i) {
        forwardEdges.emplace_back(std::make_pair(i, i + 1));
        if (i + 2 < numberOfBlocks && lcg.oneIn(3)) {
            forwardEdges.emplace_back(std::make_pair(i, i + 2 + lcg.next(numberOfBlocks - i - 2)));
        }
    }
    // A back edge from |tail| to |header| is kept only if no forward edge jumps into the loop past its header, and the
    // loop nests with or is disjoint from every loop kept before it.
    std::vector<std::pair<int32_t, int32_t>> loops;
    for (int32_t attempt = 0; attempt < 2; ++attempt) {
        if (numberOfBlocks < 2) {
            break;
        }
        int32_t header = 1 + lcg.next(numberOfBlocks - 1);
        int32_t tail = header + lcg.next(numberOfBlocks - header);
        bool keep = true;
        for (const auto& edge : forwardEdges) {
            if (edge.first < header && header < edge.second && edge.second <= tail) {
                keep = false;
            }
        }
        for (const auto& loop : loops) {
            bool disjoint = tail < loop.first || loop.second < header;
            bool inside = loop.first < header && tail < loop.second;
            bool outside = header < loop.first && loop.second < tail;
            if (!disjoint && !inside && !outside) {
                keep = false;
            }
        }
        if (keep) {
            loops.emplace_back(std::make_pair(header, tail));
        }
    }
    for (const auto& edge : forwardEdges) {
        graph->addEdge(edge.first, edge.second);
    }
    for (const auto& loop : loops) {
        graph->addEdge(loop.second, loop.first);
    }

    auto kind = [&lcg]() { return lcg.oneIn(2) ? lsra::UseKind::kRegister : lsra::UseKind::kAny; };

    std::vector<lsra::VReg> entryValues;
    int32_t numberOfEntryValues = 1 + lcg.next(numberOfRegisters + 2);
    for (int32_t i = 0; i < numberOfEntryValues; ++i) {
        entryValues.emplace_back(graph->newVirtualRegister());
        graph->append(0, {}, {lsra::Operand{entryValues.back(), kind()}});
    }

    for (int32_t blockNumber = 0; blockNumber < numberOfBlocks; ++blockNumber) {
        std::vector<lsra::VReg> available = entryValues;
        int32_t numberOfInstructions = lcg.next(5);
        for (int32_t i = 0; i < numberOfInstructions; ++i) {
            bool isCall = lcg.oneIn(6);
            int32_t registersNeeded = 0;
            std::vector<lsra::Operand> uses;
            std::vector<lsra::VReg> picked;
            int32_t numberOfUses = lcg.next(3);
            for (int32_t j = 0; j < numberOfUses; ++j) {
                auto vReg = available[lcg.next(static_cast<int32_t>(available.size()))];
                if (std::find(picked.begin(), picked.end(), vReg) != picked.end()) {
                    continue;
                }
                picked.emplace_back(vReg);
                auto useKind = isCall ? lsra::UseKind::kAny : kind();
                if (useKind == lsra::UseKind::kRegister) {
                    if (registersNeeded == numberOfRegisters) {
                        useKind = lsra::UseKind::kAny;
                    } else {
                        ++registersNeeded;
                    }
                }
                uses.emplace_back(lsra::Operand{vReg, useKind});
            }
            std::vector<lsra::Operand> defs;
            if (lcg.oneIn(2)) {
                defs.emplace_back(lsra::Operand{graph->newVirtualRegister(), isCall ? lsra::UseKind::kAny : kind()});
            }
            auto instructionId = graph->append(blockNumber, uses, defs);
            REQUIRE_NE(instructionId, lsra::Instruction::kInvalidID);
            if (isCall) {
                graph->setClobbersRegisters(blockNumber, instructionId);
            } else if (registersNeeded < numberOfRegisters && lcg.oneIn(3)) {
                REQUIRE(graph->addTemporary(blockNumber, instructionId, graph->newVirtualRegister()));
            }
            for (const auto& def : defs) {
                available.emplace_back(def.vReg);
            }
        }
    }
    return graph;
}

void applyMoves(const std::vector<lsra::Move>& moves, std::map<lsra::Location, lsra::VReg>& contents) {
    for (const auto& move : moves) {
        auto source = contents.find(move.from);
        contents[move.to] = source == contents.end() ? lsra::kInvalidVReg : source->second;
    }
}

// Executes the allocated program along a pseudo-random path of at most |maximumSteps| blocks, tracking which value
// every register and spill slot holds. Returns a description of the first read that finds the wrong value, or an
// empty string if every instruction reads what was last written to each of its inputs.
std::string simulate(const lsra::Graph* graph, const lsra::LinearFrame* linearFrame, uint32_t seed,
        int32_t maximumSteps) {
    Lcg lcg(seed);
    std::map<lsra::Location, lsra::VReg> contents;
    auto blockNumber = graph->entry();
    for (int32_t step = 0; step < maximumSteps; ++step) {
        auto blockRange = linearFrame->blockRanges[blockNumber];
        for (auto position = blockRange.from; position < blockRange.to; position += lsra::kPositionStride) {
            auto splitMoves = linearFrame->splitMoves.find(position);
            if (splitMoves != linearFrame->splitMoves.end()) {
                applyMoves(splitMoves->second, contents);
            }
            const auto* instruction = linearFrame->instructionAt(position);
            if (!instruction) {
                continue;
            }
            for (const auto& use : instruction->uses) {
                auto location = linearFrame->locationAt(use.vReg, position);
                if (!location) {
                    return fmt::format("value {} has no location at {}", use.vReg, position);
                }
                if (use.kind == lsra::UseKind::kRegister && !location->isRegister()) {
                    return fmt::format("value {} read at {} from {}", use.vReg, position, location->toString());
                }
                auto held = contents.find(*location);
                if (held == contents.end() || held->second != use.vReg) {
                    return fmt::format("value {} read at {} from {} holding value {}", use.vReg, position,
                            location->toString(), held == contents.end() ? lsra::kInvalidVReg : held->second);
                }
            }
            for (auto temporary : instruction->temporaries) {
                auto location = linearFrame->locationAt(temporary, position);
                if (!location || !location->isRegister()) {
                    return fmt::format("temporary {} has no register at {}", temporary, position);
                }
                contents[*location] = temporary;
            }
            if (instruction->clobbersRegisters) {
                for (auto it = contents.begin(); it != contents.end();) {
                    it = it->first.isRegister() ? contents.erase(it) : std::next(it);
                }
            }
            for (const auto& def : instruction->defs) {
                auto location = linearFrame->locationAt(def.vReg, position + 1);
                if (!location) {
                    return fmt::format("value {} has no location at its definition {}", def.vReg, position + 1);
                }
                contents[*location] = def.vReg;
            }
        }

        const auto& successors = graph->blocks()[blockNumber].successors;
        if (successors.empty()) {
            break;
        }
        auto successor = successors[lcg.next(static_cast<int32_t>(successors.size()))];
        for (const auto& resolution : linearFrame->edgeResolutions) {
            if (resolution.from == blockNumber && resolution.to == successor) {
                applyMoves(resolution.moves, contents);
            }
        }
        blockNumber = successor;
    }
    return std::string();
}

} // namespace

namespace lsra {

// Records each pipeline stage reached, and optionally stops the pipeline after one of them.
class RecordingPipeline : public Pipeline {
public:
    explicit RecordingPipeline(std::shared_ptr<ErrorReporter> errorReporter): Pipeline(errorReporter) {}
    virtual ~RecordingPipeline() = default;

    bool afterBlockSerializer(const Graph*, const LinearFrame*) override { return record("BlockSerializer"); }
    bool afterLifetimeAnalyzer(const Graph*, const LinearFrame* linearFrame) override {
        spillSlotsBeforeAllocation = linearFrame->numberOfSpillSlots;
        return record("LifetimeAnalyzer");
    }
    bool afterRegisterAllocator(const Graph*, const LinearFrame*) override { return record("RegisterAllocator"); }
    bool afterResolver(const Graph*, const LinearFrame*) override { return record("Resolver"); }

    std::vector<std::string> stages;
    std::string stopAfter;
    int32_t spillSlotsBeforeAllocation = 0;

private:
    bool record(const char* stage) {
        stages.emplace_back(stage);
        return stopAfter != stage;
    }
};

// Drops the allocation of the first value after the allocator validates it, so the Resolver cannot find it.
class LosingPipeline : public Pipeline {
public:
    explicit LosingPipeline(std::shared_ptr<ErrorReporter> errorReporter): Pipeline(errorReporter) {}
    virtual ~LosingPipeline() = default;

    bool afterRegisterAllocator(const Graph*, const LinearFrame* linearFrame) override {
        const_cast<LinearFrame*>(linearFrame)->valueLifetimes[0].clear();
        return true;
    }
};

// No attempt is made to isolate the individual stages of the pipeline from each other here. The pipeline validates the
// output of every stage before applying the next, and the cases below then inspect the final allocation field by field.
TEST_CASE("Pipeline straight line") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto graph = buildThreeValues(errorReporter);
    RecordingPipeline pipeline(errorReporter);
    REQUIRE(pipeline.setRegisterNames({"rax"}));

    auto linearFrame = pipeline.allocate(graph.get());
    REQUIRE(linearFrame);
    CHECK(graph->isFrozen());
    CHECK_EQ(pipeline.stages,
            std::vector<std::string>({"BlockSerializer", "LifetimeAnalyzer", "RegisterAllocator", "Resolver"}));
    CHECK_EQ(pipeline.spillSlotsBeforeAllocation, 1);
    CHECK_EQ(errorReporter->errorCount(), 0);

    CHECK_EQ(piecesOf(linearFrame.get(), 0), Pieces({{1, 7, reg(0)}}));
    CHECK_EQ(piecesOf(linearFrame.get(), 1), Pieces({{3, 8, slot(1)}, {8, 9, reg(0)}}));
    CHECK_EQ(piecesOf(linearFrame.get(), 2), Pieces({{5, 10, slot(2)}, {10, 11, reg(0)}}));
    CHECK_EQ(linearFrame->numberOfSpillSlots, 3);
    CHECK_EQ(linearFrame->numberOfSpilledIntervals, 2);

    // Each spilled value is reloaded right before its read.
    CHECK(linearFrame->edgeResolutions.empty());
    REQUIRE_EQ(linearFrame->splitMoves.size(), 2);
    REQUIRE_EQ(linearFrame->splitMoves[8].size(), 1);
    CHECK(linearFrame->splitMoves[8][0] == Move{slot(1), reg(0), 1});
    REQUIRE_EQ(linearFrame->splitMoves[10].size(), 1);
    CHECK(linearFrame->splitMoves[10][0] == Move{slot(2), reg(0), 2});
}

TEST_CASE("Pipeline branches") {
    SUBCASE("value reloaded on one side of a diamond") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto graph = buildDiamond(errorReporter);
        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        auto linearFrame = pipeline.allocate(graph.get());
        REQUIRE(linearFrame);

        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
        CHECK_EQ(piecesOf(linearFrame.get(), 0), Pieces({{1, 5, reg(0)}, {5, 8, slot(1)}, {8, 9, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), 1), Pieces({{5, 7, reg(0)}}));

        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 1);
        CHECK_EQ(linearFrame->edgeResolutions[0].from, 2);
        CHECK_EQ(linearFrame->edgeResolutions[0].to, 3);
        CHECK_EQ(linearFrame->edgeResolutions[0].placement, EdgeResolution::Placement::kPredecessorExit);
        REQUIRE_EQ(linearFrame->edgeResolutions[0].moves.size(), 1);
        CHECK(linearFrame->edgeResolutions[0].moves[0] == Move{slot(1), reg(0), 0});
        REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
        REQUIRE_EQ(linearFrame->splitMoves[4].size(), 1);
        CHECK(linearFrame->splitMoves[4][0] == Move{reg(0), slot(1), 0});
    }

    SUBCASE("value stays live around a loop") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        for (int i = 0; i < 4; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(1, 2);
        graph.addEdge(2, 1);
        graph.addEdge(1, 3);
        graph.append(0, {}, {Operand{v0}});
        graph.append(1, {Operand{v0, UseKind::kRegister}}, {});
        graph.append(2, {}, {});
        graph.append(3, {Operand{v0}}, {});

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2, 3}));
        CHECK_EQ(linearFrame->loopEnds[1], 6);
        // Live through the loop body although the body never reads it.
        CHECK(linearFrame->liveIns[2].count(v0));
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 7, reg(0)}}));
        CHECK(linearFrame->edgeResolutions.empty());
        CHECK(linearFrame->splitMoves.empty());
    }
}

TEST_CASE("Pipeline spilling") {
    SUBCASE("value reloaded and stored again around one instruction") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}});
        graph.append(b0, {}, {Operand{v1}});
        graph.append(b0, {Operand{v1, UseKind::kRegister}}, {});
        // v0 is read from the register at 6, then goes back to its slot at 7 to make room for v2.
        graph.append(b0, {Operand{v0, UseKind::kRegister}}, {Operand{v2, UseKind::kRegister}});
        graph.append(b0, {Operand{v2, UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v0, UseKind::kRegister}}, {});

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(errorReporter->errorCount(), 0);
        CHECK_EQ(piecesOf(linearFrame.get(), v0),
                Pieces({{1, 3, reg(0)}, {3, 6, slot(1)}, {6, 7, reg(0)}, {7, 10, slot(1)}, {10, 11, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 5, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v2), Pieces({{7, 9, reg(0)}}));

        // The slot still holds v0 after the reload, so no store goes with it.
        REQUIRE_EQ(linearFrame->splitMoves.size(), 3);
        REQUIRE_EQ(linearFrame->splitMoves[2].size(), 1);
        CHECK(linearFrame->splitMoves[2][0] == Move{reg(0), slot(1), v0});
        REQUIRE_EQ(linearFrame->splitMoves[6].size(), 1);
        CHECK(linearFrame->splitMoves[6][0] == Move{slot(1), reg(0), v0});
        REQUIRE_EQ(linearFrame->splitMoves[10].size(), 1);
        CHECK(linearFrame->splitMoves[10][0] == Move{slot(1), reg(0), v0});
        CHECK_EQ(simulate(&graph, linearFrame.get(), 0, 1), "");
    }

    SUBCASE("spill slot of a value read by the instruction storing another") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        std::vector<VReg> v;
        for (int i = 0; i < 5; ++i) {
            v.emplace_back(graph.newVirtualRegister());
        }
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v[0]}});
        graph.append(b0, {}, {Operand{v[1]}});
        graph.append(b0, {}, {Operand{v[2]}});
        graph.append(b0, {}, {Operand{v[3]}});
        // v0 dies here, read from its slot, while v3 is stored to make room for v4.
        graph.append(b0, {Operand{v[0]}}, {Operand{v[4], UseKind::kRegister}});
        graph.append(b0, {Operand{v[4], UseKind::kRegister}, Operand{v[1], UseKind::kRegister},
                Operand{v[2], UseKind::kRegister}}, {});
        graph.append(b0, {Operand{v[3], UseKind::kRegister}}, {});

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax", "rbx", "rcx"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(errorReporter->errorCount(), 0);
        CHECK_EQ(piecesOf(linearFrame.get(), v[0]), Pieces({{1, 7, reg(0)}, {7, 9, slot(1)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[1]), Pieces({{3, 11, reg(1)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[2]), Pieces({{5, 11, reg(2)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[3]), Pieces({{7, 9, reg(0)}, {9, 12, slot(2)}, {12, 13, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v[4]), Pieces({{9, 11, reg(0)}}));
        CHECK_EQ(linearFrame->numberOfSpillSlots, 3);

        REQUIRE_EQ(linearFrame->splitMoves[8].size(), 1);
        CHECK(linearFrame->splitMoves[8][0] == Move{reg(0), slot(2), v[3]});
        CHECK_EQ(simulate(&graph, linearFrame.get(), 0, 1), "");
    }

    SUBCASE("values defined in the entry block and read after a merge") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto v2 = graph.newVirtualRegister();
        for (int i = 0; i < 3; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.addEdge(1, 2);
        graph.append(0, {}, {Operand{v0}});
        graph.append(0, {}, {Operand{v1}});
        graph.append(0, {}, {Operand{v2}});
        graph.append(1, {Operand{v0, UseKind::kRegister}, Operand{v1, UseKind::kRegister}}, {});
        graph.append(2, {Operand{v2, UseKind::kRegister}, Operand{v0, UseKind::kRegister}}, {});
        graph.append(2, {Operand{v1}}, {});

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax", "rbx"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(errorReporter->errorCount(), 0);
        CHECK_EQ(linearFrame->blockOrder, std::vector<Block::ID>({0, 1, 2}));
        CHECK_EQ(piecesOf(linearFrame.get(), v0), Pieces({{1, 9, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v1), Pieces({{3, 8, reg(1)}, {8, 11, slot(2)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), v2), Pieces({{5, 8, slot(1)}, {8, 9, reg(1)}}));

        // Both edges into the merge swap v1 out of the register v2 is loaded into.
        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 2);
        for (const auto& resolution : linearFrame->edgeResolutions) {
            CHECK_EQ(resolution.to, 2);
            REQUIRE_EQ(resolution.moves.size(), 2);
            CHECK(resolution.moves[0] == Move{reg(1), slot(2), v1});
            CHECK(resolution.moves[1] == Move{slot(1), reg(1), v2});
        }
        CHECK_EQ(linearFrame->edgeResolutions[0].placement, EdgeResolution::Placement::kCriticalEdge);
        CHECK_EQ(linearFrame->edgeResolutions[1].placement, EdgeResolution::Placement::kPredecessorExit);
        CHECK(linearFrame->splitMoves.empty());
        for (uint32_t seed = 0; seed < 4; ++seed) {
            CHECK_EQ(simulate(&graph, linearFrame.get(), seed, 3), "");
        }
    }

    SUBCASE("value reloaded and stored again before a branch") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v = graph.newVirtualRegister();
        auto w = graph.newVirtualRegister();
        auto y = graph.newVirtualRegister();
        auto z = graph.newVirtualRegister();
        auto d = graph.newVirtualRegister();
        for (int i = 0; i < 3; ++i) {
            graph.newBlock();
        }
        graph.setEntry(0);
        graph.addEdge(0, 1);
        graph.addEdge(0, 2);
        graph.addEdge(1, 2);
        graph.append(0, {}, {Operand{v}});
        graph.append(0, {}, {Operand{w}});
        graph.append(0, {}, {Operand{y}});
        graph.append(0, {Operand{w, UseKind::kRegister}, Operand{y, UseKind::kRegister}},
                {Operand{z, UseKind::kRegister}});
        graph.append(0, {Operand{v, UseKind::kRegister}}, {Operand{d, UseKind::kRegister}});
        graph.append(1, {Operand{z, UseKind::kRegister}, Operand{d, UseKind::kRegister}}, {});
        graph.append(2, {Operand{v, UseKind::kRegister}}, {});
        graph.append(2, {Operand{d}, Operand{z}}, {});

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax", "rbx"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        CHECK_EQ(errorReporter->errorCount(), 0);
        CHECK_EQ(piecesOf(linearFrame.get(), v),
                Pieces({{1, 5, reg(0)}, {5, 8, slot(1)}, {8, 9, reg(1)}, {9, 12, slot(1)}, {12, 13, reg(1)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), z), Pieces({{7, 15, reg(0)}}));
        CHECK_EQ(piecesOf(linearFrame.get(), d), Pieces({{9, 12, reg(1)}, {12, 15, slot(2)}}));

        // v is loaded for its read at 8 and then leaves the register for d, all in the gap before 8.
        REQUIRE_EQ(linearFrame->splitMoves.size(), 2);
        REQUIRE_EQ(linearFrame->splitMoves[4].size(), 1);
        CHECK(linearFrame->splitMoves[4][0] == Move{reg(0), slot(1), v});
        REQUIRE_EQ(linearFrame->splitMoves[8].size(), 1);
        CHECK(linearFrame->splitMoves[8][0] == Move{slot(1), reg(1), v});
        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 2);
        for (const auto& resolution : linearFrame->edgeResolutions) {
            REQUIRE_EQ(resolution.moves.size(), 2);
            CHECK(resolution.moves[0] == Move{reg(1), slot(2), d});
            CHECK(resolution.moves[1] == Move{slot(1), reg(1), v});
        }
        for (uint32_t seed = 0; seed < 4; ++seed) {
            CHECK_EQ(simulate(&graph, linearFrame.get(), seed, 3), "");
        }
    }

    SUBCASE("value reloaded on entry to a loop") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
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

        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        auto linearFrame = pipeline.allocate(&graph);
        REQUIRE(linearFrame);
        // Nothing moves inside the loop.
        REQUIRE_EQ(linearFrame->edgeResolutions.size(), 1);
        CHECK_EQ(linearFrame->edgeResolutions[0].from, 0);
        CHECK_EQ(linearFrame->edgeResolutions[0].to, 1);
        REQUIRE_EQ(linearFrame->edgeResolutions[0].moves.size(), 1);
        CHECK(linearFrame->edgeResolutions[0].moves[0] == Move{slot(1), reg(0), v0});
        REQUIRE_EQ(linearFrame->splitMoves.size(), 1);
        REQUIRE_EQ(linearFrame->splitMoves[2].size(), 1);
        CHECK(linearFrame->splitMoves[2][0] == Move{reg(0), slot(1), v0});
        CHECK_EQ(simulate(&graph, linearFrame.get(), 1, 8), "");
    }
}

TEST_CASE("Pipeline generated graphs") {
    for (uint32_t seed = 0; seed < 300; ++seed) {
        int32_t numberOfRegisters = 1 + static_cast<int32_t>(seed % 4);
        CAPTURE(seed);
        CAPTURE(numberOfRegisters);
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto graph = buildRandomGraph(seed, numberOfRegisters, errorReporter);
        std::vector<std::string> registerNames;
        for (int32_t i = 0; i < numberOfRegisters; ++i) {
            registerNames.emplace_back(fmt::format("r{}", i));
        }
        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames(registerNames));
        auto linearFrame = pipeline.allocate(graph.get());
        REQUIRE(linearFrame);
        CHECK_EQ(errorReporter->errorCount(), 0);
        for (uint32_t path = 0; path < 3; ++path) {
            CHECK_EQ(simulate(graph.get(), linearFrame.get(), seed * 3 + path, 24), "");
        }
    }
}

TEST_CASE("Pipeline errors") {
    SUBCASE("unreachable block") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        graph.newBlock();
        graph.newBlock();
        graph.setEntry(0);
        RecordingPipeline pipeline(errorReporter);
        CHECK(pipeline.allocate(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kUnreachableBlock));
        CHECK(pipeline.stages.empty());
    }

    SUBCASE("use before definition") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {Operand{v0}}, {});
        RecordingPipeline pipeline(errorReporter);
        CHECK(pipeline.allocate(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kUseBeforeDef));
        CHECK_EQ(pipeline.stages, std::vector<std::string>({"BlockSerializer"}));
    }

    SUBCASE("more register operands than registers") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto v1 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}, Operand{v1}});
        graph.append(b0, {Operand{v0, UseKind::kRegister}, Operand{v1, UseKind::kRegister}}, {});
        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        CHECK(pipeline.allocate(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kAllocationImpossible));
    }

    SUBCASE("hook stops the pipeline") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto graph = buildThreeValues(errorReporter);
        RecordingPipeline pipeline(errorReporter);
        pipeline.stopAfter = "LifetimeAnalyzer";
        CHECK(pipeline.allocate(graph.get()) == nullptr);
        CHECK_EQ(pipeline.stages, std::vector<std::string>({"BlockSerializer", "LifetimeAnalyzer"}));
        CHECK_EQ(errorReporter->errorCount(), 0);
    }

    SUBCASE("stage failing without an error is an internal error") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto graph = buildDiamond(errorReporter);
        LosingPipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax"}));
        CHECK(pipeline.allocate(graph.get()) == nullptr);
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].code, ErrorCode::kInternalError);
    }

    SUBCASE("errors on bad input are not internal errors") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister();
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {Operand{v0}}, {});
        Pipeline pipeline(errorReporter);
        CHECK(pipeline.allocate(&graph) == nullptr);
        CHECK(errorReporter->hasError(ErrorCode::kUseBeforeDef));
        CHECK(!errorReporter->hasError(ErrorCode::kInternalError));
    }
}

TEST_CASE("Pipeline register pool") {
    SUBCASE("defaults") {
        Pipeline pipeline;
        CHECK_EQ(pipeline.numberOfRegisters(), kNumberOfPhysicalRegisters);
        REQUIRE_EQ(pipeline.registerNames().size(), static_cast<size_t>(kNumberOfPhysicalRegisters));
        CHECK_EQ(pipeline.registerNames()[0], "r0");
        CHECK_EQ(pipeline.registerClass(), 0);
    }

    SUBCASE("empty pool") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Pipeline pipeline(errorReporter);
        CHECK(!pipeline.setRegisterNames({}));
        CHECK(errorReporter->hasError(ErrorCode::kInvalidRegisterPool));
        CHECK_EQ(pipeline.numberOfRegisters(), kNumberOfPhysicalRegisters);
    }

    SUBCASE("duplicate names") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Pipeline pipeline(errorReporter);
        REQUIRE(pipeline.setRegisterNames({"rax", "rbx"}));
        CHECK(!pipeline.setRegisterNames({"rax", "rcx", "rax"}));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].code, ErrorCode::kInvalidRegisterPool);
        CHECK_EQ(pipeline.registerNames(), std::vector<std::string>({"rax", "rbx"}));
    }

    SUBCASE("register classes allocated separately") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Graph graph(errorReporter);
        auto v0 = graph.newVirtualRegister(0);
        auto f0 = graph.newVirtualRegister(1);
        auto v1 = graph.newVirtualRegister(0);
        auto b0 = graph.newBlock();
        graph.setEntry(b0);
        graph.append(b0, {}, {Operand{v0}, Operand{f0}});
        graph.append(b0, {Operand{v0}}, {Operand{v1}});
        graph.append(b0, {Operand{v1, UseKind::kRegister}, Operand{f0, UseKind::kRegister}}, {});

        Pipeline general(errorReporter);
        REQUIRE(general.setRegisterNames({"rax", "rbx"}));
        auto generalFrame = general.allocate(&graph);
        REQUIRE(generalFrame);
        CHECK_EQ(piecesOf(generalFrame.get(), v0), Pieces({{1, 3, reg(0)}}));
        CHECK_EQ(piecesOf(generalFrame.get(), v1), Pieces({{3, 5, reg(0)}}));
        CHECK(generalFrame->valueLifetimes[f0].empty());

        // The graph is frozen by the first run but can be allocated again for another class.
        Pipeline floatingPoint(errorReporter);
        REQUIRE(floatingPoint.setRegisterNames({"xmm0"}));
        floatingPoint.setRegisterClass(1);
        auto floatingPointFrame = floatingPoint.allocate(&graph);
        REQUIRE(floatingPointFrame);
        CHECK_EQ(piecesOf(floatingPointFrame.get(), f0), Pieces({{1, 5, reg(0)}}));
        CHECK(floatingPointFrame->valueLifetimes[v0].empty());
        CHECK(floatingPointFrame->valueLifetimes[v1].empty());
        CHECK_EQ(errorReporter->errorCount(), 0);
    }
}

TEST_CASE("Pipeline deterministic") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto first = buildDiamond(errorReporter);
    auto second = buildDiamond(errorReporter);
    Pipeline pipeline(errorReporter);
    REQUIRE(pipeline.setRegisterNames({"rax"}));
    auto firstFrame = pipeline.allocate(first.get());
    auto secondFrame = pipeline.allocate(second.get());
    REQUIRE(firstFrame);
    REQUIRE(secondFrame);

    CHECK_EQ(firstFrame->blockOrder, secondFrame->blockOrder);
    for (VReg vReg = 0; vReg < first->numberOfVirtualRegisters(); ++vReg) {
        CHECK_EQ(piecesOf(firstFrame.get(), vReg), piecesOf(secondFrame.get(), vReg));
    }
    REQUIRE_EQ(firstFrame->edgeResolutions.size(), secondFrame->edgeResolutions.size());
    for (size_t i = 0; i < firstFrame->edgeResolutions.size(); ++i) {
        CHECK_EQ(firstFrame->edgeResolutions[i].from, secondFrame->edgeResolutions[i].from);
        CHECK_EQ(firstFrame->edgeResolutions[i].to, secondFrame->edgeResolutions[i].to);
        CHECK(firstFrame->edgeResolutions[i].moves == secondFrame->edgeResolutions[i].moves);
    }
    CHECK(firstFrame->splitMoves == secondFrame->splitMoves);
    CHECK_EQ(firstFrame->numberOfSpillSlots, secondFrame->numberOfSpillSlots);
}

} // namespace lsra
