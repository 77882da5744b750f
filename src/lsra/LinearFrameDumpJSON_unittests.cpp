#include "lsra/LinearFrameDumpJSON.hpp"

#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/Pipeline.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace lsra {

TEST_CASE("LinearFrameDumpJSON") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Graph graph(errorReporter);
    auto v0 = graph.newVirtualRegister();
    auto v1 = graph.newVirtualRegister();
    auto b0 = graph.newBlock();
    auto b1 = graph.newBlock();
    graph.setEntry(b0);
    graph.addEdge(b0, b1);
    graph.append(b0, {}, {Operand{v0}});
    graph.append(b0, {}, {Operand{v1}});
    graph.append(b1, {Operand{v0, UseKind::kRegister}}, {});
    graph.append(b1, {Operand{v1, UseKind::kRegister}}, {});

    Pipeline pipeline(errorReporter);
    REQUIRE(pipeline.setRegisterNames({"rax"}));
    auto linearFrame = pipeline.allocate(&graph);
    REQUIRE(linearFrame);
    REQUIRE_EQ(linearFrame->numberOfSpillSlots, 2);

    LinearFrameDumpJSON compact;
    compact.dump(linearFrame.get(), pipeline.registerNames(), false);
    std::string json(compact.json());
    CHECK(json.find("\"blockOrder\":[0,1]") != std::string::npos);
    CHECK(json.find("\"numberOfSpillSlots\":2") != std::string::npos);
    CHECK(json.find("\"rax\"") != std::string::npos);
    CHECK(json.find("\"s1\"") != std::string::npos);
    CHECK(json.find("\"splitMoves\"") != std::string::npos);
    CHECK(json.find("\"edgeResolutions\"") != std::string::npos);
    CHECK(json.find('\n') == std::string::npos);

    // v1 is spilled at its definition and reloaded for its read, so it has the piece built by lifetime analysis and
    // a split piece.
    REQUIRE_EQ(linearFrame->valueLifetimes[v1].size(), 2);
    CHECK(!linearFrame->valueLifetimes[v1][0].isSplit);
    CHECK(linearFrame->valueLifetimes[v1][1].isSplit);
    CHECK(json.find("\"location\":\"s1\",\"isSplit\":false") != std::string::npos);
    CHECK(json.find("\"isSplit\":true") != std::string::npos);

    LinearFrameDumpJSON pretty;
    pretty.dump(linearFrame.get(), pipeline.registerNames(), true);
    std::string prettyJSON(pretty.json());
    CHECK(prettyJSON.find('\n') != std::string::npos);
    CHECK_NE(prettyJSON, json);

    SUBCASE("registers without a name") {
        LinearFrameDumpJSON unnamed;
        unnamed.dump(linearFrame.get(), {}, false);
        std::string unnamedJSON(unnamed.json());
        CHECK(unnamedJSON.find("\"rax\"") == std::string::npos);
        CHECK(unnamedJSON.find("\"r0\"") != std::string::npos);
    }
}

} // namespace lsra
