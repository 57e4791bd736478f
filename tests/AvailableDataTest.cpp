#include <catch2/catch_test_macros.hpp>
#include "workflow/AvailableData.hpp"
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace weft;
using namespace weft::workflow;
using namespace weft::testing;

namespace {

std::vector<Node> diamondNodes() {
    return {makeNode(1, NodeKind::Advanced, {{"expression", "1"}}),
            makeNode(2, NodeKind::Advanced, {{"expression", "2"}}),
            makeNode(3, NodeKind::Advanced, {{"expression", "3"}}),
            makeNode(4, NodeKind::Merge)};
}

std::vector<Edge> diamondEdges() {
    return {makeEdge(1, 1, 2), makeEdge(2, 1, 3), makeEdge(3, 2, 4), makeEdge(4, 3, 4)};
}

} // anonymous namespace

TEST_CASE("Available data merges every ancestor in topological order", "[AvailableData]") {
    std::map<int64_t, json> outputs = {
        {1, {{"a", 1}, {"x", "one"}}},
        {2, {{"x", "two"}}},
        {3, {{"x", "three"}, {"b", 2}}}
    };

    json available = resolveAvailableData(diamondNodes(), diamondEdges(), 4, outputs);

    REQUIRE(available == json{{"a", 1}, {"x", "three"}, {"b", 2}});
}

TEST_CASE("Available data excludes the node and its descendants", "[AvailableData]") {
    std::map<int64_t, json> outputs = {
        {1, {{"a", 1}}},
        {2, {{"from_two", true}}},
        {4, {{"merged", true}}}
    };

    json available = resolveAvailableData(diamondNodes(), diamondEdges(), 2, outputs);

    REQUIRE(available == json{{"a", 1}});
}

TEST_CASE("Ancestors without output are ignored", "[AvailableData]") {
    std::map<int64_t, json> outputs = {{3, {{"b", 2}}}};

    json available = resolveAvailableData(diamondNodes(), diamondEdges(), 4, outputs);

    REQUIRE(available == json{{"b", 2}});
}

TEST_CASE("Roots see nothing", "[AvailableData]") {
    std::map<int64_t, json> outputs = {{1, {{"a", 1}}}};

    REQUIRE(resolveAvailableData(diamondNodes(), diamondEdges(), 1, outputs).empty());
}

TEST_CASE("Cyclic graphs are refused", "[AvailableData]") {
    std::vector<Node> nodes = {makeNode(1, NodeKind::Advanced), makeNode(2, NodeKind::Advanced)};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 2, 1)};

    REQUIRE_THROWS_AS(resolveAvailableData(nodes, edges, 2, {}), InvariantViolation);
}

TEST_CASE("Available shapes for every node", "[AvailableData][Shapes]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Job, jobMeta()),
                               makeNode(2, NodeKind::Filter, filterMeta()),
                               makeNode(3, NodeKind::Map, mapMeta({{"n", "$count(input.items)"}}))};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 2, 3)};

    json map = availableDataMap(nodes, edges, registry, {{"text", "hi"}});

    REQUIRE(map["1"].empty());
    REQUIRE(map["2"] == json{{"text", "string"}});
    REQUIRE(map["3"] == json{{"text", "string"}, {"items", "array"}});
}
