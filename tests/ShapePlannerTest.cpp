#include <catch2/catch_test_macros.hpp>
#include "workflow/ShapePlanner.hpp"
#include "workflow/Shape.hpp"
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace weft;
using namespace weft::workflow;
using namespace weft::testing;

namespace {

const PlannedNode& plannedFor(const std::vector<PlannedNode>& plan, int64_t id) {
    for (const auto& p : plan) {
        if (p.nodeId == id) return p;
    }
    throw std::runtime_error("node not planned: " + std::to_string(id));
}

} // anonymous namespace

// =============================================================================
// Shapes
// =============================================================================

TEST_CASE("Shape of a concrete value", "[Shape]") {
    json value = {{"name", "Ada"}, {"age", 36}, {"tags", {"x"}}, {"meta", {{"k", 1}}},
                  {"ok", true}, {"none", nullptr}};

    json shape = shapeOfValue(value);

    REQUIRE(shape == json{{"name", "string"}, {"age", "number"}, {"tags", "array"},
                          {"meta", "object"}, {"ok", "boolean"}, {"none", "null"}});
    REQUIRE(shapeOfValue(json::array({1})).empty());
}

TEST_CASE("Structured output in schema form is converted", "[Shape]") {
    json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "summary": {"type": "string"},
            "score": {"type": "integer"},
            "topics": {"type": "array", "items": {"type": "string"}},
            "author": {"type": "object", "properties": {"name": {"type": "string"}}}
        }
    })");

    json shape = shapeFromStructuredOutput(schema);

    REQUIRE(shape["summary"] == "string");
    REQUIRE(shape["score"] == "number");
    REQUIRE(shape["topics"] == json{{"type", "array"}, {"items", "string"}});
    REQUIRE(shape["author"] == json{{"name", "string"}});
}

TEST_CASE("Structured output in direct form is kept", "[Shape]") {
    json direct = {{"summary", "string"}, {"nested", {{"a", "number"}}}};

    REQUIRE(shapeFromStructuredOutput(direct) == direct);
    REQUIRE(shapeFromStructuredOutput(json::object()).empty());
}

TEST_CASE("Malformed structured output is rejected", "[Shape]") {
    REQUIRE_THROWS_AS(validateStructuredOutput(json::array()), ValidationError);
    REQUIRE_THROWS_AS(validateStructuredOutput({{"type", "object"},
                                                {"properties", {{"x", {{"type", "decimal"}}}}}}),
                      ValidationError);
    REQUIRE_THROWS_AS(validateStructuredOutput({{"x", 3}}), ValidationError);
    REQUIRE_NOTHROW(validateStructuredOutput(nullptr));
    REQUIRE_NOTHROW(validateStructuredOutput({{"x", "string"}}));
}

TEST_CASE("Union merge lets later sources win and notes conflicts", "[Shape]") {
    std::vector<std::string> notes;
    json merged = unionMerge({{1, {{"a", "string"}, {"b", "number"}}},
                              {2, {{"b", "string"}, {"c", "array"}}}},
                             &notes);

    REQUIRE(merged == json{{"a", "string"}, {"b", "string"}, {"c", "array"}});
    REQUIRE(notes == std::vector<std::string>{
        "Key 'b' has conflicting types from nodes 1 and 2; using node 2"});
}

// =============================================================================
// Planner
// =============================================================================

TEST_CASE("Shapes flow down a linear pipeline", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Job, jobMeta()),
                               makeNode(2, NodeKind::Filter, filterMeta()),
                               makeNode(3, NodeKind::Map, mapMeta({{"n", "$count(input.items)"},
                                                                   {"limit", 10},
                                                                   {"strict", true}}))};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 2, 3)};

    auto plan = planWorkflow(nodes, edges, {{"text", "hello"}}, registry);

    REQUIRE(plan.size() == 3);
    REQUIRE(plan[0].nodeId == 1);
    REQUIRE(plan[0].inputShape == json{{"text", "string"}});
    REQUIRE(plan[0].outputShape == json{{"text", "string"}});
    REQUIRE(plan[1].outputShape == json{{"text", "string"}, {"items", "array"}});
    REQUIRE(plan[2].inputShape == json{{"text", "string"}, {"items", "array"}});
    REQUIRE(plan[2].outputShape == json{{"n", "unknown"}, {"limit", "number"}, {"strict", "boolean"}});
}

TEST_CASE("Declared structured output overrides the service plan", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    json schema = {{"type", "object"},
                   {"properties", {{"summary", {{"type", "string"}}}, {"score", {{"type", "integer"}}}}}};
    std::vector<Node> nodes = {makeNode(1, NodeKind::Job, jobMeta(), schema),
                               makeNode(2, NodeKind::Advanced, {{"expression", "input.score * 2"}})};
    std::vector<Edge> edges = {makeEdge(1, 1, 2)};

    auto plan = planWorkflow(nodes, edges, json::object(), registry);

    REQUIRE(plannedFor(plan, 1).outputShape == json{{"summary", "string"}, {"score", "number"}});
    REQUIRE(plannedFor(plan, 2).inputShape == json{{"summary", "string"}, {"score", "number"}});
    REQUIRE(plannedFor(plan, 2).outputShape == json{{"result", "unknown"}});
}

TEST_CASE("Merge input notes conflicting parent shapes", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Advanced, {{"expression", "1"}}),
                               makeNode(2, NodeKind::Advanced, {{"expression", "2"}}),
                               makeNode(3, NodeKind::Map, mapMeta({{"result", 1}})),
                               makeNode(4, NodeKind::Merge)};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 1, 3),
                               makeEdge(3, 2, 4), makeEdge(4, 3, 4)};

    auto plan = planWorkflow(nodes, edges, json::object(), registry);
    const auto& merge = plannedFor(plan, 4);

    REQUIRE(merge.inputShape == json{{"result", "number"}});
    REQUIRE(merge.outputShape == json{{"result", "number"}});
    REQUIRE(merge.notes == std::vector<std::string>{
        "Key 'result' has conflicting types from nodes 2 and 3; using node 3"});
}

TEST_CASE("Job fanned out to a filter and a map then merged", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Job, jobMeta()),
                               makeNode(2, NodeKind::Filter, filterMeta()),
                               makeNode(3, NodeKind::Map, mapMeta({{"source", "'digest'"},
                                                                   {"limit", 10}})),
                               makeNode(4, NodeKind::Merge)};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 1, 3),
                               makeEdge(3, 2, 4), makeEdge(4, 3, 4)};

    auto plan = planWorkflow(nodes, edges, {{"text", "hello"}}, registry);
    const auto& job = plannedFor(plan, 1);
    const auto& filter = plannedFor(plan, 2);
    const auto& map = plannedFor(plan, 3);
    const auto& merge = plannedFor(plan, 4);

    REQUIRE(plan.size() == 4);
    REQUIRE(filter.inputShape == job.outputShape);
    REQUIRE(map.inputShape == job.outputShape);
    REQUIRE(merge.inputShape == unionMerge({{2, filter.outputShape}, {3, map.outputShape}}));
    REQUIRE(merge.inputShape == json{{"text", "string"}, {"items", "array"},
                                     {"source", "unknown"}, {"limit", "number"}});
    REQUIRE(merge.notes.empty());
}

TEST_CASE("Plan failures become notes", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Map, json::object())};

    auto plan = planWorkflow(nodes, {}, json::object(), registry);

    REQUIRE(plan.size() == 1);
    REQUIRE(plan[0].outputShape.empty());
    REQUIRE(plan[0].notes.size() == 1);
    REQUIRE(plan[0].notes[0].rfind("Could not plan output: ", 0) == 0);
}

TEST_CASE("Invalid graphs cannot be planned", "[ShapePlanner]") {
    const auto& registry = services::ServiceRegistry::instance();
    std::vector<Node> nodes = {makeNode(1, NodeKind::Advanced), makeNode(2, NodeKind::Advanced)};
    std::vector<Edge> edges = {makeEdge(1, 1, 2), makeEdge(2, 2, 1)};

    REQUIRE_THROWS_AS(planWorkflow(nodes, edges, json::object(), registry), InvariantViolation);
}

TEST_CASE("Planned nodes serialize with wire names", "[ShapePlanner]") {
    PlannedNode planned;
    planned.nodeId = 7;
    planned.kind = NodeKind::IfElse;
    planned.inputShape = {{"x", "number"}};
    planned.outputShape = {{"x", "number"}, {"condition_result", "boolean"}};

    json j = planned;

    REQUIRE(j["node_id"] == 7);
    REQUIRE(j["node_type"] == "if_else");
    REQUIRE(j["notes"] == json::array());
    REQUIRE(j.get<PlannedNode>().outputShape == planned.outputShape);
}
