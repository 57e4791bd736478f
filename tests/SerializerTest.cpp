#include <catch2/catch_test_macros.hpp>
#include "workflow/DagValidator.hpp"
#include "workflow/Types.hpp"
#include "core/Errors.hpp"

using namespace weft;
using namespace weft::workflow;

// =============================================================================
// Nodes
// =============================================================================

TEST_CASE("Node JSON uses wire names", "[Serializer][Node]") {
    Node node;
    node.id = 7;
    node.workflowId = 3;
    node.kind = NodeKind::IfElse;
    node.metadata = {{"predicate", "item.score > 0.5"}};

    json j = node;
    REQUIRE(j["id"] == 7);
    REQUIRE(j["workflow_id"] == 3);
    REQUIRE(j["node_type"] == "if_else");
    REQUIRE(j["metadata"]["predicate"] == "item.score > 0.5");
    REQUIRE(j["structured_output"] == json::object());

    Node back = j.get<Node>();
    REQUIRE(back.kind == NodeKind::IfElse);
    REQUIRE(back.metadata == node.metadata);
}

TEST_CASE("Node JSON rejects unknown types and odd metadata", "[Serializer][Node]") {
    try {
        json{{"node_type", "webhook"}}.get<Node>();
        FAIL("expected an unknown node type error");
    } catch (const ValidationError& e) {
        REQUIRE(e.field() == "node_type");
        REQUIRE(e.message() == "Unknown node type: webhook");
    }

    REQUIRE_THROWS_AS((json{{"node_type", "map"}, {"metadata", "x"}}.get<Node>()), ValidationError);

    Node n = json{{"node_type", "map"}, {"metadata", nullptr}}.get<Node>();
    REQUIRE(n.metadata == json::object());
    REQUIRE(n.id == 0);
}

// =============================================================================
// Edges
// =============================================================================

TEST_CASE("Edge JSON keeps the branch label optional", "[Serializer][Edge]") {
    Edge edge;
    edge.id = 1;
    edge.parentId = 2;
    edge.childId = 3;

    json plain = edge;
    REQUIRE(plain["branch_label"].is_null());
    REQUIRE_FALSE(plain.get<Edge>().branchLabel.has_value());

    edge.branchLabel = "false";
    Edge back = json(edge).get<Edge>();
    REQUIRE(back.branchLabel == std::optional<std::string>("false"));
    REQUIRE(back.parentId == 2);
    REQUIRE(back.childId == 3);
}

TEST_CASE("Edge JSON needs both endpoints", "[Serializer][Edge]") {
    try {
        json{{"parent_id", 1}}.get<Edge>();
        FAIL("expected a missing endpoint error");
    } catch (const ValidationError& e) {
        REQUIRE(e.field() == "edge");
        REQUIRE(std::string(e.what()) == "edge: parent_id and child_id are required");
    }
}

// =============================================================================
// Workflows
// =============================================================================

TEST_CASE("Workflow JSON", "[Serializer][Workflow]") {
    Workflow wf;
    wf.id = 4;
    wf.name = "Digest";
    wf.isApi = true;
    wf.teamId = 9;

    json j = wf;
    REQUIRE(j["name"] == "Digest");
    REQUIRE(j["is_api"] == true);
    REQUIRE(j["cron_schedule"].is_null());
    REQUIRE(j["team_id"] == 9);
    REQUIRE(j["input_params"] == json::object());

    Workflow back = j.get<Workflow>();
    REQUIRE(back.teamId == std::optional<int64_t>(9));
    REQUIRE_FALSE(back.cronSchedule.has_value());
    REQUIRE(back.triggers().isApi);

    // An empty schedule means no schedule
    Workflow blank = json{{"name", "x"}, {"cron_schedule", ""}}.get<Workflow>();
    REQUIRE_FALSE(blank.cronSchedule.has_value());
    REQUIRE_FALSE(blank.isApi);
}

// =============================================================================
// Validation results
// =============================================================================

TEST_CASE("Validation result JSON", "[Serializer][DagValidator]") {
    DagValidationResult result;
    result.errors = {"Cycle detected in graph: 1 -> 2 -> 1"};
    result.warnings = {"Node 3 is unreachable"};

    json j = result;
    REQUIRE(j["errors"].size() == 1);
    REQUIRE(j["warnings"][0] == "Node 3 is unreachable");
    REQUIRE(j["topo_order"] == json::array());

    DagValidationResult back = j.get<DagValidationResult>();
    REQUIRE_FALSE(back.ok());
    REQUIRE(back.errors == result.errors);

    REQUIRE(json::object().get<DagValidationResult>().ok());
}
