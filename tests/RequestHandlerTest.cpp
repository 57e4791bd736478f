#include <catch2/catch_test_macros.hpp>
#include "server/RequestHandler.hpp"
#include "runs/RunExecutor.hpp"
#include "runs/RunRegistry.hpp"
#include "services/ServiceRegistry.hpp"
#include "storage/WorkflowRepository.hpp"
#include "core/Errors.hpp"

using namespace weft;
using namespace weft::server;
using services::ServiceRegistry;

namespace {

/**
 * Handler over an in-memory repository and private run registry
 */
struct ApiFixture {
    std::shared_ptr<storage::MemoryWorkflowRepository> repository =
        std::make_shared<storage::MemoryWorkflowRepository>();
    runs::RunRegistry runs;
    runs::RunExecutor executor{runs, ServiceRegistry::instance()};
    RequestHandler handler{repository, ServiceRegistry::instance(), runs, executor};

    RouteResult call(const std::string& method, const std::string& target,
                     const json& body = nullptr) {
        return handler.route(method, target, body.is_null() ? std::string() : body.dump());
    }

    int64_t createWorkflow() {
        auto [status, body] = call("POST", "/api/workflows",
                                   {{"name", "Doubler"}, {"is_api", true}});
        REQUIRE(status == 201);
        return body["id"].get<int64_t>();
    }

    int64_t createNode(int64_t workflowId, const json& node) {
        auto [status, body] = call("POST", "/api/workflows/" + std::to_string(workflowId) + "/nodes", node);
        REQUIRE(status == 201);
        return body["id"].get<int64_t>();
    }

    void createEdge(int64_t workflowId, int64_t parent, int64_t child) {
        auto [status, body] = call("POST", "/api/workflows/" + std::to_string(workflowId) + "/edges",
                                   {{"parent_id", parent}, {"child_id", child}});
        REQUIRE(status == 201);
    }

    /// advanced(input.n * 2) -> return({'doubled': input.result})
    int64_t createDoubler() {
        int64_t wf = createWorkflow();
        int64_t a = createNode(wf, {{"node_type", "advanced"},
                                    {"metadata", {{"expression", "input.n * 2"}}}});
        int64_t b = createNode(wf, {{"node_type", "return"},
                                    {"metadata", {{"payload_selector", "{'doubled': input.result}"}}}});
        createEdge(wf, a, b);
        return wf;
    }
};

} // anonymous namespace

// =============================================================================
// Routing
// =============================================================================

TEST_CASE("Paths are split into segments", "[RequestHandler][Routing]") {
    REQUIRE(RequestHandler::splitPath("/api/workflows/3?verbose=1") ==
            std::vector<std::string>{"api", "workflows", "3"});
    REQUIRE(RequestHandler::splitPath("//api//health/") == std::vector<std::string>{"api", "health"});
    REQUIRE(RequestHandler::splitPath("/").empty());
}

TEST_CASE("Event stream targets are recognised", "[RequestHandler][Routing]") {
    REQUIRE(RequestHandler::eventsTarget("GET", "/api/runs/run_abc/events") ==
            std::optional<std::string>("run_abc"));
    REQUIRE_FALSE(RequestHandler::eventsTarget("POST", "/api/runs/run_abc/events").has_value());
    REQUIRE_FALSE(RequestHandler::eventsTarget("GET", "/api/runs/run_abc").has_value());
}

TEST_CASE("Unknown routes and methods", "[RequestHandler][Routing]") {
    ApiFixture api;

    auto [status, body] = api.call("GET", "/api/nothing");
    REQUIRE(status == 404);
    REQUIRE(body["message"] == "Not found: /api/nothing");

    REQUIRE(api.call("DELETE", "/api/health").first == 405);
    REQUIRE(api.call("PATCH", "/api/workflows").first == 405);
    REQUIRE(api.call("GET", "/api/workflows/abc").first == 400);
    REQUIRE(api.handler.route("POST", "/api/workflows", "{not json").first == 400);
    REQUIRE(api.handler.route("POST", "/api/workflows", "[1, 2]").first == 400);
}

TEST_CASE("Health and node types", "[RequestHandler]") {
    ApiFixture api;

    auto [status, body] = api.call("GET", "/api/health");
    REQUIRE(status == 200);
    REQUIRE(body["status"] == "ok");
    REQUIRE(body["runs"] == 0);

    auto types = api.call("GET", "/api/node-types");
    REQUIRE(types.first == 200);
    REQUIRE(types.second["node_types"].size() == 15);
}

// =============================================================================
// Workflows, nodes and edges
// =============================================================================

TEST_CASE("Workflow lifecycle", "[RequestHandler][Workflows]") {
    ApiFixture api;
    int64_t id = api.createWorkflow();
    std::string path = "/api/workflows/" + std::to_string(id);

    auto listed = api.call("GET", "/api/workflows");
    REQUIRE(listed.second["workflows"].size() == 1);

    auto updated = api.call("PUT", path, {{"name", "Tripler"}, {"cron_schedule", "*/5 * * * *"}});
    REQUIRE(updated.first == 200);
    REQUIRE(updated.second["name"] == "Tripler");

    auto loaded = api.call("GET", path);
    REQUIRE(loaded.second["cron_schedule"] == "*/5 * * * *");
    REQUIRE(loaded.second["nodes"] == json::array());

    auto badCron = api.call("PUT", path, {{"name", "x"}, {"cron_schedule", "every day"}});
    REQUIRE(badCron.first == 400);
    REQUIRE(badCron.second["field"] == "cron_schedule");

    auto unnamed = api.call("POST", "/api/workflows", {{"description", "no name"}});
    REQUIRE(unnamed.first == 400);
    REQUIRE(unnamed.second["field"] == "name");

    REQUIRE(api.call("DELETE", path).first == 200);
    REQUIRE(api.call("GET", path).first == 404);
}

TEST_CASE("Nodes are validated against their service", "[RequestHandler][Nodes]") {
    ApiFixture api;
    int64_t wf = api.createWorkflow();
    std::string nodes = "/api/workflows/" + std::to_string(wf) + "/nodes";

    auto missing = api.call("POST", nodes, {{"node_type", "filter"}, {"metadata", json::object()}});
    REQUIRE(missing.first == 400);
    REQUIRE(missing.second["message"] == "Missing required fields: where");

    auto unknown = api.call("POST", nodes, {{"node_type", "webhook"}});
    REQUIRE(unknown.first == 400);
    REQUIRE(unknown.second["field"] == "node_type");

    int64_t id = api.createNode(wf, {{"node_type", "filter"}, {"metadata", {{"where", "item.ok"}}}});
    std::string path = "/api/nodes/" + std::to_string(id);

    auto changed = api.call("PUT", path, {{"metadata", {{"where", "item.score > 1"}}}, {"id", 999}});
    REQUIRE(changed.first == 200);
    REQUIRE(changed.second["id"] == id);
    REQUIRE(changed.second["node_type"] == "filter");
    REQUIRE(changed.second["metadata"]["where"] == "item.score > 1");

    REQUIRE(api.call("PUT", path, {{"metadata", json::object()}}).first == 400);
    REQUIRE(api.call("PUT", "/api/nodes/999", {{"metadata", json::object()}}).first == 404);
    REQUIRE(api.call("DELETE", path).first == 200);
    REQUIRE(api.call("DELETE", path).first == 404);
}

TEST_CASE("Edges reject duplicates", "[RequestHandler][Edges]") {
    ApiFixture api;
    int64_t wf = api.createDoubler();
    auto graph = api.repository->loadGraph(wf);
    std::string edges = "/api/workflows/" + std::to_string(wf) + "/edges";

    auto duplicate = api.call("POST", edges, {{"parent_id", graph.nodes[0].id},
                                              {"child_id", graph.nodes[1].id}});
    REQUIRE(duplicate.first == 400);
    REQUIRE(duplicate.second["field"] == "edge");

    REQUIRE(api.call("POST", edges, {{"parent_id", graph.nodes[0].id}}).first == 400);

    std::string path = "/api/edges/" + std::to_string(graph.edges[0].id);
    REQUIRE(api.call("GET", path).first == 405);
    REQUIRE(api.call("DELETE", path).first == 200);
    REQUIRE(api.call("DELETE", path).first == 404);
}

// =============================================================================
// Analysis
// =============================================================================

TEST_CASE("Validate, plan and available data", "[RequestHandler][Analysis]") {
    ApiFixture api;
    int64_t wf = api.createDoubler();
    std::string base = "/api/workflows/" + std::to_string(wf);

    auto validation = api.call("POST", base + "/validate");
    REQUIRE(validation.first == 200);
    REQUIRE(validation.second["errors"] == json::array());
    REQUIRE(validation.second["topo_order"].size() == 2);

    auto plan = api.call("POST", base + "/plan", {{"starting_inputs", {{"n", 1}}}});
    REQUIRE(plan.first == 200);
    REQUIRE(plan.second["nodes"].size() == 2);

    auto available = api.call("GET", base + "/available");
    REQUIRE(available.first == 200);
    REQUIRE(available.second["available"].size() == 2);

    REQUIRE(api.call("POST", base + "/plan", {{"starting_inputs", "n"}}).first == 400);
    REQUIRE(api.call("POST", "/api/workflows/999/validate").first == 404);
}

TEST_CASE("Invalid graphs are not planned", "[RequestHandler][Analysis]") {
    ApiFixture api;
    int64_t wf = api.createWorkflow();
    int64_t a = api.createNode(wf, {{"node_type", "advanced"}, {"metadata", {{"expression", "1"}}}});
    int64_t b = api.createNode(wf, {{"node_type", "advanced"}, {"metadata", {{"expression", "2"}}}});
    api.createEdge(wf, a, b);
    api.createEdge(wf, b, a);
    std::string base = "/api/workflows/" + std::to_string(wf);

    auto plan = api.call("POST", base + "/plan");
    REQUIRE(plan.first == 400);
    REQUIRE(plan.second["message"] == "Workflow does not validate");
    REQUIRE_FALSE(plan.second["validation"]["errors"].empty());

    REQUIRE(api.call("GET", base + "/available").first == 400);
}

// =============================================================================
// Runs
// =============================================================================

TEST_CASE("Runs are queued and can be fetched", "[RequestHandler][Runs]") {
    ApiFixture api;
    int64_t wf = api.createDoubler();

    auto started = api.call("POST", "/api/workflows/" + std::to_string(wf) + "/run",
                            {{"inputs", {{"n", 21}}}});
    REQUIRE(started.first == 202);
    REQUIRE(started.second["status"] == "queued");
    std::string runId = started.second["run_id"];

    api.executor.shutdown();

    auto fetched = api.call("GET", "/api/runs/" + runId);
    REQUIRE(fetched.first == 200);
    REQUIRE(fetched.second["status"] == "succeeded");
    REQUIRE(fetched.second["result"] == json{{"doubled", 42}});
    REQUIRE(fetched.second["events"].back()["message"] == "run_summary");

    auto cancelled = api.call("POST", "/api/runs/" + runId + "/cancel");
    REQUIRE(cancelled.first == 200);
    REQUIRE(cancelled.second["cancelled"] == false);

    REQUIRE(api.call("GET", "/api/runs/run_missing").first == 404);
    REQUIRE(api.call("POST", "/api/runs/run_missing/cancel").first == 404);
    REQUIRE(api.call("POST", "/api/workflows/999/run").first == 404);
}
