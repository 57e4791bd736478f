#pragma once

#include "storage/WorkflowRepository.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace weft {
namespace services { class ServiceRegistry; }
namespace runs { class RunRegistry; class RunExecutor; }

namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * REST API over the workflow repository, the planner and the run executor
 *
 * route() parses the target, dispatches to a handler and maps exceptions
 * to statuses: ValidationError, ExpressionSyntaxError and malformed JSON
 * give 400, NotFoundError gives 404, anything else 500. The SSE endpoint
 * (GET /api/runs/:id/events) is served by HttpSession, not here.
 *
 * Usage:
 *   RequestHandler handler(repository, ServiceRegistry::instance(),
 *                          RunRegistry::instance(), executor);
 *   auto [status, body] = handler.route("GET", "/api/workflows", "");
 */
class RequestHandler {
public:
    RequestHandler(std::shared_ptr<storage::WorkflowRepository> repository,
                   const services::ServiceRegistry& services,
                   runs::RunRegistry& runs,
                   runs::RunExecutor& executor);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /**
     * Dispatch a request. Never throws.
     */
    RouteResult route(const std::string& method, const std::string& target,
                      const std::string& body);

    /**
     * Run id of an SSE events target ("/api/runs/<id>/events"), or nullopt
     */
    static std::optional<std::string> eventsTarget(const std::string& method,
                                                   const std::string& target);

    /// Path segments of a target, query string removed
    static std::vector<std::string> splitPath(const std::string& target);

    // General
    json handleHealth();
    json handleNodeTypes();

    // Workflows
    json handleListWorkflows();
    json handleCreateWorkflow(const json& request);
    json handleGetWorkflow(int64_t id);
    json handleUpdateWorkflow(int64_t id, const json& request);
    json handleDeleteWorkflow(int64_t id);

    // Nodes and edges
    json handleCreateNode(int64_t workflowId, const json& request);
    json handleUpdateNode(int64_t nodeId, const json& request);
    json handleDeleteNode(int64_t nodeId);
    json handleCreateEdge(int64_t workflowId, const json& request);
    json handleDeleteEdge(int64_t edgeId);

    // Analysis
    json handleValidate(int64_t workflowId);
    RouteResult handlePlan(int64_t workflowId, const json& request);
    RouteResult handleAvailable(int64_t workflowId);

    // Runs
    json handleStartRun(int64_t workflowId, const json& request);
    json handleGetRun(const std::string& runId);
    json handleCancelRun(const std::string& runId);

private:
    RouteResult dispatch(const std::string& method, const std::vector<std::string>& path,
                         const json& body);

    void validateWorkflowFields(const workflow::Workflow& wf) const;
    void validateNode(const workflow::Node& node) const;

    std::shared_ptr<storage::WorkflowRepository> m_repository;
    const services::ServiceRegistry& m_services;
    runs::RunRegistry& m_runs;
    runs::RunExecutor& m_executor;
};

} // namespace server
} // namespace weft
