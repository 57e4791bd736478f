#include "server/RequestHandler.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "runs/RunExecutor.hpp"
#include "runs/RunRegistry.hpp"
#include "services/ServiceRegistry.hpp"
#include "workflow/AvailableData.hpp"
#include "workflow/Cron.hpp"
#include "workflow/DagValidator.hpp"
#include "workflow/ShapePlanner.hpp"

namespace weft {
namespace server {

using workflow::DagValidationResult;
using workflow::Edge;
using workflow::Node;
using workflow::Workflow;

namespace {

constexpr unsigned kOk = 200;
constexpr unsigned kCreated = 201;
constexpr unsigned kAccepted = 202;
constexpr unsigned kBadRequest = 400;
constexpr unsigned kNotFound = 404;
constexpr unsigned kMethodNotAllowed = 405;
constexpr unsigned kInternalError = 500;

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

int64_t parseId(const std::string& segment) {
    if (segment.empty() || segment.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("id", "must be a positive integer, got '" + segment + "'");
    }
    try {
        return std::stoll(segment);
    } catch (const std::out_of_range&) {
        throw ValidationError("id", "out of range: " + segment);
    }
}

json requireObject(const json& body) {
    if (body.is_null()) {
        return json::object();
    }
    if (!body.is_object()) {
        throw ValidationError("", "Request body must be a JSON object");
    }
    return body;
}

json objectField(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        throw ValidationError(key, "must be an object");
    }
    return *it;
}

} // anonymous namespace

RequestHandler::RequestHandler(std::shared_ptr<storage::WorkflowRepository> repository,
                               const services::ServiceRegistry& services,
                               runs::RunRegistry& runs,
                               runs::RunExecutor& executor)
    : m_repository(std::move(repository))
    , m_services(services)
    , m_runs(runs)
    , m_executor(executor)
{
    if (!m_repository) {
        throw ConfigurationError("RequestHandler requires a workflow repository");
    }
}

// =============================================================================
// Routing
// =============================================================================

std::vector<std::string> RequestHandler::splitPath(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos < path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) {
            segments.push_back(path.substr(pos, slash - pos));
        }
        pos = slash + 1;
    }
    return segments;
}

std::optional<std::string> RequestHandler::eventsTarget(const std::string& method,
                                                        const std::string& target) {
    if (method != "GET") return std::nullopt;
    auto path = splitPath(target);
    if (path.size() == 4 && path[0] == "api" && path[1] == "runs" && path[3] == "events") {
        return path[2];
    }
    return std::nullopt;
}

RouteResult RequestHandler::route(const std::string& method, const std::string& target,
                                  const std::string& body) {
    try {
        json parsedBody = body.empty() ? json(nullptr) : json::parse(body);
        return dispatch(method, splitPath(target), parsedBody);
    } catch (const ValidationError& e) {
        return {kBadRequest, json{{"status", "error"}, {"message", e.what()}, {"field", e.field()}}};
    } catch (const ExpressionSyntaxError& e) {
        return {kBadRequest, errorBody(e.what())};
    } catch (const json::exception& e) {
        return {kBadRequest, errorBody(std::string("Invalid JSON: ") + e.what())};
    } catch (const NotFoundError& e) {
        return {kNotFound, errorBody(e.what())};
    } catch (const std::exception& e) {
        LOG_ERROR(method + " " + target + " failed: " + e.what());
        return {kInternalError, errorBody(e.what())};
    }
}

RouteResult RequestHandler::dispatch(const std::string& method,
                                     const std::vector<std::string>& path,
                                     const json& body) {
    auto notFound = [&]() -> RouteResult {
        std::string joined;
        for (const auto& segment : path) joined += "/" + segment;
        return {kNotFound, errorBody("Not found: " + joined)};
    };
    auto notAllowed = [&]() -> RouteResult {
        return {kMethodNotAllowed, errorBody("Method not allowed: " + method)};
    };

    if (path.size() < 2 || path[0] != "api") {
        return notFound();
    }
    const std::string& resource = path[1];

    // /api/health, /api/node-types
    if (path.size() == 2 && resource == "health") {
        return method == "GET" ? RouteResult{kOk, handleHealth()} : notAllowed();
    }
    if (path.size() == 2 && resource == "node-types") {
        return method == "GET" ? RouteResult{kOk, handleNodeTypes()} : notAllowed();
    }

    if (resource == "workflows") {
        if (path.size() == 2) {
            if (method == "GET") return {kOk, handleListWorkflows()};
            if (method == "POST") return {kCreated, handleCreateWorkflow(body)};
            return notAllowed();
        }

        int64_t id = parseId(path[2]);
        if (path.size() == 3) {
            if (method == "GET") return {kOk, handleGetWorkflow(id)};
            if (method == "PUT") return {kOk, handleUpdateWorkflow(id, body)};
            if (method == "DELETE") return {kOk, handleDeleteWorkflow(id)};
            return notAllowed();
        }

        if (path.size() == 4) {
            const std::string& action = path[3];
            if (action == "nodes") {
                return method == "POST" ? RouteResult{kCreated, handleCreateNode(id, body)} : notAllowed();
            }
            if (action == "edges") {
                return method == "POST" ? RouteResult{kCreated, handleCreateEdge(id, body)} : notAllowed();
            }
            if (action == "validate") {
                return method == "POST" ? RouteResult{kOk, handleValidate(id)} : notAllowed();
            }
            if (action == "plan") {
                return method == "POST" ? handlePlan(id, body) : notAllowed();
            }
            if (action == "available") {
                return method == "GET" ? handleAvailable(id) : notAllowed();
            }
            if (action == "run") {
                return method == "POST" ? RouteResult{kAccepted, handleStartRun(id, body)} : notAllowed();
            }
        }
        return notFound();
    }

    if (resource == "nodes" && path.size() == 3) {
        int64_t id = parseId(path[2]);
        if (method == "PUT") return {kOk, handleUpdateNode(id, body)};
        if (method == "DELETE") return {kOk, handleDeleteNode(id)};
        return notAllowed();
    }

    if (resource == "edges" && path.size() == 3) {
        int64_t id = parseId(path[2]);
        return method == "DELETE" ? RouteResult{kOk, handleDeleteEdge(id)} : notAllowed();
    }

    if (resource == "runs" && path.size() >= 3) {
        const std::string& runId = path[2];
        if (path.size() == 3) {
            return method == "GET" ? RouteResult{kOk, handleGetRun(runId)} : notAllowed();
        }
        if (path.size() == 4 && path[3] == "cancel") {
            return method == "POST" ? RouteResult{kOk, handleCancelRun(runId)} : notAllowed();
        }
    }

    return notFound();
}

// =============================================================================
// Handlers
// =============================================================================

json RequestHandler::handleHealth() {
    return json{
        {"status", "ok"},
        {"service", "weft"},
        {"version", "1.0.0"},
        {"runs", m_runs.size()},
        {"eviction_running", m_runs.running()}
    };
}

json RequestHandler::handleNodeTypes() {
    return json{{"node_types", m_services.describe()}};
}

void RequestHandler::validateWorkflowFields(const Workflow& wf) const {
    if (wf.name.empty()) {
        throw ValidationError("name", "must not be empty");
    }
    if (wf.cronSchedule && !workflow::isValidCron(*wf.cronSchedule)) {
        throw ValidationError("cron_schedule", "invalid cron expression: " + *wf.cronSchedule);
    }
}

void RequestHandler::validateNode(const Node& node) const {
    m_services.get(node.kind).validate(node.metadata, node.structuredOutput);
}

json RequestHandler::handleListWorkflows() {
    json list = json::array();
    for (const auto& wf : m_repository->listWorkflows()) {
        list.push_back(wf);
    }
    return json{{"workflows", list}};
}

json RequestHandler::handleCreateWorkflow(const json& request) {
    Workflow wf = requireObject(request).get<Workflow>();
    validateWorkflowFields(wf);
    Workflow created = m_repository->createWorkflow(wf);
    LOG_INFO("Created workflow " + std::to_string(created.id) + " (" + created.name + ")");
    return created;
}

json RequestHandler::handleGetWorkflow(int64_t id) {
    auto wf = m_repository->getWorkflow(id);
    if (!wf) {
        throw NotFoundError("Workflow not found: " + std::to_string(id));
    }
    json result = *wf;
    result["nodes"] = m_repository->listNodes(id);
    result["edges"] = m_repository->listEdges(id);
    return result;
}

json RequestHandler::handleUpdateWorkflow(int64_t id, const json& request) {
    Workflow wf = requireObject(request).get<Workflow>();
    wf.id = id;
    validateWorkflowFields(wf);
    return m_repository->updateWorkflow(wf);
}

json RequestHandler::handleDeleteWorkflow(int64_t id) {
    m_repository->deleteWorkflow(id);
    LOG_INFO("Deleted workflow " + std::to_string(id));
    return json{{"status", "ok"}, {"deleted", id}};
}

json RequestHandler::handleCreateNode(int64_t workflowId, const json& request) {
    Node node = requireObject(request).get<Node>();
    node.workflowId = workflowId;
    validateNode(node);
    return m_repository->createNode(node);
}

json RequestHandler::handleUpdateNode(int64_t nodeId, const json& request) {
    auto existing = m_repository->getNode(nodeId);
    if (!existing) {
        throw NotFoundError("Node not found: " + std::to_string(nodeId));
    }

    json merged = *existing;
    for (const auto& [key, value] : requireObject(request).items()) {
        if (key == "node_type" || key == "metadata" || key == "structured_output") {
            merged[key] = value;
        }
    }
    Node node = merged.get<Node>();
    validateNode(node);
    return m_repository->updateNode(node);
}

json RequestHandler::handleDeleteNode(int64_t nodeId) {
    m_repository->deleteNode(nodeId);
    return json{{"status", "ok"}, {"deleted", nodeId}};
}

json RequestHandler::handleCreateEdge(int64_t workflowId, const json& request) {
    Edge edge = requireObject(request).get<Edge>();
    edge.workflowId = workflowId;
    return m_repository->createEdge(edge);
}

json RequestHandler::handleDeleteEdge(int64_t edgeId) {
    m_repository->deleteEdge(edgeId);
    return json{{"status", "ok"}, {"deleted", edgeId}};
}

json RequestHandler::handleValidate(int64_t workflowId) {
    auto graph = m_repository->loadGraph(workflowId);
    return workflow::validateWorkflow(graph, m_services);
}

RouteResult RequestHandler::handlePlan(int64_t workflowId, const json& request) {
    json startingInputs = objectField(requireObject(request), "starting_inputs");
    auto graph = m_repository->loadGraph(workflowId);

    DagValidationResult validation = workflow::validateWorkflow(graph, m_services);
    if (!validation.ok()) {
        return {kBadRequest, json{{"status", "error"},
                                  {"message", "Workflow does not validate"},
                                  {"validation", validation}}};
    }

    auto planned = workflow::planWorkflow(graph.nodes, graph.edges, startingInputs, m_services);
    return {kOk, json{{"nodes", planned}}};
}

RouteResult RequestHandler::handleAvailable(int64_t workflowId) {
    auto graph = m_repository->loadGraph(workflowId);

    DagValidationResult validation = workflow::validateWorkflow(graph, m_services);
    if (!validation.ok()) {
        return {kBadRequest, json{{"status", "error"},
                                  {"message", "Workflow does not validate"},
                                  {"validation", validation}}};
    }

    auto available = workflow::availableDataMap(graph.nodes, graph.edges, m_services);
    return {kOk, json{{"available", available}}};
}

json RequestHandler::handleStartRun(int64_t workflowId, const json& request) {
    json inputs = objectField(requireObject(request), "inputs");
    auto graph = m_repository->loadGraph(workflowId);

    std::string runId = m_executor.executeAsync(std::move(graph), std::move(inputs));
    LOG_INFO("Queued run " + runId + " for workflow " + std::to_string(workflowId));
    return json{{"run_id", runId}, {"status", "queued"}};
}

json RequestHandler::handleGetRun(const std::string& runId) {
    auto snapshot = m_runs.get(runId);
    if (!snapshot) {
        throw NotFoundError("Run not found: " + runId);
    }
    return snapshot->toJson(true);
}

json RequestHandler::handleCancelRun(const std::string& runId) {
    if (!m_runs.exists(runId)) {
        throw NotFoundError("Run not found: " + runId);
    }
    bool cancelled = m_runs.cancel(runId);
    return json{{"run_id", runId}, {"cancelled", cancelled}};
}

} // namespace server
} // namespace weft
