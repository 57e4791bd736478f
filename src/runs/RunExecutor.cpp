#include "runs/RunExecutor.hpp"
#include "services/ServiceRegistry.hpp"
#include "workflow/AvailableData.hpp"
#include "workflow/DagValidator.hpp"
#include "workflow/Graph.hpp"
#include "expr/PromptRenderer.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <vector>

namespace weft {
namespace runs {

namespace {

using workflow::Edge;
using workflow::GraphIndex;
using workflow::Node;
using workflow::NodeKind;
using workflow::WorkflowGraph;
using services::ExecutionEnv;
using services::NodeInput;
using services::OnError;
using services::ParentOutput;

/// Thrown when cancellation is observed between nodes
class RunCancelled : public std::runtime_error {
public:
    RunCancelled() : std::runtime_error("Run cancelled") {}
};

/// Thrown when a node with on_error=fail fails
class RunAborted : public std::runtime_error {
public:
    explicit RunAborted(const std::string& message) : std::runtime_error(message) {}
};

enum class NodeState {
    Succeeded,
    Failed,
    SkippedBranch,
    SkippedUpstream,
    ConsumedByLoop
};

struct Counters {
    size_t executed = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

/**
 * One graph being executed: the run's workflow, or an inline sub-workflow
 */
struct GraphRun {
    GraphRun(const WorkflowGraph& g, std::vector<int64_t> topoOrder)
        : graph(g)
        , index(g.nodes, g.edges)
        , order(std::move(topoOrder))
        , topoIndex(workflow::topoIndexOf(order)) {}

    const WorkflowGraph& graph;
    GraphIndex index;
    std::vector<int64_t> order;
    std::map<int64_t, size_t> topoIndex;
    json startingInputs = json::object();
    json base = json::object();
    std::optional<int64_t> workflowId;
    size_t depth = 0;
    std::optional<json> result;
};

/**
 * Outputs and states of one execution scope: the whole graph, or one
 * iteration of a for_each body
 */
struct Scope {
    std::map<int64_t, json> outputs;
    std::map<int64_t, NodeState> states;
};

std::string describe(const Node& node) {
    return "Node " + std::to_string(node.id) + " (" + workflow::toString(node.kind) + ")";
}

/**
 * State of a single run, shared by every graph it executes
 */
class RunContext : public services::SubWorkflowRunner {
public:
    RunContext(RunRegistry& runs,
               const services::ServiceRegistry& services,
               const services::Backends& backends,
               const RunExecutorOptions& options,
               const workflow::WorkflowSource* source,
               std::string runId)
        : m_runs(runs)
        , m_services(services)
        , m_backends(backends)
        , m_options(options)
        , m_source(source)
        , m_runId(std::move(runId)) {}

    const std::string& runId() const { return m_runId; }
    const Counters& counters() const { return m_counters; }

    void emit(EventLevel level, const std::string& message, json data,
              const GraphRun* graph = nullptr) {
        if (graph && graph->workflowId) {
            data["workflow_id"] = *graph->workflowId;
        }
        m_runs.append(m_runId, RunEvent::make(level, message, std::move(data)));
    }

    /**
     * Execute every node of `g` and leave its result in g.result
     */
    void runGraph(GraphRun& g) {
        StackFrame frame(m_stack, &g);
        Scope scope;
        runNodes(g, scope, g.order);
        if (!g.result) {
            g.result = sinkOutputs(g, scope);
        }
    }

    json runWorkflow(int64_t workflowId, const json& input, bool propagateIdentity) override {
        const GraphRun& parent = *m_stack.back();
        if (parent.depth + 1 > m_options.maxSubWorkflowDepth) {
            throw NodeExecutionError("Sub-workflow nesting exceeds the maximum depth of " +
                                     std::to_string(m_options.maxSubWorkflowDepth));
        }
        if (!m_source) {
            throw NodeExecutionError("No workflow source configured for sub-workflow calls");
        }

        WorkflowGraph graph = m_source->loadGraph(workflowId);
        auto validation = workflow::validateWorkflow(graph, m_services);
        if (!validation.ok()) {
            throw NodeExecutionError("Sub-workflow " + std::to_string(workflowId) +
                                     " is invalid: " + validation.errors.front());
        }

        GraphRun sub(graph, validation.topoOrder);
        sub.startingInputs = input.is_object() ? input : json::object();
        sub.workflowId = workflowId;
        sub.depth = parent.depth + 1;
        sub.base = propagateIdentity ? parent.base : expr::makeBaseContext(Clock::now());

        emit(EventLevel::Info, "subworkflow_start", {{"depth", sub.depth}}, &sub);
        try {
            runGraph(sub);
        } catch (const RunAborted& e) {
            throw NodeExecutionError("Sub-workflow " + std::to_string(workflowId) +
                                     " failed: " + e.what());
        }
        return sub.result ? *sub.result : json::object();
    }

private:
    /// Keeps the graph being executed on top of the stack for its lifetime
    struct StackFrame {
        StackFrame(std::vector<GraphRun*>& stack, GraphRun* g) : m_stack(stack) {
            m_stack.push_back(g);
        }
        ~StackFrame() { m_stack.pop_back(); }
        std::vector<GraphRun*>& m_stack;
    };

    void checkCancelled() const {
        if (m_runs.isCancelled(m_runId)) {
            throw RunCancelled();
        }
    }

    void runNodes(GraphRun& g, Scope& scope, const std::vector<int64_t>& nodes) {
        for (int64_t id : nodes) {
            if (scope.states.count(id)) {
                continue;
            }
            if (g.index.node(id)->kind == NodeKind::ForEach) {
                runNodes(g, scope, loopPrerequisites(g, scope, id));
            }
            runNode(g, scope, id);
        }
    }

    /**
     * Nodes outside the body of for_each `loopId` that feed a body node and
     * have not run yet, in topological order. They run before the loop so
     * every iteration sees their outputs.
     */
    std::vector<int64_t> loopPrerequisites(const GraphRun& g, const Scope& scope,
                                           int64_t loopId) const {
        auto body = g.index.descendants(loopId);
        std::set<int64_t> needed;
        for (int64_t id : body) {
            for (int64_t ancestor : g.index.ancestors(id)) {
                if (ancestor != loopId && !body.count(ancestor) && !scope.states.count(ancestor)) {
                    needed.insert(ancestor);
                }
            }
        }

        std::vector<int64_t> ordered;
        for (int64_t id : g.order) {
            if (needed.count(id)) {
                ordered.push_back(id);
            }
        }
        return ordered;
    }

    bool edgeLive(const GraphRun& g, const Scope& scope, const Edge& edge) const {
        const Node* parent = g.index.node(edge.parentId);
        if (!parent || parent->kind != NodeKind::IfElse) {
            return true;
        }
        auto out = scope.outputs.find(edge.parentId);
        if (out == scope.outputs.end() || !edge.branchLabel) {
            return false;
        }
        return out->second.value("branch_taken", "") == *edge.branchLabel;
    }

    void runNode(GraphRun& g, Scope& scope, int64_t id) {
        checkCancelled();

        const Node& node = *g.index.node(id);
        std::string type = workflow::toString(node.kind);
        const auto& incoming = g.index.incoming(id);

        NodeInput input;
        input.nodeId = id;
        input.structuredOutput = node.structuredOutput;

        if (incoming.empty()) {
            input.data = g.startingInputs;
        } else {
            std::optional<int64_t> failedParent;
            for (const Edge* e : incoming) {
                auto state = scope.states.find(e->parentId);
                if (state == scope.states.end()) continue;

                switch (state->second) {
                    case NodeState::Failed:
                    case NodeState::SkippedUpstream:
                        failedParent = e->parentId;
                        break;
                    case NodeState::Succeeded:
                        if (edgeLive(g, scope, *e)) {
                            input.parents.push_back(ParentOutput{
                                e->parentId, g.topoIndex.at(e->parentId),
                                scope.outputs.at(e->parentId)});
                        }
                        break;
                    case NodeState::SkippedBranch:
                    case NodeState::ConsumedByLoop:
                        break;
                }
            }

            if (failedParent) {
                scope.states[id] = NodeState::SkippedUpstream;
                ++m_counters.skipped;
                emit(EventLevel::Warn, "node_skipped",
                     {{"node_id", id}, {"node_type", type}, {"reason", "upstream_error"},
                      {"parent_id", *failedParent}}, &g);
                return;
            }
            if (input.parents.empty()) {
                scope.states[id] = NodeState::SkippedBranch;
                ++m_counters.skipped;
                emit(EventLevel::Info, "branch_skipped", {{"node_id", id}, {"node_type", type}}, &g);
                return;
            }

            workflow::AvailableDataResolver resolver(g.index, g.order);
            input.data = resolver.resolve(id, scope.outputs);
        }

        emit(EventLevel::Info, "node_start", {{"node_id", id}, {"node_type", type}}, &g);
        ++m_counters.executed;
        auto started = std::chrono::steady_clock::now();

        try {
            json output = executeWithRetry(g, node, input);
            if (node.kind == NodeKind::ForEach) {
                output = runLoop(g, scope, node, input, output.value("items", json::array()));
            }

            scope.outputs[id] = output;
            scope.states[id] = NodeState::Succeeded;
            if (node.kind == NodeKind::Return) {
                g.result = output.value("payload", json());
            }

            emit(EventLevel::Info, "node_output",
                 {{"node_id", id}, {"node_type", type}, {"output", output},
                  {"duration_ms", elapsedMs(started)}}, &g);
        } catch (const RunCancelled&) {
            throw;
        } catch (const RunAborted&) {
            throw;
        } catch (const std::exception& e) {
            handleFailure(g, scope, node, e.what(), elapsedMs(started));
        }
    }

    void handleFailure(GraphRun& g, Scope& scope, const Node& node,
                       const std::string& error, int64_t durationMs) {
        OnError policy = services::onErrorPolicy(node.metadata);
        ++m_counters.failed;

        json data = {
            {"node_id", node.id},
            {"node_type", workflow::toString(node.kind)},
            {"error", error},
            {"on_error", services::toString(policy)},
            {"duration_ms", durationMs}
        };

        switch (policy) {
            case OnError::Fail:
                scope.states[node.id] = NodeState::Failed;
                emit(EventLevel::Error, "node_error", std::move(data), &g);
                throw RunAborted(describe(node) + " failed: " + error);

            case OnError::Skip:
                scope.states[node.id] = NodeState::Failed;
                emit(EventLevel::Error, "node_error", std::move(data), &g);
                return;

            case OnError::Continue:
                scope.outputs[node.id] = json::object();
                scope.states[node.id] = NodeState::Succeeded;
                emit(EventLevel::Warn, "node_error", std::move(data), &g);
                return;
        }
    }

    json executeWithRetry(const GraphRun& g, const Node& node, const NodeInput& input) {
        const services::NodeService& service = m_services.get(node.kind);

        ExecutionEnv env;
        env.base = g.base;
        env.expressionTimeout = m_options.expressionTimeout;
        env.backends = &m_backends;
        env.subWorkflows = this;

        auto timeout = node.metadata.find("timeout_ms");
        if (timeout != node.metadata.end() && timeout->is_number_integer()) {
            env.expressionTimeout = std::chrono::milliseconds(timeout->get<int64_t>());
        }

        int64_t retries = 0;
        auto retry = node.metadata.find("retry");
        if (retry != node.metadata.end() && retry->is_number_integer()) {
            retries = std::max<int64_t>(0, retry->get<int64_t>());
        }

        for (int64_t attempt = 1; ; ++attempt) {
            try {
                return service.execute(input, node.metadata, env);
            } catch (const RunCancelled&) {
                throw;
            } catch (const RunAborted&) {
                throw;
            } catch (const std::exception& e) {
                if (attempt > retries) {
                    throw;
                }
                emit(EventLevel::Warn, "node_retry",
                     {{"node_id", node.id}, {"attempt", attempt}, {"error", e.what()}}, &g);
                checkCancelled();
            }
        }
    }

    /**
     * Run the descendants of a for_each node once per item
     *
     * Each iteration runs in a copy of the enclosing scope in which the
     * loop node's output is its input plus `item` and `index`. The
     * iteration result is the list of the body's sink outputs.
     */
    json runLoop(GraphRun& g, Scope& scope, const Node& node, const NodeInput& input,
                 const json& items) {
        std::vector<int64_t> body;
        auto descendants = g.index.descendants(node.id);
        for (int64_t id : g.order) {
            if (descendants.count(id)) {
                body.push_back(id);
                scope.states[id] = NodeState::ConsumedByLoop;
            }
        }

        bool flatten = node.metadata.value("flatten", true);
        json results = json::array();
        size_t processed = 0;

        for (size_t i = 0; i < items.size(); ++i) {
            checkCancelled();

            Scope iteration = scope;
            for (int64_t id : body) {
                iteration.states.erase(id);
            }
            json loopValue = input.data.is_object() ? input.data : json::object();
            loopValue["item"] = items[i];
            loopValue["index"] = i;
            iteration.outputs[node.id] = loopValue;
            iteration.states[node.id] = NodeState::Succeeded;

            runNodes(g, iteration, body);

            json sinks = json::array();
            for (int64_t id : body) {
                if (isSink(g, iteration, id)) {
                    sinks.push_back(iteration.outputs[id]);
                }
            }

            if (flatten) {
                for (auto& s : sinks) {
                    results.push_back(std::move(s));
                }
            } else {
                results.push_back(std::move(sinks));
            }
            ++processed;
        }

        return {{"items_processed", processed}, {"results", results}};
    }

    /**
     * Succeeded node with no children in `scope`. A for_each node counts as
     * one since its descendants run inside the loop.
     */
    static bool isSink(const GraphRun& g, const Scope& scope, int64_t id) {
        auto state = scope.states.find(id);
        if (state == scope.states.end() || state->second != NodeState::Succeeded) {
            return false;
        }
        return g.index.outdegree(id) == 0 || g.index.node(id)->kind == NodeKind::ForEach;
    }

    /// {"<node id>": output} of every sink of the top-level scope
    json sinkOutputs(const GraphRun& g, const Scope& scope) const {
        json sinks = json::object();
        for (int64_t id : g.order) {
            if (isSink(g, scope, id)) {
                sinks[std::to_string(id)] = scope.outputs.at(id);
            }
        }
        return sinks;
    }

    static int64_t elapsedMs(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since).count();
    }

    RunRegistry& m_runs;
    const services::ServiceRegistry& m_services;
    const services::Backends& m_backends;
    const RunExecutorOptions& m_options;
    const workflow::WorkflowSource* m_source;
    std::string m_runId;
    Counters m_counters;
    std::vector<GraphRun*> m_stack;
};

} // anonymous namespace

RunExecutor::RunExecutor(RunRegistry& runs,
                         const services::ServiceRegistry& services,
                         services::Backends backends,
                         RunExecutorOptions options)
    : m_runs(runs)
    , m_services(services)
    , m_backends(std::move(backends))
    , m_options(options)
    , m_pool(std::max<size_t>(1, options.workerThreads)) {}

RunExecutor::~RunExecutor() {
    shutdown();
}

void RunExecutor::setWorkflowSource(std::shared_ptr<const workflow::WorkflowSource> source) {
    m_source = std::move(source);
}

std::string RunExecutor::execute(const WorkflowGraph& graph,
                                 const json& startingInputs,
                                 const std::string& kind) {
    std::string runId = m_runs.create(kind);
    run(runId, graph, startingInputs);
    return runId;
}

std::string RunExecutor::executeAsync(WorkflowGraph graph,
                                      json startingInputs,
                                      const std::string& kind) {
    if (m_shutdown.load()) {
        throw ConfigurationError("Run executor is shut down");
    }
    std::string runId = m_runs.create(kind);
    boost::asio::post(m_pool, [this, runId, graph = std::move(graph),
                               inputs = std::move(startingInputs)]() {
        try {
            run(runId, graph, inputs);
        } catch (const std::exception& e) {
            LOG_ERROR("Run " + runId + " aborted: " + e.what());
            m_runs.finish(runId, RunStatus::Failed);
        }
    });
    return runId;
}

void RunExecutor::shutdown() {
    m_shutdown.store(true);
    m_pool.join();
}

void RunExecutor::run(const std::string& runId, const WorkflowGraph& graph,
                      const json& startingInputs) {
    auto started = std::chrono::steady_clock::now();
    m_runs.markRunning(runId);
    LOG_INFO("Run " + runId + " started (" + std::to_string(graph.nodes.size()) + " nodes)");

    RunContext ctx(m_runs, m_services, m_backends, m_options, m_source.get(), runId);
    RunStatus status = RunStatus::Succeeded;
    json result = nullptr;

    auto validation = workflow::validateWorkflow(graph, m_services);
    if (!validation.ok()) {
        ctx.emit(EventLevel::Error, "dag_invalid",
                 {{"errors", validation.errors}, {"warnings", validation.warnings}});
        status = RunStatus::Failed;
    } else {
        GraphRun g(graph, validation.topoOrder);
        g.startingInputs = startingInputs.is_object() ? startingInputs : json::object();
        g.base = expr::makeBaseContext(Clock::now());
        g.base["run_id"] = runId;

        try {
            ctx.runGraph(g);
            result = g.result ? *g.result : json(nullptr);
        } catch (const RunCancelled&) {
            ctx.emit(EventLevel::Warn, "run_cancelled", json::object());
            status = RunStatus::Failed;
        } catch (const RunAborted& e) {
            LOG_WARN("Run " + runId + ": " + e.what());
            status = RunStatus::Failed;
        } catch (const std::exception& e) {
            ctx.emit(EventLevel::Error, "run_error", {{"error", e.what()}});
            status = RunStatus::Failed;
        }
    }

    const auto& counters = ctx.counters();
    int64_t durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    ctx.emit(status == RunStatus::Succeeded ? EventLevel::Info : EventLevel::Error, "run_summary",
             {{"status", toString(status)},
              {"executed", counters.executed},
              {"skipped", counters.skipped},
              {"failed", counters.failed},
              {"result", result},
              {"duration_ms", durationMs}});

    m_runs.finish(runId, status, result);
}

} // namespace runs
} // namespace weft
