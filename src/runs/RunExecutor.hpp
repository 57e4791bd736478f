#pragma once

#include "runs/RunRegistry.hpp"
#include "services/Backends.hpp"
#include "workflow/Types.hpp"
#include "workflow/WorkflowSource.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace weft {
namespace services { class ServiceRegistry; }

namespace runs {

struct RunExecutorOptions {
    std::chrono::milliseconds expressionTimeout{100};
    size_t maxSubWorkflowDepth = 4;
    size_t workerThreads = 2;
};

/**
 * Executes workflow graphs and records their progress in a RunRegistry
 *
 * Nodes run sequentially in topological order. Every step is reported as a
 * RunEvent: node_start, node_output, node_error, node_retry, node_skipped,
 * branch_skipped, and a closing run_summary (or dag_invalid /
 * run_cancelled before it). The run is finished right after the summary.
 *
 * Usage:
 *   RunExecutor executor(RunRegistry::instance(), ServiceRegistry::instance(), backends);
 *   std::string runId = executor.execute(graph, {{"text", "hello"}});
 *   auto snapshot = RunRegistry::instance().get(runId);
 */
class RunExecutor {
public:
    RunExecutor(RunRegistry& runs,
                const services::ServiceRegistry& services,
                services::Backends backends = {},
                RunExecutorOptions options = {});
    ~RunExecutor();

    RunExecutor(const RunExecutor&) = delete;
    RunExecutor& operator=(const RunExecutor&) = delete;

    /**
     * Source used to load the graphs of `workflow` nodes. Without one,
     * sub-workflow calls fail.
     */
    void setWorkflowSource(std::shared_ptr<const workflow::WorkflowSource> source);

    /**
     * Run to completion on the calling thread and return the run id
     */
    std::string execute(const workflow::WorkflowGraph& graph,
                        const json& startingInputs = json::object(),
                        const std::string& kind = "workflow");

    /**
     * Create the run, queue it on the worker pool and return its id at once
     */
    std::string executeAsync(workflow::WorkflowGraph graph,
                             json startingInputs = json::object(),
                             const std::string& kind = "workflow");

    /**
     * Wait for every queued run to finish. No more runs can be queued.
     */
    void shutdown();

    const RunExecutorOptions& options() const { return m_options; }

private:
    void run(const std::string& runId, const workflow::WorkflowGraph& graph,
             const json& startingInputs);

    RunRegistry& m_runs;
    const services::ServiceRegistry& m_services;
    services::Backends m_backends;
    RunExecutorOptions m_options;
    std::shared_ptr<const workflow::WorkflowSource> m_source;

    boost::asio::thread_pool m_pool;
    std::atomic<bool> m_shutdown{false};
};

} // namespace runs
} // namespace weft
