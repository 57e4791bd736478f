#pragma once

#include "storage/WorkflowRepository.hpp"
#include <memory>
#include <string>

namespace weft {
namespace storage {

/**
 * SQLite-backed workflow repository
 *
 * Tables: workflows, nodes, node_edges. Edges are unique per
 * (parent_id, child_id), may not loop on a node, and are deleted with
 * either endpoint; nodes are deleted with their workflow.
 *
 * Usage:
 *   SqliteWorkflowRepository repo("./weft.db");
 *   auto wf = repo.createWorkflow(workflow);
 *   auto graph = repo.loadGraph(wf.id);
 */
class SqliteWorkflowRepository : public WorkflowRepository {
public:
    /**
     * Open or create a database (":memory:" for a private in-memory one)
     */
    explicit SqliteWorkflowRepository(const std::string& dbPath);
    ~SqliteWorkflowRepository() override;

    SqliteWorkflowRepository(const SqliteWorkflowRepository&) = delete;
    SqliteWorkflowRepository& operator=(const SqliteWorkflowRepository&) = delete;

    Workflow createWorkflow(const Workflow& workflow) override;
    Workflow updateWorkflow(const Workflow& workflow) override;
    void deleteWorkflow(int64_t id) override;
    std::optional<Workflow> getWorkflow(int64_t id) const override;
    std::vector<Workflow> listWorkflows() const override;

    Node createNode(const Node& node) override;
    Node updateNode(const Node& node) override;
    void deleteNode(int64_t id) override;
    std::optional<Node> getNode(int64_t id) const override;
    std::vector<Node> listNodes(int64_t workflowId) const override;

    Edge createEdge(const Edge& edge) override;
    void deleteEdge(int64_t id) override;
    std::optional<Edge> getEdge(int64_t id) const override;
    std::vector<Edge> listEdges(int64_t workflowId) const override;

    const std::string& dbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace weft
