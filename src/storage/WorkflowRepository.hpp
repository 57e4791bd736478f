#pragma once

#include "workflow/Types.hpp"
#include "workflow/WorkflowSource.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace weft {
namespace storage {

using workflow::Edge;
using workflow::Node;
using workflow::Workflow;
using workflow::WorkflowGraph;

/**
 * Persistence of workflows, their nodes and their edges
 *
 * Ids, uuids and timestamps are assigned by the repository. Deleting a
 * workflow deletes its nodes; deleting a node deletes its edges. Operations
 * on missing records throw NotFoundError; invalid edges (self edges,
 * duplicates, endpoints in another workflow) throw ValidationError.
 */
class WorkflowRepository : public workflow::WorkflowSource {
public:
    ~WorkflowRepository() override = default;

    // === Workflows ===

    virtual Workflow createWorkflow(const Workflow& workflow) = 0;
    virtual Workflow updateWorkflow(const Workflow& workflow) = 0;
    virtual void deleteWorkflow(int64_t id) = 0;
    virtual std::optional<Workflow> getWorkflow(int64_t id) const = 0;
    virtual std::vector<Workflow> listWorkflows() const = 0;

    // === Nodes ===

    virtual Node createNode(const Node& node) = 0;
    virtual Node updateNode(const Node& node) = 0;
    virtual void deleteNode(int64_t id) = 0;
    virtual std::optional<Node> getNode(int64_t id) const = 0;
    virtual std::vector<Node> listNodes(int64_t workflowId) const = 0;

    // === Edges ===

    virtual Edge createEdge(const Edge& edge) = 0;
    virtual void deleteEdge(int64_t id) = 0;
    virtual std::optional<Edge> getEdge(int64_t id) const = 0;
    virtual std::vector<Edge> listEdges(int64_t workflowId) const = 0;

    /**
     * Workflow triggers, nodes (by id) and edges (by id)
     */
    WorkflowGraph loadGraph(int64_t workflowId) const override;
};

/// Random RFC 4122 version 4 uuid
std::string generateUuid();

/**
 * Repository kept in process memory. Thread-safe.
 */
class MemoryWorkflowRepository : public WorkflowRepository {
public:
    MemoryWorkflowRepository() = default;

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

private:
    std::map<int64_t, Workflow> m_workflows;
    std::map<int64_t, Node> m_nodes;
    std::map<int64_t, Edge> m_edges;
    int64_t m_nextWorkflowId = 1;
    int64_t m_nextNodeId = 1;
    int64_t m_nextEdgeId = 1;
    mutable std::mutex m_mutex;
};

} // namespace storage
} // namespace weft
