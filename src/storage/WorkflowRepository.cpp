#include "storage/WorkflowRepository.hpp"
#include "core/Errors.hpp"
#include "core/TimeUtil.hpp"
#include <initializer_list>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>

namespace weft {
namespace storage {

std::string generateUuid() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;
    static std::mutex mutex;

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(mutex);
        high = dis(gen);
        low = dis(gen);
    }
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // variant 1

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

WorkflowGraph WorkflowRepository::loadGraph(int64_t workflowId) const {
    auto workflow = getWorkflow(workflowId);
    if (!workflow) {
        throw NotFoundError("Workflow not found: " + std::to_string(workflowId));
    }
    WorkflowGraph graph;
    graph.nodes = listNodes(workflowId);
    graph.edges = listEdges(workflowId);
    graph.triggers = workflow->triggers();
    return graph;
}

// =============================================================================
// MemoryWorkflowRepository
// =============================================================================

Workflow MemoryWorkflowRepository::createWorkflow(const Workflow& workflow) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Workflow stored = workflow;
    stored.id = m_nextWorkflowId++;
    if (stored.uuid.empty()) {
        stored.uuid = generateUuid();
    }
    stored.createdAt = formatIsoTimestamp(nowMillis());
    stored.updatedAt = stored.createdAt;
    m_workflows[stored.id] = stored;
    return stored;
}

Workflow MemoryWorkflowRepository::updateWorkflow(const Workflow& workflow) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workflows.find(workflow.id);
    if (it == m_workflows.end()) {
        throw NotFoundError("Workflow not found: " + std::to_string(workflow.id));
    }
    Workflow stored = workflow;
    stored.uuid = it->second.uuid;
    stored.createdAt = it->second.createdAt;
    stored.updatedAt = formatIsoTimestamp(nowMillis());
    it->second = stored;
    return stored;
}

void MemoryWorkflowRepository::deleteWorkflow(int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_workflows.erase(id)) {
        throw NotFoundError("Workflow not found: " + std::to_string(id));
    }
    for (auto it = m_edges.begin(); it != m_edges.end(); ) {
        it = it->second.workflowId == id ? m_edges.erase(it) : std::next(it);
    }
    for (auto it = m_nodes.begin(); it != m_nodes.end(); ) {
        it = it->second.workflowId == id ? m_nodes.erase(it) : std::next(it);
    }
}

std::optional<Workflow> MemoryWorkflowRepository::getWorkflow(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workflows.find(id);
    if (it == m_workflows.end()) return std::nullopt;
    return it->second;
}

std::vector<Workflow> MemoryWorkflowRepository::listWorkflows() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Workflow> out;
    for (const auto& [id, w] : m_workflows) {
        out.push_back(w);
    }
    return out;
}

Node MemoryWorkflowRepository::createNode(const Node& node) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_workflows.count(node.workflowId)) {
        throw NotFoundError("Workflow not found: " + std::to_string(node.workflowId));
    }
    Node stored = node;
    stored.id = m_nextNodeId++;
    m_nodes[stored.id] = stored;
    return stored;
}

Node MemoryWorkflowRepository::updateNode(const Node& node) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_nodes.find(node.id);
    if (it == m_nodes.end()) {
        throw NotFoundError("Node not found: " + std::to_string(node.id));
    }
    Node stored = node;
    stored.workflowId = it->second.workflowId;
    it->second = stored;
    return stored;
}

void MemoryWorkflowRepository::deleteNode(int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_nodes.erase(id)) {
        throw NotFoundError("Node not found: " + std::to_string(id));
    }
    for (auto it = m_edges.begin(); it != m_edges.end(); ) {
        bool touches = it->second.parentId == id || it->second.childId == id;
        it = touches ? m_edges.erase(it) : std::next(it);
    }
}

std::optional<Node> MemoryWorkflowRepository::getNode(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) return std::nullopt;
    return it->second;
}

std::vector<Node> MemoryWorkflowRepository::listNodes(int64_t workflowId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Node> out;
    for (const auto& [id, n] : m_nodes) {
        if (n.workflowId == workflowId) out.push_back(n);
    }
    return out;
}

Edge MemoryWorkflowRepository::createEdge(const Edge& edge) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_workflows.count(edge.workflowId)) {
        throw NotFoundError("Workflow not found: " + std::to_string(edge.workflowId));
    }
    for (int64_t endpoint : {edge.parentId, edge.childId}) {
        auto it = m_nodes.find(endpoint);
        if (it == m_nodes.end()) {
            throw NotFoundError("Node not found: " + std::to_string(endpoint));
        }
        if (it->second.workflowId != edge.workflowId) {
            throw ValidationError("edge", "node " + std::to_string(endpoint) +
                                          " belongs to another workflow");
        }
    }
    if (edge.parentId == edge.childId) {
        throw ValidationError("edge", "parent_id and child_id must differ");
    }
    for (const auto& [id, e] : m_edges) {
        if (e.parentId == edge.parentId && e.childId == edge.childId) {
            throw ValidationError("edge", "an edge between nodes " + std::to_string(edge.parentId) +
                                          " and " + std::to_string(edge.childId) +
                                          " already exists");
        }
    }
    Edge stored = edge;
    stored.id = m_nextEdgeId++;
    m_edges[stored.id] = stored;
    return stored;
}

void MemoryWorkflowRepository::deleteEdge(int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_edges.erase(id)) {
        throw NotFoundError("Edge not found: " + std::to_string(id));
    }
}

std::optional<Edge> MemoryWorkflowRepository::getEdge(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_edges.find(id);
    if (it == m_edges.end()) return std::nullopt;
    return it->second;
}

std::vector<Edge> MemoryWorkflowRepository::listEdges(int64_t workflowId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Edge> out;
    for (const auto& [id, e] : m_edges) {
        if (e.workflowId == workflowId) out.push_back(e);
    }
    return out;
}

} // namespace storage
} // namespace weft
