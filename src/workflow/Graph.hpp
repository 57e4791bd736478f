#pragma once

#include "workflow/Types.hpp"
#include <map>
#include <set>
#include <vector>

namespace weft {
namespace workflow {

/**
 * Result of Kahn's algorithm
 *
 * When `remaining` is non-empty the graph has a cycle and `order` only
 * holds the nodes that could be sorted.
 */
struct TopoResult {
    std::vector<int64_t> order;
    std::vector<int64_t> remaining;

    bool acyclic() const { return remaining.empty(); }
};

/**
 * Adjacency view over a node/edge list, rebuilt per call
 *
 * Edges whose endpoints are not in the node list are ignored here; the
 * validator reports them separately. Node and edge vectors must outlive
 * the index.
 */
class GraphIndex {
public:
    GraphIndex(const std::vector<Node>& nodes, const std::vector<Edge>& edges);

    const Node* node(int64_t id) const;
    bool contains(int64_t id) const { return m_nodes.count(id) > 0; }

    /// Node ids in ascending order
    std::vector<int64_t> nodeIds() const;

    /// Edges in declaration order
    const std::vector<const Edge*>& incoming(int64_t id) const;
    const std::vector<const Edge*>& outgoing(int64_t id) const;

    size_t indegree(int64_t id) const { return incoming(id).size(); }
    size_t outdegree(int64_t id) const { return outgoing(id).size(); }

    /// Transitive predecessors (excluding the node itself)
    std::set<int64_t> ancestors(int64_t id) const;

    /// Transitive successors (excluding the node itself)
    std::set<int64_t> descendants(int64_t id) const;

    /**
     * Kahn's algorithm; among ready nodes the lowest id goes first so the
     * order is deterministic
     */
    TopoResult topologicalSort() const;

    /**
     * One representative cycle, as a closed path (first id repeated last).
     * Empty when the graph is acyclic.
     */
    std::vector<int64_t> findCycle() const;

private:
    std::map<int64_t, const Node*> m_nodes;
    std::map<int64_t, std::vector<const Edge*>> m_incoming;
    std::map<int64_t, std::vector<const Edge*>> m_outgoing;
};

/**
 * Position of each node in a topological order
 */
std::map<int64_t, size_t> topoIndexOf(const std::vector<int64_t>& order);

} // namespace workflow
} // namespace weft
