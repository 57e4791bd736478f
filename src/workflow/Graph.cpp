#include "workflow/Graph.hpp"
#include <algorithm>
#include <queue>

namespace weft {
namespace workflow {

namespace {

const std::vector<const Edge*>& emptyEdges() {
    static const std::vector<const Edge*> empty;
    return empty;
}

} // anonymous namespace

GraphIndex::GraphIndex(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    for (const auto& n : nodes) {
        m_nodes[n.id] = &n;
    }
    for (const auto& e : edges) {
        if (!contains(e.parentId) || !contains(e.childId)) {
            continue;
        }
        m_outgoing[e.parentId].push_back(&e);
        m_incoming[e.childId].push_back(&e);
    }
}

const Node* GraphIndex::node(int64_t id) const {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? it->second : nullptr;
}

std::vector<int64_t> GraphIndex::nodeIds() const {
    std::vector<int64_t> ids;
    ids.reserve(m_nodes.size());
    for (const auto& [id, n] : m_nodes) {
        ids.push_back(id);
    }
    return ids;
}

const std::vector<const Edge*>& GraphIndex::incoming(int64_t id) const {
    auto it = m_incoming.find(id);
    return it != m_incoming.end() ? it->second : emptyEdges();
}

const std::vector<const Edge*>& GraphIndex::outgoing(int64_t id) const {
    auto it = m_outgoing.find(id);
    return it != m_outgoing.end() ? it->second : emptyEdges();
}

std::set<int64_t> GraphIndex::ancestors(int64_t id) const {
    std::set<int64_t> visited;
    std::queue<int64_t> queue;
    queue.push(id);

    while (!queue.empty()) {
        int64_t current = queue.front();
        queue.pop();
        for (const Edge* e : incoming(current)) {
            if (e->parentId != id && visited.insert(e->parentId).second) {
                queue.push(e->parentId);
            }
        }
    }
    return visited;
}

std::set<int64_t> GraphIndex::descendants(int64_t id) const {
    std::set<int64_t> visited;
    std::queue<int64_t> queue;
    queue.push(id);

    while (!queue.empty()) {
        int64_t current = queue.front();
        queue.pop();
        for (const Edge* e : outgoing(current)) {
            if (e->childId != id && visited.insert(e->childId).second) {
                queue.push(e->childId);
            }
        }
    }
    return visited;
}

TopoResult GraphIndex::topologicalSort() const {
    std::map<int64_t, size_t> inDegree;
    for (const auto& [id, n] : m_nodes) {
        inDegree[id] = indegree(id);
    }

    // Ordered set: lowest ready id first
    std::set<int64_t> ready;
    for (const auto& [id, degree] : inDegree) {
        if (degree == 0) {
            ready.insert(id);
        }
    }

    TopoResult result;
    while (!ready.empty()) {
        int64_t current = *ready.begin();
        ready.erase(ready.begin());
        result.order.push_back(current);

        for (const Edge* e : outgoing(current)) {
            if (--inDegree[e->childId] == 0) {
                ready.insert(e->childId);
            }
        }
    }

    if (result.order.size() != m_nodes.size()) {
        std::set<int64_t> sorted(result.order.begin(), result.order.end());
        for (const auto& [id, n] : m_nodes) {
            if (!sorted.count(id)) {
                result.remaining.push_back(id);
            }
        }
    }
    return result;
}

std::vector<int64_t> GraphIndex::findCycle() const {
    enum class Mark { White, Grey, Black };
    std::map<int64_t, Mark> marks;
    for (const auto& [id, n] : m_nodes) {
        marks[id] = Mark::White;
    }

    std::vector<int64_t> stack;
    std::vector<int64_t> cycle;

    // Iterative DFS keeping the grey path in `stack`
    for (const auto& [start, n] : m_nodes) {
        if (marks[start] != Mark::White) continue;

        std::vector<std::pair<int64_t, size_t>> frames;
        frames.emplace_back(start, 0);
        marks[start] = Mark::Grey;
        stack.push_back(start);

        while (!frames.empty()) {
            auto& [current, nextEdge] = frames.back();
            const auto& out = outgoing(current);

            if (nextEdge < out.size()) {
                int64_t child = out[nextEdge++]->childId;
                if (marks[child] == Mark::Grey) {
                    auto it = std::find(stack.begin(), stack.end(), child);
                    cycle.assign(it, stack.end());
                    cycle.push_back(child);
                    return cycle;
                }
                if (marks[child] == Mark::White) {
                    marks[child] = Mark::Grey;
                    stack.push_back(child);
                    frames.emplace_back(child, 0);
                }
            } else {
                marks[current] = Mark::Black;
                stack.pop_back();
                frames.pop_back();
            }
        }
    }
    return cycle;
}

std::map<int64_t, size_t> topoIndexOf(const std::vector<int64_t>& order) {
    std::map<int64_t, size_t> index;
    for (size_t i = 0; i < order.size(); ++i) {
        index[order[i]] = i;
    }
    return index;
}

} // namespace workflow
} // namespace weft
