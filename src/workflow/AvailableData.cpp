#include "workflow/AvailableData.hpp"
#include "workflow/Shape.hpp"
#include "workflow/ShapePlanner.hpp"
#include "core/Errors.hpp"
#include <algorithm>

namespace weft {
namespace workflow {

AvailableDataResolver::AvailableDataResolver(const GraphIndex& graph,
                                             const std::vector<int64_t>& topoOrder)
    : m_graph(graph)
    , m_topoIndex(topoIndexOf(topoOrder)) {}

json AvailableDataResolver::resolve(int64_t target, const std::map<int64_t, json>& outputs,
                                    std::vector<std::string>* notes) const {
    std::vector<int64_t> ancestors;
    for (int64_t id : m_graph.ancestors(target)) {
        if (outputs.count(id)) {
            ancestors.push_back(id);
        }
    }
    std::sort(ancestors.begin(), ancestors.end(), [this](int64_t a, int64_t b) {
        auto ia = m_topoIndex.find(a);
        auto ib = m_topoIndex.find(b);
        size_t ka = ia != m_topoIndex.end() ? ia->second : 0;
        size_t kb = ib != m_topoIndex.end() ? ib->second : 0;
        return ka != kb ? ka < kb : a < b;
    });

    std::vector<std::pair<int64_t, json>> sources;
    sources.reserve(ancestors.size());
    for (int64_t id : ancestors) {
        sources.emplace_back(id, outputs.at(id));
    }
    return unionMerge(sources, notes);
}

json resolveAvailableData(const std::vector<Node>& nodes,
                          const std::vector<Edge>& edges,
                          int64_t target,
                          const std::map<int64_t, json>& outputs) {
    GraphIndex graph(nodes, edges);
    TopoResult topo = graph.topologicalSort();
    if (!topo.acyclic()) {
        throw InvariantViolation("Cannot resolve available data on a cyclic graph");
    }
    return AvailableDataResolver(graph, topo.order).resolve(target, outputs);
}

json availableDataMap(const std::vector<Node>& nodes,
                      const std::vector<Edge>& edges,
                      const services::ServiceRegistry& registry,
                      const json& startingInputs) {
    std::vector<PlannedNode> plan = planWorkflow(nodes, edges, startingInputs, registry);

    std::vector<int64_t> order;
    std::map<int64_t, json> shapes;
    for (const auto& planned : plan) {
        order.push_back(planned.nodeId);
        shapes[planned.nodeId] = planned.outputShape;
    }

    GraphIndex graph(nodes, edges);
    AvailableDataResolver resolver(graph, order);
    json result = json::object();
    for (const auto& planned : plan) {
        result[std::to_string(planned.nodeId)] = resolver.resolve(planned.nodeId, shapes);
    }
    return result;
}

} // namespace workflow
} // namespace weft
