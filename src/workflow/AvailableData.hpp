#pragma once

#include "workflow/Graph.hpp"
#include "workflow/Types.hpp"
#include <map>
#include <vector>

namespace weft {
namespace services { class ServiceRegistry; }

namespace workflow {

/**
 * Computes the data visible to a node: the union of the outputs of all its
 * transitive ancestors, merged in topological order (highest topo index
 * wins on key collisions).
 */
class AvailableDataResolver {
public:
    AvailableDataResolver(const GraphIndex& graph, const std::vector<int64_t>& topoOrder);

    /**
     * Merge the outputs of every ancestor of `target` found in `outputs`.
     * Ancestors without an entry are ignored.
     */
    json resolve(int64_t target, const std::map<int64_t, json>& outputs,
                 std::vector<std::string>* notes = nullptr) const;

private:
    const GraphIndex& m_graph;
    std::map<int64_t, size_t> m_topoIndex;
};

/**
 * One-shot form of AvailableDataResolver::resolve. The graph must be acyclic;
 * throws InvariantViolation otherwise.
 */
json resolveAvailableData(const std::vector<Node>& nodes,
                          const std::vector<Edge>& edges,
                          int64_t target,
                          const std::map<int64_t, json>& outputs);

/**
 * Available-data shape for every node, computed from planned output shapes.
 * Returns {"<node id>": shape}. Throws InvariantViolation on invalid graphs.
 */
json availableDataMap(const std::vector<Node>& nodes,
                      const std::vector<Edge>& edges,
                      const services::ServiceRegistry& registry,
                      const json& startingInputs = json::object());

} // namespace workflow
} // namespace weft
