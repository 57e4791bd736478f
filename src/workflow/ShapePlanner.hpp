#pragma once

#include "workflow/Types.hpp"
#include <string>
#include <vector>

namespace weft {
namespace services { class ServiceRegistry; }

namespace workflow {

/**
 * Predicted input and output shape of one node
 */
struct PlannedNode {
    int64_t nodeId = 0;
    NodeKind kind = NodeKind::Job;
    json inputShape = json::object();
    json outputShape = json::object();
    std::vector<std::string> notes;
};

void to_json(json& j, const PlannedNode& planned);
void from_json(const json& j, PlannedNode& planned);

/**
 * Predict the shape flowing through every node, in topological order
 *
 * A root's input shape is the shape of `startingInputs`; any other node's
 * input shape is the union of its direct parents' output shapes (later
 * topo-order parent wins, conflicts noted). The output shape is the
 * declared structured_output when present, else the service's plan().
 *
 * Throws InvariantViolation if the graph does not pass validateDag.
 */
std::vector<PlannedNode> planWorkflow(const std::vector<Node>& nodes,
                                      const std::vector<Edge>& edges,
                                      const json& startingInputs,
                                      const services::ServiceRegistry& registry);

} // namespace workflow
} // namespace weft
