#pragma once

#include "workflow/Types.hpp"
#include <string>
#include <vector>

namespace weft {
namespace services { class ServiceRegistry; }

namespace workflow {

/**
 * Outcome of validating a workflow graph
 *
 * topoOrder is only meaningful when errors is empty.
 */
struct DagValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<int64_t> topoOrder;

    bool ok() const { return errors.empty(); }
};

void to_json(json& j, const DagValidationResult& result);
void from_json(const json& j, DagValidationResult& result);

/**
 * Structural validation of a workflow graph. Never throws.
 *
 * Checks edge endpoints, self edges and duplicates, acyclicity (Kahn with
 * lowest-id tie-break), fan-in (only merge nodes may have several parents),
 * return placement, if_else branch labels and trigger configuration.
 */
DagValidationResult validateDag(const std::vector<Node>& nodes,
                                const std::vector<Edge>& edges,
                                const WorkflowTriggers& triggers);

/**
 * validateDag plus every node's metadata validation through its service.
 * Metadata problems are reported as "Node <id> (<type>): <message>".
 */
DagValidationResult validateWorkflow(const WorkflowGraph& graph,
                                     const services::ServiceRegistry& registry);

} // namespace workflow
} // namespace weft
