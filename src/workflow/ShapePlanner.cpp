#include "workflow/ShapePlanner.hpp"
#include "workflow/DagValidator.hpp"
#include "workflow/Graph.hpp"
#include "workflow/Shape.hpp"
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <map>

namespace weft {
namespace workflow {

void to_json(json& j, const PlannedNode& planned) {
    j = json{
        {"node_id", planned.nodeId},
        {"node_type", toString(planned.kind)},
        {"input_shape", planned.inputShape},
        {"output_shape", planned.outputShape},
        {"notes", planned.notes}
    };
}

void from_json(const json& j, PlannedNode& planned) {
    planned.nodeId = j.at("node_id").get<int64_t>();
    std::string type = j.at("node_type").get<std::string>();
    auto kind = parseNodeKind(type);
    if (!kind) {
        throw ValidationError("node_type", "unknown node type '" + type + "'");
    }
    planned.kind = *kind;
    planned.inputShape = j.value("input_shape", json::object());
    planned.outputShape = j.value("output_shape", json::object());
    planned.notes = j.value("notes", std::vector<std::string>{});
}

std::vector<PlannedNode> planWorkflow(const std::vector<Node>& nodes,
                                      const std::vector<Edge>& edges,
                                      const json& startingInputs,
                                      const services::ServiceRegistry& registry) {
    // Triggers do not affect shapes; only structural errors matter here
    DagValidationResult validation = validateDag(nodes, edges, WorkflowTriggers{std::nullopt, true});
    if (!validation.ok()) {
        throw InvariantViolation("Cannot plan an invalid graph: " + validation.errors.front());
    }

    GraphIndex graph(nodes, edges);
    auto topoIndex = topoIndexOf(validation.topoOrder);
    std::map<int64_t, json> outputs;
    std::vector<PlannedNode> plan;
    plan.reserve(validation.topoOrder.size());

    for (int64_t id : validation.topoOrder) {
        const Node& node = *graph.node(id);
        PlannedNode planned;
        planned.nodeId = id;
        planned.kind = node.kind;

        const auto& incoming = graph.incoming(id);
        if (incoming.empty()) {
            planned.inputShape = shapeOfValue(startingInputs);
        } else {
            std::vector<int64_t> parents;
            for (const Edge* e : incoming) {
                parents.push_back(e->parentId);
            }
            std::sort(parents.begin(), parents.end(), [&](int64_t a, int64_t b) {
                return topoIndex[a] < topoIndex[b];
            });
            std::vector<std::pair<int64_t, json>> sources;
            for (int64_t parent : parents) {
                sources.emplace_back(parent, outputs[parent]);
            }
            planned.inputShape = unionMerge(sources, &planned.notes);
        }

        json declared = shapeFromStructuredOutput(node.structuredOutput);
        if (!declared.empty()) {
            planned.outputShape = declared;
        } else {
            try {
                planned.outputShape = registry.get(node.kind).plan(node.metadata, planned.inputShape,
                                                                   node.structuredOutput);
            } catch (const ConfigurationError&) {
                throw;
            } catch (const std::exception& e) {
                planned.outputShape = json::object();
                planned.notes.push_back(std::string("Could not plan output: ") + e.what());
            }
        }

        outputs[id] = planned.outputShape;
        plan.push_back(std::move(planned));
    }
    return plan;
}

} // namespace workflow
} // namespace weft
