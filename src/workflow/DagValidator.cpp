#include "workflow/DagValidator.hpp"
#include "workflow/Cron.hpp"
#include "workflow/Graph.hpp"
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"
#include <map>
#include <set>
#include <utility>

namespace weft {
namespace workflow {

namespace {

const char* const kBranchTrue = "true";
const char* const kBranchFalse = "false";

std::string joinPath(const std::vector<int64_t>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += std::to_string(path[i]);
    }
    return out;
}

void checkEdges(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                DagValidationResult& result) {
    std::set<int64_t> ids;
    for (const auto& n : nodes) {
        ids.insert(n.id);
    }

    std::set<std::pair<int64_t, int64_t>> seen;
    for (const auto& e : edges) {
        if (!ids.count(e.parentId)) {
            result.errors.push_back("Edge " + std::to_string(e.id) + " references unknown node " +
                                    std::to_string(e.parentId));
        }
        if (!ids.count(e.childId)) {
            result.errors.push_back("Edge " + std::to_string(e.id) + " references unknown node " +
                                    std::to_string(e.childId));
        }
        if (e.parentId == e.childId) {
            result.errors.push_back("Edge " + std::to_string(e.id) + " connects node " +
                                    std::to_string(e.parentId) + " to itself");
        }
        if (!seen.insert({e.parentId, e.childId}).second) {
            result.errors.push_back("Duplicate edge between nodes " + std::to_string(e.parentId) +
                                    " and " + std::to_string(e.childId));
        }
    }
}

void checkFanIn(const GraphIndex& graph, DagValidationResult& result) {
    for (int64_t id : graph.nodeIds()) {
        const Node* n = graph.node(id);
        size_t parents = graph.indegree(id);
        if (parents > 1 && n->kind != NodeKind::Merge) {
            result.errors.push_back("Node " + std::to_string(id) + " (type: " +
                                    toString(n->kind) + ") has multiple parents (" +
                                    std::to_string(parents) + ") but is not a merge node");
        }
    }
}

void checkReturnNodes(const GraphIndex& graph, DagValidationResult& result) {
    for (int64_t id : graph.nodeIds()) {
        if (graph.node(id)->kind != NodeKind::Return) continue;

        std::string name = "Return node " + std::to_string(id);
        if (graph.indegree(id) == 0) {
            result.errors.push_back(name + " has no incoming edges");
        }
        if (graph.outdegree(id) > 0) {
            result.errors.push_back(name + " has outgoing edges");
        }
        for (int64_t ancestor : graph.ancestors(id)) {
            if (graph.node(ancestor)->kind == NodeKind::ForEach) {
                result.errors.push_back(name + " is nested under for_each node " +
                                        std::to_string(ancestor));
            }
        }
    }
}

/// A node may sit in several for_each bodies only when those loops are nested
void checkLoopBodies(const GraphIndex& graph, DagValidationResult& result) {
    std::vector<int64_t> loops;
    for (int64_t id : graph.nodeIds()) {
        if (graph.node(id)->kind == NodeKind::ForEach) {
            loops.push_back(id);
        }
    }

    for (size_t i = 0; i < loops.size(); ++i) {
        auto first = graph.descendants(loops[i]);
        for (size_t j = i + 1; j < loops.size(); ++j) {
            if (first.count(loops[j])) continue;
            auto second = graph.descendants(loops[j]);
            if (second.count(loops[i])) continue;
            for (int64_t id : first) {
                if (second.count(id)) {
                    result.errors.push_back("Node " + std::to_string(id) +
                                            " is in the bodies of unrelated for_each nodes " +
                                            std::to_string(loops[i]) + " and " +
                                            std::to_string(loops[j]));
                    break;
                }
            }
        }
    }
}

void checkBranchLabels(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                       DagValidationResult& result) {
    std::map<int64_t, const Node*> byId;
    for (const auto& n : nodes) {
        byId[n.id] = &n;
    }
    std::map<int64_t, std::pair<int, int>> branchCounts;

    for (const auto& e : edges) {
        auto parent = byId.find(e.parentId);
        if (parent == byId.end()) continue;

        if (parent->second->kind == NodeKind::IfElse) {
            auto& counts = branchCounts[e.parentId];
            if (e.branchLabel && *e.branchLabel == kBranchTrue) {
                ++counts.first;
            } else if (e.branchLabel && *e.branchLabel == kBranchFalse) {
                ++counts.second;
            } else {
                result.errors.push_back("Edge " + std::to_string(e.id) + " from if_else node " +
                                        std::to_string(e.parentId) +
                                        " must be labelled 'true' or 'false'");
            }
        } else if (e.branchLabel) {
            result.errors.push_back("Edge " + std::to_string(e.id) + " from node " +
                                    std::to_string(e.parentId) + " (type: " +
                                    toString(parent->second->kind) +
                                    ") has branch label '" + *e.branchLabel +
                                    "' but only if_else edges may be labelled");
        }
    }

    for (const auto& n : nodes) {
        if (n.kind != NodeKind::IfElse) continue;
        auto counts = branchCounts[n.id];
        if (counts.first != 1 || counts.second != 1) {
            result.warnings.push_back("if_else node " + std::to_string(n.id) + " has " +
                                      std::to_string(counts.first) + " 'true' and " +
                                      std::to_string(counts.second) +
                                      " 'false' edges, expected one of each");
        }
    }
}

void checkTriggers(const WorkflowTriggers& triggers, DagValidationResult& result) {
    bool hasCron = triggers.cronSchedule && !triggers.cronSchedule->empty();
    if (!hasCron && !triggers.isApi) {
        result.warnings.push_back("no trigger configured");
    }
    if (hasCron && !isValidCron(*triggers.cronSchedule)) {
        result.warnings.push_back("Invalid cron schedule: " + *triggers.cronSchedule);
    }
}

} // anonymous namespace

void to_json(json& j, const DagValidationResult& result) {
    j = json{
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"topo_order", result.topoOrder}
    };
}

void from_json(const json& j, DagValidationResult& result) {
    result.errors = j.value("errors", std::vector<std::string>{});
    result.warnings = j.value("warnings", std::vector<std::string>{});
    result.topoOrder = j.value("topo_order", std::vector<int64_t>{});
}

DagValidationResult validateDag(const std::vector<Node>& nodes,
                                const std::vector<Edge>& edges,
                                const WorkflowTriggers& triggers) {
    DagValidationResult result;
    checkEdges(nodes, edges, result);

    GraphIndex graph(nodes, edges);
    TopoResult topo = graph.topologicalSort();
    if (!topo.acyclic()) {
        std::vector<int64_t> cycle = graph.findCycle();
        result.errors.push_back("Cycle detected in graph: " + joinPath(cycle));
    }

    checkFanIn(graph, result);
    checkReturnNodes(graph, result);
    if (topo.acyclic()) {
        checkLoopBodies(graph, result);
    }
    checkBranchLabels(nodes, edges, result);
    checkTriggers(triggers, result);

    if (result.errors.empty()) {
        result.topoOrder = std::move(topo.order);
    }
    return result;
}

DagValidationResult validateWorkflow(const WorkflowGraph& graph,
                                     const services::ServiceRegistry& registry) {
    DagValidationResult result = validateDag(graph.nodes, graph.edges, graph.triggers);

    for (const auto& n : graph.nodes) {
        std::string prefix = "Node " + std::to_string(n.id) + " (" + toString(n.kind) + "): ";
        try {
            registry.get(n.kind).validate(n.metadata, n.structuredOutput);
        } catch (const WeftError& e) {
            result.errors.push_back(prefix + e.what());
        }
    }

    if (!result.errors.empty()) {
        result.topoOrder.clear();
    }
    return result;
}

} // namespace workflow
} // namespace weft
