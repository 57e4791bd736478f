#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace weft {
namespace workflow {

using json = nlohmann::json;

/**
 * Every node type a workflow may contain. The set is closed: services are
 * dispatched with exhaustive switches over this enum.
 */
enum class NodeKind {
    // ai
    Job,
    Embed,
    // resources
    Guru,
    GetApi,
    PostApi,
    VectorQuery,
    // actions
    Filter,
    Map,
    IfElse,
    ForEach,
    Merge,
    Split,
    Advanced,
    Return,
    Workflow
};

inline constexpr size_t kNodeKindCount = 15;

const std::array<NodeKind, kNodeKindCount>& allNodeKinds();

/// Wire name ("job", "get_api", "if_else", ...)
std::string toString(NodeKind kind);

/// Inverse of toString, nullopt for unknown names
std::optional<NodeKind> parseNodeKind(const std::string& name);

/// "ai", "resources" or "actions"
std::string nodeCategory(NodeKind kind);

/**
 * A node of a workflow graph
 */
struct Node {
    int64_t id = 0;
    int64_t workflowId = 0;
    NodeKind kind = NodeKind::Job;
    json metadata = json::object();
    json structuredOutput = json::object();
};

/**
 * Directed edge parent -> child. Only edges leaving an if_else node carry
 * a branch label ("true" / "false").
 */
struct Edge {
    int64_t id = 0;
    int64_t workflowId = 0;
    int64_t parentId = 0;
    int64_t childId = 0;
    std::optional<std::string> branchLabel;
};

/**
 * Trigger fields of a workflow, the only workflow fields the validator reads
 */
struct WorkflowTriggers {
    std::optional<std::string> cronSchedule;
    bool isApi = false;
};

/**
 * Workflow record as stored by the repository
 */
struct Workflow {
    int64_t id = 0;
    std::string uuid;
    std::string name;
    std::string description;
    json inputParams = json::object();
    bool isApi = false;
    std::optional<std::string> cronSchedule;
    std::optional<int64_t> teamId;
    std::string createdAt;
    std::string updatedAt;

    WorkflowTriggers triggers() const { return WorkflowTriggers{cronSchedule, isApi}; }
};

/**
 * Nodes and edges of one workflow, plus its triggers
 */
struct WorkflowGraph {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    WorkflowTriggers triggers;
};

// JSON conversions (nlohmann ADL)
void to_json(json& j, const Node& node);
void from_json(const json& j, Node& node);
void to_json(json& j, const Edge& edge);
void from_json(const json& j, Edge& edge);
void to_json(json& j, const Workflow& workflow);
void from_json(const json& j, Workflow& workflow);

} // namespace workflow
} // namespace weft
