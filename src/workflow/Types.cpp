#include "workflow/Types.hpp"
#include "core/Errors.hpp"

namespace weft {
namespace workflow {

const std::array<NodeKind, kNodeKindCount>& allNodeKinds() {
    static const std::array<NodeKind, kNodeKindCount> kinds = {
        NodeKind::Job, NodeKind::Embed,
        NodeKind::Guru, NodeKind::GetApi, NodeKind::PostApi, NodeKind::VectorQuery,
        NodeKind::Filter, NodeKind::Map, NodeKind::IfElse, NodeKind::ForEach,
        NodeKind::Merge, NodeKind::Split, NodeKind::Advanced, NodeKind::Return,
        NodeKind::Workflow
    };
    return kinds;
}

std::string toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Job:         return "job";
        case NodeKind::Embed:       return "embed";
        case NodeKind::Guru:        return "guru";
        case NodeKind::GetApi:      return "get_api";
        case NodeKind::PostApi:     return "post_api";
        case NodeKind::VectorQuery: return "vector_query";
        case NodeKind::Filter:      return "filter";
        case NodeKind::Map:         return "map";
        case NodeKind::IfElse:      return "if_else";
        case NodeKind::ForEach:     return "for_each";
        case NodeKind::Merge:       return "merge";
        case NodeKind::Split:       return "split";
        case NodeKind::Advanced:    return "advanced";
        case NodeKind::Return:      return "return";
        case NodeKind::Workflow:    return "workflow";
    }
    return "unknown";
}

std::optional<NodeKind> parseNodeKind(const std::string& name) {
    for (NodeKind kind : allNodeKinds()) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string nodeCategory(NodeKind kind) {
    switch (kind) {
        case NodeKind::Job:
        case NodeKind::Embed:
            return "ai";
        case NodeKind::Guru:
        case NodeKind::GetApi:
        case NodeKind::PostApi:
        case NodeKind::VectorQuery:
            return "resources";
        case NodeKind::Filter:
        case NodeKind::Map:
        case NodeKind::IfElse:
        case NodeKind::ForEach:
        case NodeKind::Merge:
        case NodeKind::Split:
        case NodeKind::Advanced:
        case NodeKind::Return:
        case NodeKind::Workflow:
            return "actions";
    }
    return "unknown";
}

// =============================================================================
// JSON conversions
// =============================================================================

namespace {

json objectOrEmpty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        throw ValidationError(key, "must be an object");
    }
    return *it;
}

} // anonymous namespace

void to_json(json& j, const Node& node) {
    j = json{
        {"id", node.id},
        {"workflow_id", node.workflowId},
        {"node_type", toString(node.kind)},
        {"metadata", node.metadata},
        {"structured_output", node.structuredOutput}
    };
}

void from_json(const json& j, Node& node) {
    node.id = j.value("id", int64_t{0});
    node.workflowId = j.value("workflow_id", int64_t{0});

    std::string type = j.value("node_type", std::string());
    auto kind = parseNodeKind(type);
    if (!kind) {
        throw ValidationError("node_type", "Unknown node type: " + type);
    }
    node.kind = *kind;
    node.metadata = objectOrEmpty(j, "metadata");
    node.structuredOutput = objectOrEmpty(j, "structured_output");
}

void to_json(json& j, const Edge& edge) {
    j = json{
        {"id", edge.id},
        {"workflow_id", edge.workflowId},
        {"parent_id", edge.parentId},
        {"child_id", edge.childId},
        {"branch_label", edge.branchLabel ? json(*edge.branchLabel) : json(nullptr)}
    };
}

void from_json(const json& j, Edge& edge) {
    edge.id = j.value("id", int64_t{0});
    edge.workflowId = j.value("workflow_id", int64_t{0});
    if (!j.contains("parent_id") || !j.contains("child_id")) {
        throw ValidationError("edge", "parent_id and child_id are required");
    }
    edge.parentId = j.at("parent_id").get<int64_t>();
    edge.childId = j.at("child_id").get<int64_t>();

    auto label = j.find("branch_label");
    if (label != j.end() && !label->is_null()) {
        edge.branchLabel = label->get<std::string>();
    } else {
        edge.branchLabel.reset();
    }
}

void to_json(json& j, const Workflow& workflow) {
    j = json{
        {"id", workflow.id},
        {"uuid", workflow.uuid},
        {"name", workflow.name},
        {"description", workflow.description},
        {"input_params", workflow.inputParams},
        {"is_api", workflow.isApi},
        {"cron_schedule", workflow.cronSchedule ? json(*workflow.cronSchedule) : json(nullptr)},
        {"team_id", workflow.teamId ? json(*workflow.teamId) : json(nullptr)},
        {"created_at", workflow.createdAt},
        {"updated_at", workflow.updatedAt}
    };
}

void from_json(const json& j, Workflow& workflow) {
    workflow.id = j.value("id", int64_t{0});
    workflow.uuid = j.value("uuid", std::string());
    workflow.name = j.value("name", std::string());
    workflow.description = j.value("description", std::string());
    workflow.inputParams = objectOrEmpty(j, "input_params");
    workflow.isApi = j.value("is_api", false);

    auto cron = j.find("cron_schedule");
    if (cron != j.end() && cron->is_string() && !cron->get<std::string>().empty()) {
        workflow.cronSchedule = cron->get<std::string>();
    } else {
        workflow.cronSchedule.reset();
    }

    auto team = j.find("team_id");
    if (team != j.end() && team->is_number_integer()) {
        workflow.teamId = team->get<int64_t>();
    } else {
        workflow.teamId.reset();
    }

    workflow.createdAt = j.value("created_at", std::string());
    workflow.updatedAt = j.value("updated_at", std::string());
}

} // namespace workflow
} // namespace weft
