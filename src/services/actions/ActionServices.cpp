#include "services/actions/ActionServices.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <initializer_list>
#include <utility>

namespace weft {
namespace services {

namespace {

const char* const kDefaultItemsSelector = "input.items";

json withKeys(const json& shape, std::initializer_list<std::pair<const char*, json>> keys) {
    json out = shape.is_object() ? shape : json::object();
    for (const auto& [key, value] : keys) {
        out[key] = value;
    }
    return out;
}

/**
 * Evaluate items_selector (or the default) and require an array.
 * A null selection is an empty list.
 */
json selectItems(const json& metadata, const std::string& field, const json& context,
                 const ExecutionEnv& env, int64_t nodeId) {
    std::string selector = kDefaultItemsSelector;
    auto it = metadata.find(field);
    if (it != metadata.end() && it->is_string()) {
        selector = it->get<std::string>();
    }
    json items = expr::evaluate(selector, context, env.expressionTimeout, field);
    if (items.is_null()) {
        return json::array();
    }
    if (!items.is_array()) {
        throw NodeExecutionError("node " + std::to_string(nodeId) + ": " + field +
                                 " must select an array, got " + items.type_name());
    }
    return items;
}

FieldCheck mappingValues() {
    return [](const json& value, const std::string& field) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            const auto& v = it.value();
            std::string path = field + "." + it.key();
            if (v.is_string()) {
                expr::checkSyntax(v.get<std::string>(), path);
            } else if (!v.is_number() && !v.is_boolean()) {
                throw ValidationError(path, "must be an expression, number or boolean");
            }
        }
    };
}

} // anonymous namespace

// =============================================================================
// filter
// =============================================================================

FilterService::FilterService()
    : NodeService(NodeKind::Filter,
                  MetadataSchema()
                      .withCommonFields()
                      .required("where", FieldType::String, {checks::expression()})
                      .optional("items_selector", FieldType::String, {checks::expression()})) {}

json FilterService::plan(const json& metadata, const json& inputShape,
                         const json& structuredOutput) const {
    (void)metadata;
    (void)structuredOutput;
    return withKeys(inputShape, {{"items", "array"}});
}

json FilterService::execute(const NodeInput& input, const json& metadata,
                            const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    json items = selectItems(metadata, "items_selector", context, env, input.nodeId);

    const auto where = expr::Expression::compile(metadata.at("where").get<std::string>(), "where");
    json kept = json::array();
    for (size_t i = 0; i < items.size(); ++i) {
        json verdict = where.evaluate(itemContext(context, items[i], i),
                                      itemBindings(items[i], i), env.expressionTimeout);
        if (expr::isTruthy(verdict)) {
            kept.push_back(items[i]);
        }
    }

    json out = input.data.is_object() ? input.data : json::object();
    out["items"] = std::move(kept);
    return out;
}

// =============================================================================
// map
// =============================================================================

MapService::MapService()
    : NodeService(NodeKind::Map,
                  MetadataSchema()
                      .withCommonFields()
                      .required("mapping", FieldType::Object,
                                {checks::nonEmptyObject(), mappingValues()})) {}

json MapService::plan(const json& metadata, const json& inputShape,
                      const json& structuredOutput) const {
    (void)inputShape;
    (void)structuredOutput;
    json shape = json::object();
    const auto& mapping = metadata.at("mapping");
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        const auto& v = it.value();
        if (v.is_number()) {
            shape[it.key()] = "number";
        } else if (v.is_boolean()) {
            shape[it.key()] = "boolean";
        } else {
            shape[it.key()] = "unknown";
        }
    }
    return shape;
}

json MapService::execute(const NodeInput& input, const json& metadata,
                         const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    json out = json::object();
    const auto& mapping = metadata.at("mapping");
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        if (it.value().is_string()) {
            out[it.key()] = expr::evaluate(it.value().get<std::string>(), context,
                                           env.expressionTimeout, "mapping." + it.key());
        } else {
            out[it.key()] = it.value();
        }
    }
    return out;
}

// =============================================================================
// if_else
// =============================================================================

IfElseService::IfElseService()
    : NodeService(NodeKind::IfElse,
                  MetadataSchema()
                      .withCommonFields()
                      .required("predicate", FieldType::String, {checks::expression()})) {}

json IfElseService::plan(const json& metadata, const json& inputShape,
                         const json& structuredOutput) const {
    (void)metadata;
    (void)structuredOutput;
    return withKeys(inputShape, {{"condition_result", "boolean"}, {"branch_taken", "string"}});
}

json IfElseService::execute(const NodeInput& input, const json& metadata,
                            const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    bool result = expr::isTruthy(evaluateField(metadata, "predicate", context, env));

    json out = input.data.is_object() ? input.data : json::object();
    out["condition_result"] = result;
    out["branch_taken"] = result ? "true" : "false";
    return out;
}

// =============================================================================
// for_each
// =============================================================================

ForEachService::ForEachService()
    : NodeService(NodeKind::ForEach,
                  MetadataSchema()
                      .withCommonFields()
                      .required("items_selector", FieldType::String, {checks::expression()})
                      .optional("concurrency", FieldType::Integer, {checks::positive()})
                      .optional("flatten", FieldType::Boolean)) {}

json ForEachService::plan(const json& metadata, const json& inputShape,
                          const json& structuredOutput) const {
    (void)metadata;
    (void)structuredOutput;
    return withKeys(inputShape, {{"item", "unknown"}, {"index", "number"}});
}

json ForEachService::execute(const NodeInput& input, const json& metadata,
                             const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    return {{"items", selectItems(metadata, "items_selector", context, env, input.nodeId)}};
}

// =============================================================================
// merge
// =============================================================================

MergeService::MergeService()
    : NodeService(NodeKind::Merge,
                  MetadataSchema()
                      .withCommonFields()
                      .optional("strategy", FieldType::String,
                                {checks::oneOf({"union", "concat", "prefer_left"})})
                      .optional("expected_parents", FieldType::Integer, {checks::positive()})) {}

json MergeService::plan(const json& metadata, const json& inputShape,
                        const json& structuredOutput) const {
    (void)metadata;
    (void)structuredOutput;
    return inputShape.is_object() ? inputShape : json::object();
}

json MergeService::execute(const NodeInput& input, const json& metadata,
                           const ExecutionEnv& env) const {
    (void)env;
    auto expected = intOr(metadata, "expected_parents", 0);
    if (expected > 0 && static_cast<int64_t>(input.parents.size()) != expected) {
        throw NodeExecutionError("merge node " + std::to_string(input.nodeId) + " expected " +
                                 std::to_string(expected) + " parents, got " +
                                 std::to_string(input.parents.size()));
    }

    std::string strategy = stringOr(metadata, "strategy", "union");

    if (strategy == "prefer_left") {
        // Edge order, first non-null value per key
        json out = json::object();
        for (const auto& parent : input.parents) {
            if (!parent.output.is_object()) continue;
            for (auto it = parent.output.begin(); it != parent.output.end(); ++it) {
                auto existing = out.find(it.key());
                if (existing == out.end() || existing->is_null()) {
                    out[it.key()] = it.value();
                }
            }
        }
        return out;
    }

    std::vector<const ParentOutput*> ordered;
    for (const auto& parent : input.parents) {
        ordered.push_back(&parent);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ParentOutput* a, const ParentOutput* b) {
                         return a->topoIndex < b->topoIndex;
                     });

    json out = json::object();
    for (const ParentOutput* parent : ordered) {
        if (!parent->output.is_object()) continue;
        for (auto it = parent->output.begin(); it != parent->output.end(); ++it) {
            auto existing = out.find(it.key());
            if (strategy == "concat" && existing != out.end()) {
                if (existing->is_array() && it.value().is_array()) {
                    existing->insert(existing->end(), it.value().begin(), it.value().end());
                    continue;
                }
                if (existing->is_object() && it.value().is_object()) {
                    existing->update(it.value());
                    continue;
                }
            }
            out[it.key()] = it.value();
        }
    }
    return out;
}

// =============================================================================
// split
// =============================================================================

SplitService::SplitService()
    : NodeService(NodeKind::Split,
                  MetadataSchema()
                      .withCommonFields()
                      .optional("by", FieldType::String, {checks::expression()})
                      .optional("mode", FieldType::String, {checks::oneOf({"group_by", "chunk"})})
                      .optional("chunk_size", FieldType::Integer, {checks::positive()})
                      .optional("items_selector", FieldType::String, {checks::expression()})) {}

void SplitService::validateSpecific(const json& metadata) const {
    std::string mode = stringOr(metadata, "mode", "group_by");
    if (mode == "chunk") {
        if (intOr(metadata, "chunk_size", 0) <= 0) {
            throw ValidationError("chunk_size", "chunk_size is required when mode is 'chunk'");
        }
    } else if (!metadata.contains("by") || !metadata["by"].is_string()) {
        throw ValidationError("by", "by is required when mode is 'group_by'");
    }
}

json SplitService::plan(const json& metadata, const json& inputShape,
                        const json& structuredOutput) const {
    (void)inputShape;
    (void)structuredOutput;
    if (stringOr(metadata, "mode", "group_by") == "chunk") {
        return {{"chunks", "array"}};
    }
    return {{"groups", "object"}};
}

json SplitService::execute(const NodeInput& input, const json& metadata,
                           const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    json items = selectItems(metadata, "items_selector", context, env, input.nodeId);

    if (stringOr(metadata, "mode", "group_by") == "chunk") {
        auto size = static_cast<size_t>(intOr(metadata, "chunk_size", 1));
        json chunks = json::array();
        for (size_t start = 0; start < items.size(); start += size) {
            json chunk = json::array();
            for (size_t i = start; i < std::min(items.size(), start + size); ++i) {
                chunk.push_back(items[i]);
            }
            chunks.push_back(std::move(chunk));
        }
        return {{"chunks", chunks}};
    }

    const auto by = expr::Expression::compile(metadata.at("by").get<std::string>(), "by");
    json groups = json::object();
    for (size_t i = 0; i < items.size(); ++i) {
        json key = by.evaluate(itemContext(context, items[i], i), itemBindings(items[i], i),
                               env.expressionTimeout);
        std::string name = expr::toDisplayString(key);
        if (!groups.contains(name)) {
            groups[name] = json::array();
        }
        groups[name].push_back(items[i]);
    }
    return {{"groups", groups}};
}

// =============================================================================
// advanced
// =============================================================================

AdvancedService::AdvancedService()
    : NodeService(NodeKind::Advanced,
                  MetadataSchema()
                      .withCommonFields()
                      .required("expression", FieldType::String, {checks::expression()})) {}

json AdvancedService::plan(const json& metadata, const json& inputShape,
                           const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"result", "unknown"}};
}

json AdvancedService::execute(const NodeInput& input, const json& metadata,
                              const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    return {{"result", evaluateField(metadata, "expression", context, env)}};
}

// =============================================================================
// return
// =============================================================================

ReturnService::ReturnService()
    : NodeService(NodeKind::Return,
                  MetadataSchema()
                      .withCommonFields()
                      .required("payload_selector", FieldType::String, {checks::expression()})
                      .optional("content_type", FieldType::String,
                                {checks::oneOf({"application/json",
                                                "application/x-www-form-urlencoded",
                                                "text/plain"})})
                      .optional("status_code", FieldType::Integer, {checks::range(100, 599)})) {}

json ReturnService::plan(const json& metadata, const json& inputShape,
                         const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"payload", "unknown"}, {"status_code", "number"}, {"content_type", "string"}};
}

json ReturnService::execute(const NodeInput& input, const json& metadata,
                            const ExecutionEnv& env) const {
    json context = makeContext(input, env);
    return {
        {"payload", evaluateField(metadata, "payload_selector", context, env)},
        {"status_code", intOr(metadata, "status_code", 200)},
        {"content_type", stringOr(metadata, "content_type", "application/json")}
    };
}

// =============================================================================
// workflow
// =============================================================================

WorkflowCallService::WorkflowCallService()
    : NodeService(NodeKind::Workflow,
                  MetadataSchema()
                      .withCommonFields()
                      .required("workflow_id", FieldType::Integer, {checks::positive()})
                      .optional("input_mapping", FieldType::Object, {checks::expressionMap()})
                      .optional("propagate_identity", FieldType::Boolean)
                      .optional("wait", FieldType::String, {checks::oneOf({"sync"})})) {}

json WorkflowCallService::plan(const json& metadata, const json& inputShape,
                               const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"result", "object"}};
}

json WorkflowCallService::execute(const NodeInput& input, const json& metadata,
                                  const ExecutionEnv& env) const {
    if (!env.subWorkflows) {
        throw NodeExecutionError("workflow node " + std::to_string(input.nodeId) +
                                 ": sub-workflows are not available");
    }

    json callInput = input.data.is_object() ? input.data : json::object();
    auto mapping = metadata.find("input_mapping");
    if (mapping != metadata.end() && mapping->is_object()) {
        json context = makeContext(input, env);
        callInput = json::object();
        for (auto it = mapping->begin(); it != mapping->end(); ++it) {
            callInput[it.key()] = expr::evaluate(it.value().get<std::string>(), context,
                                                 env.expressionTimeout,
                                                 "input_mapping." + it.key());
        }
    }

    int64_t workflowId = metadata.at("workflow_id").get<int64_t>();
    LOG_DEBUG("workflow node " + std::to_string(input.nodeId) + " calling workflow " +
              std::to_string(workflowId));
    json result = env.subWorkflows->runWorkflow(workflowId, callInput,
                                                boolOr(metadata, "propagate_identity", true));
    return {{"result", result}};
}

} // namespace services
} // namespace weft
