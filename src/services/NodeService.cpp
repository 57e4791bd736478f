#include "services/NodeService.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "expr/PromptRenderer.hpp"
#include "workflow/Shape.hpp"

namespace weft {
namespace services {

OnError onErrorPolicy(const json& metadata) {
    if (!metadata.is_object()) return OnError::Fail;
    auto it = metadata.find("on_error");
    if (it == metadata.end() || !it->is_string()) return OnError::Fail;

    const auto& value = it->get_ref<const std::string&>();
    if (value == "skip") return OnError::Skip;
    if (value == "continue") return OnError::Continue;
    return OnError::Fail;
}

std::string toString(OnError policy) {
    switch (policy) {
        case OnError::Fail:     return "fail";
        case OnError::Skip:     return "skip";
        case OnError::Continue: return "continue";
    }
    return "fail";
}

NodeService::NodeService(NodeKind kind, MetadataSchema schema)
    : m_kind(kind)
    , m_schema(std::move(schema)) {}

void NodeService::validate(const json& metadata, const json& structuredOutput) const {
    m_schema.validate(metadata);
    workflow::validateStructuredOutput(structuredOutput);
    validateSpecific(metadata);
}

json NodeService::makeContext(const NodeInput& input, const ExecutionEnv& env) {
    return expr::makeContext(env.base, input.data);
}

json NodeService::evaluateField(const json& metadata, const std::string& field,
                                const json& context, const ExecutionEnv& env,
                                const expr::Bindings& variables) {
    return expr::evaluate(metadata.at(field).get<std::string>(), context,
                          env.expressionTimeout, field, variables);
}

std::string NodeService::renderField(const json& metadata, const std::string& field,
                                     const json& context, const ExecutionEnv& env) {
    auto rendered = expr::renderTemplate(metadata.at(field).get<std::string>(), context,
                                         env.expressionTimeout);
    for (const auto& warning : rendered.warnings) {
        LOG_DEBUG(field + ": " + warning);
    }
    return rendered.text;
}

json NodeService::itemContext(const json& context, const json& item, size_t index) {
    json scoped = context;
    scoped["item"] = item;
    scoped["index"] = index;
    if (scoped["input"].is_object()) {
        scoped["input"]["item"] = item;
        scoped["input"]["index"] = index;
    }
    return scoped;
}

expr::Bindings NodeService::itemBindings(const json& item, size_t index) {
    expr::Bindings bindings;
    bindings["item"] = item;
    bindings["index"] = index;
    return bindings;
}

std::string NodeService::stringOr(const json& metadata, const std::string& field,
                                  const std::string& fallback) {
    auto it = metadata.find(field);
    return (it != metadata.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

int64_t NodeService::intOr(const json& metadata, const std::string& field, int64_t fallback) {
    auto it = metadata.find(field);
    return (it != metadata.end() && it->is_number()) ? it->get<int64_t>() : fallback;
}

bool NodeService::boolOr(const json& metadata, const std::string& field, bool fallback) {
    auto it = metadata.find(field);
    return (it != metadata.end() && it->is_boolean()) ? it->get<bool>() : fallback;
}

} // namespace services
} // namespace weft
