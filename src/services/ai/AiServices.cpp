#include "services/ai/AiServices.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "workflow/Shape.hpp"

namespace weft {
namespace services {

namespace {

const char* const kDefaultEmbeddingModel = "text-embedding-3-small";

const Backends& requireBackends(const ExecutionEnv& env) {
    if (!env.backends) {
        throw NodeExecutionError("No backends configured");
    }
    return *env.backends;
}

} // anonymous namespace

// =============================================================================
// job
// =============================================================================

JobService::JobService()
    : NodeService(NodeKind::Job,
                  MetadataSchema()
                      .withCommonFields()
                      .required("prompt", FieldType::String, {checks::nonEmpty(), checks::templateText()})
                      .required("model_name", FieldType::String, {checks::nonEmpty()})
                      .optional("temperature", FieldType::Number, {checks::range(0.0, 2.0)})
                      .optional("max_tokens", FieldType::Integer, {checks::positive()})
                      .optional("stop", FieldType::Array, {checks::stringArray()})
                      .optional("system", FieldType::String, {checks::templateText()})) {}

json JobService::plan(const json& metadata, const json& inputShape,
                      const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    json declared = workflow::shapeFromStructuredOutput(structuredOutput);
    if (!declared.empty()) {
        return declared;
    }
    return {{"text", "string"}};
}

json JobService::execute(const NodeInput& input, const json& metadata,
                         const ExecutionEnv& env) const {
    const auto& model = requireBackends(env).model;
    if (!model) {
        throw NodeExecutionError("job node " + std::to_string(input.nodeId) +
                                 ": no model client configured");
    }

    json context = makeContext(input, env);

    ModelRequest request;
    request.model = metadata.at("model_name").get<std::string>();
    request.prompt = renderField(metadata, "prompt", context, env);
    if (metadata.contains("system") && metadata["system"].is_string()) {
        request.system = renderField(metadata, "system", context, env);
    }
    if (metadata.contains("temperature") && metadata["temperature"].is_number()) {
        request.temperature = metadata["temperature"].get<double>();
    }
    if (metadata.contains("max_tokens") && metadata["max_tokens"].is_number_integer()) {
        request.maxTokens = metadata["max_tokens"].get<int64_t>();
    }
    if (metadata.contains("stop") && metadata["stop"].is_array()) {
        request.stop = metadata["stop"].get<std::vector<std::string>>();
    }

    bool structured = input.structuredOutput.is_object() && !input.structuredOutput.empty();
    if (structured) {
        request.jsonOutput = true;
        request.outputSchema = input.structuredOutput;
    }

    std::string completion = model->complete(request);
    if (!structured) {
        return {{"text", completion}};
    }

    json parsed = json::parse(completion, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw NodeExecutionError("job node " + std::to_string(input.nodeId) +
                                 ": model output is not a JSON object");
    }
    return parsed;
}

// =============================================================================
// embed
// =============================================================================

EmbedService::EmbedService()
    : NodeService(NodeKind::Embed,
                  MetadataSchema()
                      .withCommonFields()
                      .required("vector_store_id", FieldType::String, {checks::nonEmpty()})
                      .required("input_selector", FieldType::String, {checks::expression()})
                      .optional("namespace", FieldType::String)
                      .optional("model_name", FieldType::String, {checks::nonEmpty()})
                      .optional("id_selector", FieldType::String, {checks::expression()})
                      .optional("metadata_map", FieldType::Object, {checks::expressionMap()})
                      .optional("upsert", FieldType::Boolean)) {}

json EmbedService::plan(const json& metadata, const json& inputShape,
                        const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"embedded", "boolean"}, {"count", "number"}};
}

json EmbedService::execute(const NodeInput& input, const json& metadata,
                           const ExecutionEnv& env) const {
    const auto& backends = requireBackends(env);
    if (!backends.model) {
        throw NodeExecutionError("embed node " + std::to_string(input.nodeId) +
                                 ": no model client configured");
    }
    bool upsert = boolOr(metadata, "upsert", true);
    if (upsert && !backends.vectors) {
        throw NodeExecutionError("embed node " + std::to_string(input.nodeId) +
                                 ": no vector store configured");
    }

    json context = makeContext(input, env);
    json selected = evaluateField(metadata, "input_selector", context, env);
    if (selected.is_null()) {
        return {{"embedded", false}, {"count", 0}};
    }
    if (!selected.is_array()) {
        selected = json::array({selected});
    }

    std::vector<VectorRecord> records;
    std::vector<std::string> texts;
    for (size_t i = 0; i < selected.size(); ++i) {
        const json& item = selected[i];
        json scoped = itemContext(context, item, i);
        auto vars = itemBindings(item, i);

        VectorRecord record;
        record.text = expr::toDisplayString(item);
        if (metadata.contains("id_selector") && metadata["id_selector"].is_string()) {
            record.id = expr::toDisplayString(
                evaluateField(metadata, "id_selector", scoped, env, vars));
        }
        if (record.id.empty()) {
            record.id = std::to_string(input.nodeId) + "-" + std::to_string(i);
        }
        if (metadata.contains("metadata_map") && metadata["metadata_map"].is_object()) {
            const auto& map = metadata["metadata_map"];
            for (auto it = map.begin(); it != map.end(); ++it) {
                record.metadata[it.key()] = expr::evaluate(
                    it.value().get<std::string>(), scoped, env.expressionTimeout,
                    "metadata_map." + it.key(), vars);
            }
        }
        texts.push_back(record.text);
        records.push_back(std::move(record));
    }

    if (records.empty()) {
        return {{"embedded", false}, {"count", 0}};
    }

    std::string modelName = stringOr(metadata, "model_name", kDefaultEmbeddingModel);
    auto vectors = backends.model->embed(modelName, texts);
    if (vectors.size() != records.size()) {
        throw NodeExecutionError("embed node " + std::to_string(input.nodeId) + ": expected " +
                                 std::to_string(records.size()) + " embeddings, got " +
                                 std::to_string(vectors.size()));
    }
    for (size_t i = 0; i < records.size(); ++i) {
        records[i].embedding = std::move(vectors[i]);
    }

    size_t count = records.size();
    if (upsert) {
        count = backends.vectors->upsert(metadata.at("vector_store_id").get<std::string>(),
                                         stringOr(metadata, "namespace", ""), records);
        LOG_DEBUG("embed node " + std::to_string(input.nodeId) + " upserted " +
                  std::to_string(count) + " records");
    }
    return {{"embedded", true}, {"count", count}};
}

} // namespace services
} // namespace weft
