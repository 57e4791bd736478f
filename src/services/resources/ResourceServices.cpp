#include "services/resources/ResourceServices.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "expr/PromptRenderer.hpp"
#include <cctype>
#include <cstdio>

namespace weft {
namespace services {

namespace {

const int64_t kDefaultTopK = 5;

const char* const kContentJson = "application/json";
const char* const kContentForm = "application/x-www-form-urlencoded";
const char* const kContentText = "text/plain";

json httpOutputShape() {
    return {{"status", "number"}, {"body", "object"}};
}

HttpClient& requireHttp(const ExecutionEnv& env, int64_t nodeId) {
    if (!env.backends || !env.backends->http) {
        throw NodeExecutionError("node " + std::to_string(nodeId) + ": no HTTP client configured");
    }
    return *env.backends->http;
}

/**
 * Render url and headers (both may hold {{ }} placeholders)
 */
HttpRequest prepareRequest(const std::string& method, const json& metadata,
                           const json& context, const ExecutionEnv& env) {
    HttpRequest request;
    request.method = method;
    request.url = expr::renderTemplate(metadata.at("url").get<std::string>(), context,
                                       env.expressionTimeout).text;
    auto headers = metadata.find("headers");
    if (headers != metadata.end() && headers->is_object()) {
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            request.headers[it.key()] = expr::renderTemplate(
                it.value().get<std::string>(), context, env.expressionTimeout).text;
        }
    }
    auto preset = metadata.find("auth_preset");
    if (preset != metadata.end() && preset->is_string()) {
        request.authPreset = preset->get<std::string>();
    }
    return request;
}

json toOutput(const HttpRequest& request, const HttpResponse& response, int64_t nodeId) {
    if (response.status >= 400) {
        throw NodeExecutionError("node " + std::to_string(nodeId) + ": " + request.method + " " +
                                 request.url + " returned status " +
                                 std::to_string(response.status));
    }
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        body = response.body;
    }
    return {{"status", response.status}, {"body", body}};
}

/**
 * Strings are expressions, containers are walked, other values are literals
 */
json buildBody(const json& templ, const json& context, const ExecutionEnv& env,
               const std::string& path) {
    if (templ.is_string()) {
        return expr::evaluate(templ.get<std::string>(), context, env.expressionTimeout, path);
    }
    if (templ.is_object()) {
        json out = json::object();
        for (auto it = templ.begin(); it != templ.end(); ++it) {
            out[it.key()] = buildBody(it.value(), context, env, path + "." + it.key());
        }
        return out;
    }
    if (templ.is_array()) {
        json out = json::array();
        for (size_t i = 0; i < templ.size(); ++i) {
            out.push_back(buildBody(templ[i], context, env, path + "[" + std::to_string(i) + "]"));
        }
        return out;
    }
    return templ;
}

void checkBodyMap(const json& value, const std::string& path) {
    if (value.is_string()) {
        expr::checkSyntax(value.get<std::string>(), path);
    } else if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            checkBodyMap(it.value(), path + "." + it.key());
        }
    } else if (value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            checkBodyMap(value[i], path + "[" + std::to_string(i) + "]");
        }
    }
}

} // anonymous namespace

std::string urlEncode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

// =============================================================================
// guru
// =============================================================================

GuruService::GuruService()
    : NodeService(NodeKind::Guru,
                  MetadataSchema()
                      .withCommonFields()
                      .required("space", FieldType::String, {checks::nonEmpty()})
                      .required("query_template", FieldType::String, {checks::templateText()})
                      .optional("top_k", FieldType::Integer, {checks::positive()})
                      .optional("filters", FieldType::Object, {checks::scalarMap()})) {}

json GuruService::plan(const json& metadata, const json& inputShape,
                       const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"items", "array"}};
}

json GuruService::execute(const NodeInput& input, const json& metadata,
                          const ExecutionEnv& env) const {
    if (!env.backends || !env.backends->guru) {
        throw NodeExecutionError("guru node " + std::to_string(input.nodeId) +
                                 ": no guru client configured");
    }
    json context = makeContext(input, env);
    std::string query = renderField(metadata, "query_template", context, env);
    json filters = metadata.value("filters", json::object());
    if (filters.is_null()) filters = json::object();

    json items = env.backends->guru->search(metadata.at("space").get<std::string>(), query,
                                            intOr(metadata, "top_k", kDefaultTopK), filters);
    if (!items.is_array()) {
        items = items.is_null() ? json::array() : json::array({items});
    }
    return {{"items", items}};
}

// =============================================================================
// get_api
// =============================================================================

GetApiService::GetApiService()
    : NodeService(NodeKind::GetApi,
                  MetadataSchema()
                      .withCommonFields()
                      .required("url", FieldType::String, {checks::httpUrl()})
                      .optional("headers", FieldType::Object, {checks::stringMap()})
                      .optional("query_map", FieldType::Object, {checks::expressionMap()})
                      .optional("auth_preset", FieldType::String)) {}

json GetApiService::plan(const json& metadata, const json& inputShape,
                         const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return httpOutputShape();
}

json GetApiService::execute(const NodeInput& input, const json& metadata,
                            const ExecutionEnv& env) const {
    HttpClient& http = requireHttp(env, input.nodeId);
    json context = makeContext(input, env);
    HttpRequest request = prepareRequest("GET", metadata, context, env);

    auto queryMap = metadata.find("query_map");
    if (queryMap != metadata.end() && queryMap->is_object()) {
        for (auto it = queryMap->begin(); it != queryMap->end(); ++it) {
            json value = expr::evaluate(it.value().get<std::string>(), context,
                                        env.expressionTimeout, "query_map." + it.key());
            if (!value.is_null()) {
                request.query[it.key()] = expr::toDisplayString(value);
            }
        }
    }

    LOG_DEBUG("get_api node " + std::to_string(input.nodeId) + ": GET " + request.url);
    return toOutput(request, http.send(request), input.nodeId);
}

// =============================================================================
// post_api
// =============================================================================

PostApiService::PostApiService()
    : NodeService(NodeKind::PostApi,
                  MetadataSchema()
                      .withCommonFields()
                      .required("url", FieldType::String, {checks::httpUrl()})
                      .optional("headers", FieldType::Object, {checks::stringMap()})
                      .optional("body_map", FieldType::Object,
                                {[](const json& value, const std::string& field) {
                                    checkBodyMap(value, field);
                                }})
                      .optional("content_type", FieldType::String,
                                {checks::oneOf({kContentJson, kContentForm, kContentText})})
                      .optional("auth_preset", FieldType::String)) {}

json PostApiService::plan(const json& metadata, const json& inputShape,
                          const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return httpOutputShape();
}

json PostApiService::execute(const NodeInput& input, const json& metadata,
                             const ExecutionEnv& env) const {
    HttpClient& http = requireHttp(env, input.nodeId);
    json context = makeContext(input, env);
    HttpRequest request = prepareRequest("POST", metadata, context, env);
    request.contentType = stringOr(metadata, "content_type", kContentJson);

    json body = json::object();
    auto bodyMap = metadata.find("body_map");
    if (bodyMap != metadata.end() && bodyMap->is_object()) {
        body = buildBody(*bodyMap, context, env, "body_map");
    }

    if (request.contentType == kContentForm) {
        std::string encoded;
        for (auto it = body.begin(); it != body.end(); ++it) {
            if (!encoded.empty()) encoded += '&';
            encoded += urlEncode(it.key()) + "=" + urlEncode(expr::toDisplayString(it.value()));
        }
        request.body = encoded;
    } else if (request.contentType == kContentText) {
        request.body = body.size() == 1 ? expr::toDisplayString(body.begin().value())
                                        : body.dump();
    } else {
        request.body = body.dump();
    }

    LOG_DEBUG("post_api node " + std::to_string(input.nodeId) + ": POST " + request.url +
              " (" + Logger::formatSize(request.body.size()) + ")");
    return toOutput(request, http.send(request), input.nodeId);
}

// =============================================================================
// vector_query
// =============================================================================

VectorQueryService::VectorQueryService()
    : NodeService(NodeKind::VectorQuery,
                  MetadataSchema()
                      .withCommonFields()
                      .required("vector_store_id", FieldType::String, {checks::nonEmpty()})
                      .required("query_template", FieldType::String, {checks::templateText()})
                      .optional("namespace", FieldType::String)
                      .optional("top_k", FieldType::Integer, {checks::positive()})
                      .optional("filters", FieldType::Object, {checks::scalarMap()})) {}

json VectorQueryService::plan(const json& metadata, const json& inputShape,
                              const json& structuredOutput) const {
    (void)metadata;
    (void)inputShape;
    (void)structuredOutput;
    return {{"results", {{"type", "array"},
                         {"items", {{"id", "string"}, {"score", "number"}, {"payload", "object"}}}}}};
}

json VectorQueryService::execute(const NodeInput& input, const json& metadata,
                                 const ExecutionEnv& env) const {
    if (!env.backends || !env.backends->vectors) {
        throw NodeExecutionError("vector_query node " + std::to_string(input.nodeId) +
                                 ": no vector store configured");
    }
    json context = makeContext(input, env);
    std::string query = renderField(metadata, "query_template", context, env);
    json filters = metadata.value("filters", json::object());
    if (filters.is_null()) filters = json::object();

    json results = env.backends->vectors->query(
        metadata.at("vector_store_id").get<std::string>(), stringOr(metadata, "namespace", ""),
        query, intOr(metadata, "top_k", kDefaultTopK), filters);
    if (!results.is_array()) {
        results = json::array();
    }
    return {{"results", results}};
}

} // namespace services
} // namespace weft
