#include <catch2/catch_test_macros.hpp>
#include "services/MetadataSchema.hpp"
#include "services/ServiceRegistry.hpp"
#include "core/Errors.hpp"
#include <string>

using namespace weft;
using namespace weft::services;
using workflow::NodeKind;

namespace {

std::string validationMessage(const MetadataSchema& schema, const json& metadata) {
    try {
        schema.validate(metadata);
    } catch (const ValidationError& e) {
        return e.what();
    }
    return "";
}

std::string serviceMessage(NodeKind kind, const json& metadata,
                           const json& structuredOutput = json::object()) {
    try {
        ServiceRegistry::instance().get(kind).validate(metadata, structuredOutput);
    } catch (const WeftError& e) {
        return e.what();
    }
    return "";
}

MetadataSchema sampleSchema() {
    return MetadataSchema()
        .withCommonFields()
        .required("where", FieldType::String, {checks::expression()})
        .optional("limit", FieldType::Integer, {checks::positive()});
}

} // anonymous namespace

// =============================================================================
// Schema mechanics
// =============================================================================

TEST_CASE("Required and unknown fields", "[MetadataSchema]") {
    auto schema = sampleSchema();

    REQUIRE(validationMessage(schema, {{"where", "a > 1"}}).empty());
    REQUIRE(validationMessage(schema, json::object()) == "Missing required fields: where");
    REQUIRE(validationMessage(schema, {{"where", "a"}, {"zeta", 1}, {"alpha", 2}}) ==
            "Unknown fields in metadata: alpha, zeta");
}

TEST_CASE("Metadata must be an object", "[MetadataSchema]") {
    REQUIRE(validationMessage(sampleSchema(), json::array()) == "metadata: must be an object");
}

TEST_CASE("Field types are enforced", "[MetadataSchema]") {
    auto schema = sampleSchema();

    REQUIRE(validationMessage(schema, {{"where", 3}}) == "where: must be of type string");
    REQUIRE(validationMessage(schema, {{"where", "a"}, {"limit", 1.5}}) ==
            "limit: must be of type integer");
    REQUIRE(validationMessage(schema, {{"where", "a"}, {"limit", 0}}) ==
            "limit: must be greater than 0");
}

TEST_CASE("Null optional fields count as unset", "[MetadataSchema]") {
    REQUIRE(validationMessage(sampleSchema(), {{"where", "a"}, {"limit", nullptr}}).empty());
}

TEST_CASE("Common fields are accepted everywhere", "[MetadataSchema]") {
    auto schema = sampleSchema();
    json metadata = {{"where", "a"}, {"name", "step"}, {"description", "d"}, {"timeout_ms", 500},
                     {"retry", 0}, {"on_error", "skip"}, {"tags", {"x", "y"}}};

    REQUIRE(validationMessage(schema, metadata).empty());
    REQUIRE(validationMessage(schema, {{"where", "a"}, {"on_error", "explode"}}) ==
            "on_error: must be one of: fail, skip, continue");
    REQUIRE(validationMessage(schema, {{"where", "a"}, {"tags", {1}}}) ==
            "tags[0]: must be a string");
}

TEST_CASE("Expression fields are parsed", "[MetadataSchema]") {
    auto schema = sampleSchema();

    REQUIRE_THROWS_AS(schema.validate({{"where", "a +"}}), ExpressionSyntaxError);
    try {
        schema.validate({{"where", "("}});
        FAIL("expected a syntax error");
    } catch (const ExpressionSyntaxError& e) {
        REQUIRE(e.path() == "where");
        REQUIRE(e.expression() == "(");
    }
}

TEST_CASE("Redefining a field replaces it", "[MetadataSchema]") {
    auto schema = MetadataSchema()
        .required("x", FieldType::String)
        .optional("x", FieldType::Integer);

    REQUIRE(schema.fields().size() == 1);
    REQUIRE_FALSE(schema.field("x")->required);
    REQUIRE(schema.field("y") == nullptr);
}

TEST_CASE("Schema description lists fields", "[MetadataSchema]") {
    json described = sampleSchema().describe();

    REQUIRE(described["required"] == json::array({"where"}));
    REQUIRE(described["optional"].size() == 7);
    REQUIRE(described["fields"]["limit"] == "integer");
    REQUIRE(described["fields"]["tags"] == "array");
}

// =============================================================================
// Per-kind rules
// =============================================================================

TEST_CASE("Job metadata", "[MetadataSchema][Job]") {
    REQUIRE(serviceMessage(NodeKind::Job, {{"prompt", "Hi {{ input.name }}"},
                                           {"model_name", "m"}, {"temperature", 0.7}}).empty());
    REQUIRE(serviceMessage(NodeKind::Job, {{"prompt", "  "}, {"model_name", "m"}}) ==
            "prompt: must be a non-empty string");
    REQUIRE(serviceMessage(NodeKind::Job, {{"prompt", "x"}, {"model_name", "m"},
                                           {"temperature", 3}}) ==
            "temperature: must be between 0 and 2");
    REQUIRE_THROWS_AS(ServiceRegistry::instance().get(NodeKind::Job)
                          .validate({{"prompt", "Hi {{ input. }}"}, {"model_name", "m"}},
                                    json::object()),
                      ExpressionSyntaxError);
}

TEST_CASE("Structured output is validated with the metadata", "[MetadataSchema][Job]") {
    json meta = {{"prompt", "x"}, {"model_name", "m"}};

    REQUIRE(serviceMessage(NodeKind::Job, meta, {{"summary", "string"}}).empty());
    REQUIRE(serviceMessage(NodeKind::Job, meta, {{"summary", 1}}) ==
            "structured_output.summary: must be a type name or a nested shape");
}

TEST_CASE("Map metadata", "[MetadataSchema][Map]") {
    REQUIRE(serviceMessage(NodeKind::Map, {{"mapping", {{"a", "input.x"}, {"b", 2}}}}).empty());
    REQUIRE(serviceMessage(NodeKind::Map, {{"mapping", json::object()}}) ==
            "mapping: cannot be empty");
    REQUIRE(serviceMessage(NodeKind::Map, {{"mapping", {{"a", json::array()}}}}) ==
            "mapping.a: must be an expression, number or boolean");
}

TEST_CASE("Split metadata depends on the mode", "[MetadataSchema][Split]") {
    REQUIRE(serviceMessage(NodeKind::Split, {{"by", "item.kind"}}).empty());
    REQUIRE(serviceMessage(NodeKind::Split, {{"mode", "chunk"}, {"chunk_size", 10}}).empty());
    REQUIRE(serviceMessage(NodeKind::Split, json::object()) ==
            "by: by is required when mode is 'group_by'");
    REQUIRE(serviceMessage(NodeKind::Split, {{"mode", "chunk"}}) ==
            "chunk_size: chunk_size is required when mode is 'chunk'");
}

TEST_CASE("Return metadata", "[MetadataSchema][Return]") {
    REQUIRE(serviceMessage(NodeKind::Return, {{"payload_selector", "input"},
                                              {"status_code", 201}}).empty());
    REQUIRE(serviceMessage(NodeKind::Return, {{"payload_selector", "input"},
                                              {"status_code", 700}}) ==
            "status_code: must be between 100 and 599");
    REQUIRE(serviceMessage(NodeKind::Return, {{"payload_selector", "input"},
                                              {"content_type", "text/html"}}) ==
            "content_type: must be one of: application/json, application/x-www-form-urlencoded, text/plain");
}

TEST_CASE("HTTP metadata", "[MetadataSchema][Http]") {
    REQUIRE(serviceMessage(NodeKind::GetApi, {{"url", "https://api.example.com/v1"},
                                              {"headers", {{"Authorization", "Bearer {{ input.token }}"}}},
                                              {"query_map", {{"id", "input.id"}}}}).empty());
    REQUIRE(serviceMessage(NodeKind::GetApi, {{"url", "ftp://files.example.com"}}) ==
            "url: must be an http or https URL");
    REQUIRE(serviceMessage(NodeKind::GetApi, {{"url", "http://"}}) ==
            "url: must be an http or https URL");
    REQUIRE(serviceMessage(NodeKind::PostApi, {{"url", "http://h/x"},
                                               {"headers", {{"X-Count", 3}}}}) ==
            "headers.X-Count: must be a string");
    REQUIRE_THROWS_AS(ServiceRegistry::instance().get(NodeKind::PostApi)
                          .validate({{"url", "http://h/x"}, {"body_map", {{"a", {{"b", "1 +"}}}}}},
                                    json::object()),
                      ExpressionSyntaxError);
}

TEST_CASE("Workflow call metadata", "[MetadataSchema][Workflow]") {
    REQUIRE(serviceMessage(NodeKind::Workflow, {{"workflow_id", 3}, {"wait", "sync"}}).empty());
    REQUIRE(serviceMessage(NodeKind::Workflow, {{"workflow_id", 0}}) ==
            "workflow_id: must be greater than 0");
    REQUIRE(serviceMessage(NodeKind::Workflow, {{"workflow_id", 3}, {"wait", "async"}}) ==
            "wait: must be one of: sync");
}

TEST_CASE("Resource metadata", "[MetadataSchema][Resources]") {
    REQUIRE(serviceMessage(NodeKind::Guru, {{"space", "kb"}, {"query_template", "{{ input.q }}"},
                                            {"filters", {{"lang", "en"}}}}).empty());
    REQUIRE(serviceMessage(NodeKind::Guru, {{"space", "kb"}, {"query_template", "q"},
                                            {"filters", {{"lang", {"en"}}}}}) ==
            "filters.lang: must be a string, number or boolean");
    REQUIRE(serviceMessage(NodeKind::VectorQuery, {{"vector_store_id", "docs"},
                                                   {"query_template", "q"}}).empty());
    REQUIRE(serviceMessage(NodeKind::Embed, {{"vector_store_id", "docs"}}) ==
            "Missing required fields: input_selector");
}
