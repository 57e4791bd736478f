#include "workflow/Shape.hpp"
#include "core/Errors.hpp"
#include <map>
#include <set>

namespace weft {
namespace workflow {

namespace {

const std::set<std::string>& schemaTypes() {
    static const std::set<std::string> types = {
        "string", "number", "integer", "boolean", "array", "object", "null"
    };
    return types;
}

std::string normalizeSchemaType(const std::string& type) {
    return type == "integer" ? "number" : type;
}

json schemaToShape(const json& schema);

json schemaPropertyToShape(const json& property) {
    if (property.is_string()) {
        return property;
    }
    if (!property.is_object()) {
        return "unknown";
    }
    auto type = property.find("type");
    if (type == property.end() || !type->is_string()) {
        return property.contains("properties") ? schemaToShape(property) : json("unknown");
    }
    std::string typeName = type->get<std::string>();
    if (typeName == "object" && property.contains("properties")) {
        return schemaToShape(property);
    }
    if (typeName == "array" && property.contains("items")) {
        json items = schemaPropertyToShape(property.at("items"));
        return json{{"type", "array"}, {"items", items}};
    }
    return normalizeSchemaType(typeName);
}

json schemaToShape(const json& schema) {
    json shape = json::object();
    auto props = schema.find("properties");
    if (props == schema.end() || !props->is_object()) {
        return shape;
    }
    for (auto it = props->begin(); it != props->end(); ++it) {
        shape[it.key()] = schemaPropertyToShape(it.value());
    }
    return shape;
}

void validateSchemaNode(const json& schema, const std::string& path) {
    if (!schema.is_object()) {
        throw ValidationError(path, "schema must be an object");
    }
    auto type = schema.find("type");
    if (type != schema.end()) {
        if (!type->is_string() || !schemaTypes().count(type->get<std::string>())) {
            throw ValidationError(path + ".type", "unsupported schema type " + type->dump());
        }
    }
    auto props = schema.find("properties");
    if (props != schema.end()) {
        if (!props->is_object()) {
            throw ValidationError(path + ".properties", "must be an object");
        }
        for (auto it = props->begin(); it != props->end(); ++it) {
            validateSchemaNode(it.value(), path + ".properties." + it.key());
        }
    }
    auto items = schema.find("items");
    if (items != schema.end()) {
        validateSchemaNode(*items, path + ".items");
    }
}

} // anonymous namespace

std::string jsonTypeName(const json& value) {
    switch (value.type()) {
        case json::value_t::null:            return "null";
        case json::value_t::boolean:         return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:    return "number";
        case json::value_t::string:          return "string";
        case json::value_t::array:           return "array";
        case json::value_t::object:          return "object";
        default:                             return "unknown";
    }
}

json shapeOfValue(const json& value) {
    json shape = json::object();
    if (!value.is_object()) {
        return shape;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        shape[it.key()] = jsonTypeName(it.value());
    }
    return shape;
}

bool isJsonSchemaForm(const json& structuredOutput) {
    if (!structuredOutput.is_object()) {
        return false;
    }
    auto type = structuredOutput.find("type");
    if (type != structuredOutput.end() && type->is_string() && *type == "object") {
        return true;
    }
    auto props = structuredOutput.find("properties");
    return props != structuredOutput.end() && props->is_object();
}

json shapeFromStructuredOutput(const json& structuredOutput) {
    if (!structuredOutput.is_object() || structuredOutput.empty()) {
        return json::object();
    }
    if (isJsonSchemaForm(structuredOutput)) {
        return schemaToShape(structuredOutput);
    }
    return structuredOutput;
}

void validateStructuredOutput(const json& structuredOutput) {
    if (structuredOutput.is_null()) {
        return;
    }
    if (!structuredOutput.is_object()) {
        throw ValidationError("structured_output", "must be an object");
    }
    if (isJsonSchemaForm(structuredOutput)) {
        validateSchemaNode(structuredOutput, "structured_output");
        return;
    }
    for (auto it = structuredOutput.begin(); it != structuredOutput.end(); ++it) {
        if (!it.value().is_string() && !it.value().is_object()) {
            throw ValidationError("structured_output." + it.key(),
                                  "must be a type name or a nested shape");
        }
    }
}

json unionMerge(const std::vector<std::pair<int64_t, json>>& sourcesInOrder,
                std::vector<std::string>* notes) {
    json merged = json::object();
    std::map<std::string, int64_t> writer;

    for (const auto& [nodeId, value] : sourcesInOrder) {
        if (!value.is_object()) {
            continue;
        }
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto existing = merged.find(it.key());
            if (existing != merged.end() && *existing != it.value() && notes) {
                notes->push_back("Key '" + it.key() + "' has conflicting types from nodes " +
                                 std::to_string(writer[it.key()]) + " and " +
                                 std::to_string(nodeId) + "; using node " +
                                 std::to_string(nodeId));
            }
            merged[it.key()] = it.value();
            writer[it.key()] = nodeId;
        }
    }
    return merged;
}

} // namespace workflow
} // namespace weft
