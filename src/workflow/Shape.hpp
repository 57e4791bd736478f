#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace weft {
namespace workflow {

using json = nlohmann::json;

/**
 * A shape is a JSON object mapping keys to type names ("string", "number",
 * "boolean", "array", "object", "null", "unknown"), nested shapes, or
 * {"type": "array", "items": <shape>}.
 */

/// "string", "number", "boolean", "array", "object" or "null"
std::string jsonTypeName(const json& value);

/**
 * Shape of a concrete value: each top-level key mapped to its type name.
 * Non-object values have an empty shape.
 */
json shapeOfValue(const json& value);

/// {"type": "object", "properties": ...} (or any top-level "type"/"properties")
bool isJsonSchemaForm(const json& structuredOutput);

/**
 * Shape declared by a node's structured_output, in either JSON-schema form
 * or direct shape form. Empty object when nothing is declared.
 */
json shapeFromStructuredOutput(const json& structuredOutput);

/**
 * Check that structured_output is an object and, in JSON-schema form, that
 * types and properties are well-formed. Throws ValidationError.
 */
void validateStructuredOutput(const json& structuredOutput);

/**
 * Shallow union merge of objects supplied in topological order
 *
 * Later entries win on key collisions. When `notes` is given, every key
 * written with a different value by two sources is reported, naming the
 * key and both node ids.
 */
json unionMerge(const std::vector<std::pair<int64_t, json>>& sourcesInOrder,
                std::vector<std::string>* notes = nullptr);

} // namespace workflow
} // namespace weft
