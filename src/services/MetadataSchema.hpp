#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace weft {
namespace services {

using json = nlohmann::json;

/**
 * JSON type a metadata field must have
 */
enum class FieldType {
    String,
    Number,     // integer or floating point
    Integer,
    Boolean,
    Object,
    Array,
    Any
};

std::string toString(FieldType type);

/**
 * Extra check run on a field value of the right type.
 * Throws ValidationError(field, message).
 */
using FieldCheck = std::function<void(const json& value, const std::string& field)>;

struct FieldDef {
    std::string name;
    FieldType type = FieldType::Any;
    bool required = false;
    std::vector<FieldCheck> checks;
    std::string description;
};

/**
 * Declarative description of the metadata object of one node kind
 *
 * Example usage:
 *   MetadataSchema()
 *       .withCommonFields()
 *       .required("where", FieldType::String, {checks::expression()})
 *       .optional("items_selector", FieldType::String, {checks::expression()});
 *
 * validate() rejects missing required fields, unknown fields and values of
 * the wrong type, then runs each field's checks.
 */
class MetadataSchema {
public:
    MetadataSchema() = default;

    // === Field Definition ===

    MetadataSchema& required(const std::string& name, FieldType type,
                             std::vector<FieldCheck> checks = {});

    MetadataSchema& optional(const std::string& name, FieldType type,
                             std::vector<FieldCheck> checks = {});

    /**
     * Fields accepted by every node kind: name, description, timeout_ms,
     * retry, on_error, tags
     */
    MetadataSchema& withCommonFields();

    // === Validation ===

    void validate(const json& metadata) const;

    // === Introspection ===

    const std::vector<FieldDef>& fields() const { return m_fields; }
    const FieldDef* field(const std::string& name) const;

    /// {"required": [...], "optional": [...], "fields": {name: type}}
    json describe() const;

private:
    MetadataSchema& add(const std::string& name, FieldType type, bool required,
                        std::vector<FieldCheck> checks);

    std::vector<FieldDef> m_fields;
};

// =============================================================================
// Reusable field checks
// =============================================================================

namespace checks {

/// String with at least one non-space character
FieldCheck nonEmpty();

/// Number > 0
FieldCheck positive();

/// Number >= 0
FieldCheck nonNegative();

/// min <= number <= max
FieldCheck range(double min, double max);

/// String equal to one of `allowed`
FieldCheck oneOf(std::vector<std::string> allowed);

/// Non-empty string that parses as an expression
FieldCheck expression();

/// Object whose values are all expressions
FieldCheck expressionMap();

/// Object whose values are all strings
FieldCheck stringMap();

/// Array of strings
FieldCheck stringArray();

/// http:// or https:// URL with a host
FieldCheck httpUrl();

/// Object whose values are strings, numbers or booleans
FieldCheck scalarMap();

/// String whose {{ }} placeholders parse
FieldCheck templateText();

/// Non-empty object
FieldCheck nonEmptyObject();

} // namespace checks

} // namespace services
} // namespace weft
