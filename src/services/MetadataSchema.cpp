#include "services/MetadataSchema.hpp"
#include "core/Errors.hpp"
#include "expr/Expression.hpp"
#include "expr/Functions.hpp"
#include "expr/PromptRenderer.hpp"
#include <algorithm>
#include <cctype>

namespace weft {
namespace services {

namespace {

bool hasType(const json& value, FieldType type) {
    switch (type) {
        case FieldType::String:  return value.is_string();
        case FieldType::Number:  return value.is_number();
        case FieldType::Integer: return value.is_number_integer();
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Object:  return value.is_object();
        case FieldType::Array:   return value.is_array();
        case FieldType::Any:     return true;
    }
    return false;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // anonymous namespace

std::string toString(FieldType type) {
    switch (type) {
        case FieldType::String:  return "string";
        case FieldType::Number:  return "number";
        case FieldType::Integer: return "integer";
        case FieldType::Boolean: return "boolean";
        case FieldType::Object:  return "object";
        case FieldType::Array:   return "array";
        case FieldType::Any:     return "any";
    }
    return "any";
}

// =============================================================================
// MetadataSchema
// =============================================================================

MetadataSchema& MetadataSchema::add(const std::string& name, FieldType type, bool required,
                                    std::vector<FieldCheck> checks) {
    auto it = std::find_if(m_fields.begin(), m_fields.end(),
                           [&](const FieldDef& f) { return f.name == name; });
    FieldDef def{name, type, required, std::move(checks), {}};
    if (it != m_fields.end()) {
        *it = std::move(def);
    } else {
        m_fields.push_back(std::move(def));
    }
    return *this;
}

MetadataSchema& MetadataSchema::required(const std::string& name, FieldType type,
                                         std::vector<FieldCheck> checks) {
    return add(name, type, true, std::move(checks));
}

MetadataSchema& MetadataSchema::optional(const std::string& name, FieldType type,
                                         std::vector<FieldCheck> checks) {
    return add(name, type, false, std::move(checks));
}

MetadataSchema& MetadataSchema::withCommonFields() {
    optional("name", FieldType::String);
    optional("description", FieldType::String);
    optional("timeout_ms", FieldType::Integer, {checks::positive()});
    optional("retry", FieldType::Integer, {checks::nonNegative()});
    optional("on_error", FieldType::String, {checks::oneOf({"fail", "skip", "continue"})});
    optional("tags", FieldType::Array, {checks::stringArray()});
    return *this;
}

const FieldDef* MetadataSchema::field(const std::string& name) const {
    for (const auto& f : m_fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

void MetadataSchema::validate(const json& metadata) const {
    if (!metadata.is_object()) {
        throw ValidationError("metadata", "must be an object");
    }

    std::vector<std::string> unknown;
    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        if (!field(it.key())) {
            unknown.push_back(it.key());
        }
    }
    if (!unknown.empty()) {
        std::sort(unknown.begin(), unknown.end());
        throw ValidationError("", "Unknown fields in metadata: " + joinNames(unknown));
    }

    std::vector<std::string> missing;
    for (const auto& f : m_fields) {
        if (f.required && !metadata.contains(f.name)) {
            missing.push_back(f.name);
        }
    }
    if (!missing.empty()) {
        std::sort(missing.begin(), missing.end());
        throw ValidationError("", "Missing required fields: " + joinNames(missing));
    }

    for (const auto& f : m_fields) {
        auto it = metadata.find(f.name);
        if (it == metadata.end()) continue;
        // null on an optional field means "not set"
        if (it->is_null() && !f.required) continue;

        if (!hasType(*it, f.type)) {
            throw ValidationError(f.name, "must be of type " + toString(f.type));
        }
        for (const auto& check : f.checks) {
            check(*it, f.name);
        }
    }
}

json MetadataSchema::describe() const {
    json required = json::array();
    json optional = json::array();
    json types = json::object();
    for (const auto& f : m_fields) {
        (f.required ? required : optional).push_back(f.name);
        types[f.name] = toString(f.type);
    }
    return {{"required", required}, {"optional", optional}, {"fields", types}};
}

// =============================================================================
// Checks
// =============================================================================

namespace checks {

FieldCheck nonEmpty() {
    return [](const json& value, const std::string& field) {
        const auto& s = value.get_ref<const std::string&>();
        if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); })) {
            throw ValidationError(field, "must be a non-empty string");
        }
    };
}

FieldCheck positive() {
    return [](const json& value, const std::string& field) {
        if (value.get<double>() <= 0) {
            throw ValidationError(field, "must be greater than 0");
        }
    };
}

FieldCheck nonNegative() {
    return [](const json& value, const std::string& field) {
        if (value.get<double>() < 0) {
            throw ValidationError(field, "must be greater than or equal to 0");
        }
    };
}

FieldCheck range(double min, double max) {
    return [min, max](const json& value, const std::string& field) {
        double v = value.get<double>();
        if (v < min || v > max) {
            throw ValidationError(field, "must be between " + expr::makeNumber(min).dump() +
                                         " and " + expr::makeNumber(max).dump());
        }
    };
}

FieldCheck oneOf(std::vector<std::string> allowed) {
    return [allowed = std::move(allowed)](const json& value, const std::string& field) {
        if (!value.is_string() ||
            std::find(allowed.begin(), allowed.end(), value.get<std::string>()) == allowed.end()) {
            throw ValidationError(field, "must be one of: " + joinNames(allowed));
        }
    };
}

FieldCheck expression() {
    return [](const json& value, const std::string& field) {
        if (!value.is_string()) {
            throw ValidationError(field, "must be an expression string");
        }
        expr::checkSyntax(value.get<std::string>(), field);
    };
}

FieldCheck expressionMap() {
    return [](const json& value, const std::string& field) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string path = field + "." + it.key();
            if (!it.value().is_string()) {
                throw ValidationError(path, "must be an expression string");
            }
            expr::checkSyntax(it.value().get<std::string>(), path);
        }
    };
}

FieldCheck stringMap() {
    return [](const json& value, const std::string& field) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it.value().is_string()) {
                throw ValidationError(field + "." + it.key(), "must be a string");
            }
        }
    };
}

FieldCheck stringArray() {
    return [](const json& value, const std::string& field) {
        for (size_t i = 0; i < value.size(); ++i) {
            if (!value[i].is_string()) {
                throw ValidationError(field + "[" + std::to_string(i) + "]", "must be a string");
            }
        }
    };
}

FieldCheck httpUrl() {
    return [](const json& value, const std::string& field) {
        const auto& url = value.get_ref<const std::string&>();
        std::string rest;
        if (url.rfind("http://", 0) == 0) {
            rest = url.substr(7);
        } else if (url.rfind("https://", 0) == 0) {
            rest = url.substr(8);
        } else {
            throw ValidationError(field, "must be an http or https URL");
        }
        if (rest.empty() || rest[0] == '/' || rest[0] == '?' ||
            rest.find(' ') != std::string::npos) {
            throw ValidationError(field, "must be an http or https URL");
        }
    };
}

FieldCheck scalarMap() {
    return [](const json& value, const std::string& field) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            const auto& v = it.value();
            if (!v.is_string() && !v.is_number() && !v.is_boolean()) {
                throw ValidationError(field + "." + it.key(),
                                      "must be a string, number or boolean");
            }
        }
    };
}

FieldCheck templateText() {
    return [](const json& value, const std::string& field) {
        expr::checkTemplate(value.get<std::string>(), field);
    };
}

FieldCheck nonEmptyObject() {
    return [](const json& value, const std::string& field) {
        if (value.empty()) {
            throw ValidationError(field, "cannot be empty");
        }
    };
}

} // namespace checks

} // namespace services
} // namespace weft
