#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace weft {
namespace expr {

using json = nlohmann::json;

/**
 * Builtin function signature.
 * Implementations throw std::runtime_error on bad arguments.
 */
using FunctionImpl = std::function<json(const std::vector<json>& args)>;

struct FunctionSpec {
    size_t minArgs;
    size_t maxArgs;
    FunctionImpl impl;
};

/**
 * All builtin functions, keyed by name without the leading '$'
 */
const std::map<std::string, FunctionSpec>& builtinFunctions();

/**
 * Returns nullptr for unknown names
 */
const FunctionSpec* findFunction(const std::string& name);

/**
 * Integral doubles within the exact range become JSON integers.
 * Throws std::runtime_error for NaN or infinity.
 */
json makeNumber(double value);

/**
 * Truncate toward zero into [lo, hi]. NaN gives lo.
 */
int64_t clampToRange(double value, int64_t lo, int64_t hi);

} // namespace expr
} // namespace weft
