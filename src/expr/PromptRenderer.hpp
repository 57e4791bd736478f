#pragma once

#include "expr/Expression.hpp"
#include "core/TimeUtil.hpp"
#include <string>
#include <vector>

namespace weft {
namespace expr {

/**
 * Environment values exposed under the "base" root:
 * timestamp, date, time, timezone, unix_timestamp, day_of_week, month, year.
 * All derived from `now` in UTC.
 */
json makeBaseContext(TimePoint now);

/**
 * Build the evaluation context {"base": base, "input": input}
 */
json makeContext(const json& base, const json& input);

/**
 * Result of rendering a {{ placeholder }} template
 */
struct RenderResult {
    std::string text;
    std::vector<std::string> warnings;
};

/**
 * Return the inner expressions of every {{ ... }} placeholder, trimmed,
 * in order of appearance
 */
std::vector<std::string> extractPlaceholders(const std::string& templateText);

/**
 * Syntax-check every placeholder. Throws ExpressionSyntaxError naming `path`.
 */
void checkTemplate(const std::string& templateText, const std::string& path);

/**
 * Replace {{ expr }} placeholders with the string form of their value
 *
 * Expressions starting with "base." / "input." (or "$") are evaluated
 * against the full context; bare paths are tried against input first, then
 * base. A placeholder that fails or yields null is left untouched and a
 * warning is recorded.
 */
RenderResult renderTemplate(const std::string& templateText,
                            const json& context,
                            std::chrono::milliseconds timeout = kDefaultTimeout);

} // namespace expr
} // namespace weft
