#include "expr/PromptRenderer.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace weft {
namespace expr {

namespace {

const char* const kOpen = "{{";
const char* const kClose = "}}";

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) ++start;
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(start, end - start);
}

std::string formatUtc(const std::tm& utc, const char* format) {
    std::ostringstream oss;
    oss << std::put_time(&utc, format);
    return oss.str();
}

bool hasExplicitRoot(const std::string& expression) {
    auto startsWithRoot = [&expression](const std::string& root) {
        return expression.rfind(root, 0) == 0 &&
               (expression.size() == root.size() || expression[root.size()] == '.' ||
                expression[root.size()] == '[');
    };
    return startsWithRoot("base") || startsWithRoot("input") || expression.rfind("$", 0) == 0;
}

/**
 * Walk the template and call `onPlaceholder(start, end, inner)` for each
 * well-formed placeholder; [start, end) spans the braces
 */
template <typename Callback>
void forEachPlaceholder(const std::string& text, Callback onPlaceholder) {
    size_t pos = 0;
    while (true) {
        size_t open = text.find(kOpen, pos);
        if (open == std::string::npos) return;
        size_t close = text.find(kClose, open + 2);
        if (close == std::string::npos) return;
        onPlaceholder(open, close + 2, trim(text.substr(open + 2, close - open - 2)));
        pos = close + 2;
    }
}

} // anonymous namespace

json makeBaseContext(TimePoint now) {
    auto time = Clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);

    return json{
        {"timestamp", formatIsoTimestamp(now)},
        {"date", formatUtc(utc, "%Y-%m-%d")},
        {"time", formatUtc(utc, "%H:%M:%S")},
        {"timezone", "UTC"},
        {"unix_timestamp", static_cast<int64_t>(time)},
        {"day_of_week", formatUtc(utc, "%A")},
        {"month", formatUtc(utc, "%B")},
        {"year", utc.tm_year + 1900}
    };
}

json makeContext(const json& base, const json& input) {
    return json{{"base", base}, {"input", input}};
}

std::vector<std::string> extractPlaceholders(const std::string& templateText) {
    std::vector<std::string> result;
    forEachPlaceholder(templateText, [&result](size_t, size_t, const std::string& inner) {
        result.push_back(inner);
    });
    return result;
}

void checkTemplate(const std::string& templateText, const std::string& path) {
    for (const auto& expression : extractPlaceholders(templateText)) {
        checkSyntax(expression, path);
    }
}

RenderResult renderTemplate(const std::string& templateText,
                            const json& context,
                            std::chrono::milliseconds timeout) {
    RenderResult result;
    size_t copied = 0;

    forEachPlaceholder(templateText, [&](size_t start, size_t end, const std::string& inner) {
        result.text += templateText.substr(copied, start - copied);
        copied = end;

        json value;
        try {
            if (inner.empty()) {
                value = nullptr;
            } else if (hasExplicitRoot(inner)) {
                value = evaluate(inner, context, timeout);
            } else {
                value = evaluate(inner, context.value("input", json::object()), timeout);
                if (value.is_null()) {
                    value = evaluate(inner, context.value("base", json::object()), timeout);
                }
            }
        } catch (const WeftError& e) {
            LOG_DEBUG("Placeholder {{" + inner + "}} failed: " + std::string(e.what()));
            value = nullptr;
        }

        if (value.is_null()) {
            std::string warning = "Could not resolve placeholder: {{" + inner + "}}";
            LOG_WARN(warning);
            result.warnings.push_back(std::move(warning));
            result.text += templateText.substr(start, end - start);
        } else {
            result.text += toDisplayString(value);
        }
    });

    result.text += templateText.substr(copied);
    return result;
}

} // namespace expr
} // namespace weft
