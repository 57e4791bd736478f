#include "workflow/Cron.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <sstream>
#include <vector>

namespace weft {
namespace workflow {

namespace {

struct FieldRange {
    int min;
    int max;
    const char* const* names;   // nullptr or list of names mapped to min..
    size_t nameCount;
};

const char* const kMonthNames[] = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
};
const char* const kDayNames[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::optional<int> parseValue(const std::string& token, const FieldRange& range) {
    if (token.empty()) return std::nullopt;

    if (std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (token.size() > 4) return std::nullopt;
        int value = std::stoi(token);
        // Day-of-week allows 7 as an alias of Sunday
        int max = (range.names == kDayNames) ? 7 : range.max;
        if (value < range.min || value > max) return std::nullopt;
        return value;
    }

    if (range.names) {
        std::string lower;
        for (char c : token) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        for (size_t i = 0; i < range.nameCount; ++i) {
            if (lower == range.names[i]) {
                return range.min + static_cast<int>(i);
            }
        }
    }
    return std::nullopt;
}

bool isValidPart(const std::string& part, const FieldRange& range) {
    std::string base = part;
    auto slash = part.find('/');
    if (slash != std::string::npos) {
        base = part.substr(0, slash);
        std::string step = part.substr(slash + 1);
        if (step.empty() || step.size() > 4 ||
            !std::all_of(step.begin(), step.end(), [](unsigned char c) { return std::isdigit(c); }) ||
            std::stoi(step) == 0) {
            return false;
        }
    }

    if (base == "*" || base == "?") {
        return true;
    }

    auto dash = base.find('-');
    if (dash != std::string::npos) {
        auto low = parseValue(base.substr(0, dash), range);
        auto high = parseValue(base.substr(dash + 1), range);
        return low && high && *low <= *high;
    }

    return parseValue(base, range).has_value();
}

bool isValidField(const std::string& field, const FieldRange& range) {
    for (const auto& part : split(field, ',')) {
        if (!isValidPart(part, range)) {
            return false;
        }
    }
    return !field.empty();
}

} // anonymous namespace

bool isValidCron(const std::string& expression) {
    static const std::array<std::string, 7> shortcuts = {
        "@yearly", "@annually", "@monthly", "@weekly", "@daily", "@midnight", "@hourly"
    };

    std::istringstream iss(expression);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    if (fields.size() == 1 && fields[0][0] == '@') {
        return std::find(shortcuts.begin(), shortcuts.end(), fields[0]) != shortcuts.end();
    }

    static const FieldRange kSeconds{0, 59, nullptr, 0};
    static const FieldRange kMinutes{0, 59, nullptr, 0};
    static const FieldRange kHours{0, 23, nullptr, 0};
    static const FieldRange kDays{1, 31, nullptr, 0};
    static const FieldRange kMonths{1, 12, kMonthNames, 12};
    static const FieldRange kWeekdays{0, 6, kDayNames, 7};

    std::vector<const FieldRange*> layout = {&kMinutes, &kHours, &kDays, &kMonths, &kWeekdays};
    if (fields.size() == 6) {
        layout.push_back(&kSeconds);
    } else if (fields.size() != 5) {
        return false;
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        if (!isValidField(fields[i], *layout[i])) {
            return false;
        }
    }
    return true;
}

} // namespace workflow
} // namespace weft
