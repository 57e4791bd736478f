#include "expr/Functions.hpp"
#include "expr/Expression.hpp"
#include "core/TimeUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace weft {
namespace expr {

namespace {

const json& arg(const std::vector<json>& args, size_t index) {
    static const json null;
    return index < args.size() ? args[index] : null;
}

const std::string& requireString(const json& value, const char* function) {
    if (!value.is_string()) {
        throw std::runtime_error(std::string("$") + function + " expects a string argument");
    }
    return value.get_ref<const std::string&>();
}

double requireNumber(const json& value, const char* function) {
    if (!value.is_number()) {
        throw std::runtime_error(std::string("$") + function + " expects a number argument");
    }
    return value.get<double>();
}

std::vector<double> numberSequence(const json& value, const char* function) {
    std::vector<double> numbers;
    if (value.is_null()) {
        return numbers;
    }
    if (value.is_number()) {
        numbers.push_back(value.get<double>());
        return numbers;
    }
    if (!value.is_array()) {
        throw std::runtime_error(std::string("$") + function + " expects an array of numbers");
    }
    for (const auto& item : value) {
        if (!item.is_number()) {
            throw std::runtime_error(std::string("$") + function + " expects an array of numbers");
        }
        numbers.push_back(item.get<double>());
    }
    return numbers;
}

// Code point count of a UTF-8 string
size_t utf8Length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// Byte offset of the n-th code point
size_t utf8Offset(const std::string& s, size_t codePoint) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (count == codePoint) return i;
            ++count;
        }
    }
    return s.size();
}

json fnCount(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    if (v.is_null()) return 0;
    if (v.is_array()) return static_cast<int64_t>(v.size());
    return 1;
}

json fnSum(const std::vector<json>& args) {
    double total = 0.0;
    for (double n : numberSequence(arg(args, 0), "sum")) total += n;
    return makeNumber(total);
}

json fnMax(const std::vector<json>& args) {
    auto numbers = numberSequence(arg(args, 0), "max");
    if (numbers.empty()) return nullptr;
    return makeNumber(*std::max_element(numbers.begin(), numbers.end()));
}

json fnMin(const std::vector<json>& args) {
    auto numbers = numberSequence(arg(args, 0), "min");
    if (numbers.empty()) return nullptr;
    return makeNumber(*std::min_element(numbers.begin(), numbers.end()));
}

json fnAverage(const std::vector<json>& args) {
    auto numbers = numberSequence(arg(args, 0), "average");
    if (numbers.empty()) return nullptr;
    double total = 0.0;
    for (double n : numbers) total += n;
    return makeNumber(total / static_cast<double>(numbers.size()));
}

json fnString(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    if (v.is_null()) return nullptr;
    return toDisplayString(v);
}

json fnNumber(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    if (v.is_null()) return nullptr;
    if (v.is_number()) return v;
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(s, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != s.size()) {
            throw std::runtime_error("Cannot convert \"" + s + "\" to a number");
        }
        return makeNumber(parsed);
    }
    throw std::runtime_error("Cannot convert " + std::string(v.type_name()) + " to a number");
}

json fnBoolean(const std::vector<json>& args) {
    return isTruthy(arg(args, 0));
}

json fnNot(const std::vector<json>& args) {
    return !isTruthy(arg(args, 0));
}

json fnExists(const std::vector<json>& args) {
    return !arg(args, 0).is_null();
}

json fnLength(const std::vector<json>& args) {
    return static_cast<int64_t>(utf8Length(requireString(arg(args, 0), "length")));
}

json fnUppercase(const std::vector<json>& args) {
    std::string s = requireString(arg(args, 0), "uppercase");
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

json fnLowercase(const std::vector<json>& args) {
    std::string s = requireString(arg(args, 0), "lowercase");
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

json fnTrim(const std::vector<json>& args) {
    // Strips both ends and collapses inner whitespace runs to one space
    const std::string& s = requireString(arg(args, 0), "trim");
    std::string out;
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
        } else {
            if (pendingSpace) out += ' ';
            pendingSpace = false;
            out += static_cast<char>(c);
        }
    }
    return out;
}

json fnSubstring(const std::vector<json>& args) {
    const std::string& s = requireString(arg(args, 0), "substring");
    int64_t length = static_cast<int64_t>(utf8Length(s));
    int64_t start = clampToRange(requireNumber(arg(args, 1), "substring"), -length, length);
    if (start < 0) start += length;

    int64_t count = length - start;
    if (args.size() > 2) {
        count = clampToRange(requireNumber(args[2], "substring"), 0, length - start);
    }

    size_t from = utf8Offset(s, static_cast<size_t>(start));
    size_t to = utf8Offset(s, static_cast<size_t>(start + count));
    return s.substr(from, to - from);
}

json fnContains(const std::vector<json>& args) {
    const std::string& s = requireString(arg(args, 0), "contains");
    const std::string& pattern = requireString(arg(args, 1), "contains");
    return s.find(pattern) != std::string::npos;
}

json fnJoin(const std::vector<json>& args) {
    const json& items = arg(args, 0);
    std::string separator = args.size() > 1 ? requireString(args[1], "join") : "";
    if (items.is_null()) return nullptr;
    if (items.is_string()) return items;
    if (!items.is_array()) {
        throw std::runtime_error("$join expects an array of strings");
    }
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += separator;
        out += requireString(item, "join");
        first = false;
    }
    return out;
}

json fnSplit(const std::vector<json>& args) {
    const std::string& s = requireString(arg(args, 0), "split");
    const std::string& separator = requireString(arg(args, 1), "split");
    json parts = json::array();
    if (separator.empty()) {
        for (size_t i = 0; i < s.size(); ) {
            size_t next = utf8Offset(s.substr(i), 1) + i;
            parts.push_back(s.substr(i, next - i));
            i = next;
        }
        return parts;
    }
    size_t pos = 0;
    while (true) {
        size_t found = s.find(separator, pos);
        if (found == std::string::npos) {
            parts.push_back(s.substr(pos));
            break;
        }
        parts.push_back(s.substr(pos, found - pos));
        pos = found + separator.size();
    }
    return parts;
}

json fnKeys(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    json keys = json::array();
    auto collect = [&keys](const json& obj) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (std::find(keys.begin(), keys.end(), it.key()) == keys.end()) {
                keys.push_back(it.key());
            }
        }
    };
    if (v.is_object()) {
        collect(v);
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_object()) collect(item);
        }
    }
    return keys;
}

json fnAppend(const std::vector<json>& args) {
    const json& a = arg(args, 0);
    const json& b = arg(args, 1);
    if (b.is_null()) return a;
    if (a.is_null()) return b;
    json out = a.is_array() ? a : json::array({a});
    if (b.is_array()) {
        out.insert(out.end(), b.begin(), b.end());
    } else {
        out.push_back(b);
    }
    return out;
}

json fnRound(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    if (v.is_null()) return nullptr;
    double value = requireNumber(v, "round");
    int64_t precision = args.size() > 1 ? clampToRange(requireNumber(args[1], "round"), -15, 15) : 0;
    double scale = std::pow(10.0, static_cast<double>(precision));
    // nearbyint rounds half to even under the default rounding mode
    return makeNumber(std::nearbyint(value * scale) / scale);
}

json fnAbs(const std::vector<json>& args) {
    const json& v = arg(args, 0);
    if (v.is_null()) return nullptr;
    return makeNumber(std::fabs(requireNumber(v, "abs")));
}

json fnNow(const std::vector<json>& /*args*/) {
    return formatIsoTimestamp(nowMillis());
}

} // anonymous namespace

int64_t clampToRange(double value, int64_t lo, int64_t hi) {
    if (std::isnan(value) || value <= static_cast<double>(lo)) return lo;
    if (value >= static_cast<double>(hi)) return hi;
    return static_cast<int64_t>(value);
}

json makeNumber(double value) {
    if (!std::isfinite(value)) {
        throw std::runtime_error("Numeric result is not finite");
    }
    if (value == std::floor(value) && std::fabs(value) < 9007199254740992.0) {
        return static_cast<int64_t>(value);
    }
    return value;
}

const std::map<std::string, FunctionSpec>& builtinFunctions() {
    static const std::map<std::string, FunctionSpec> functions = {
        {"count",     {1, 1, fnCount}},
        {"sum",       {1, 1, fnSum}},
        {"max",       {1, 1, fnMax}},
        {"min",       {1, 1, fnMin}},
        {"average",   {1, 1, fnAverage}},
        {"string",    {1, 1, fnString}},
        {"number",    {1, 1, fnNumber}},
        {"boolean",   {1, 1, fnBoolean}},
        {"not",       {1, 1, fnNot}},
        {"exists",    {1, 1, fnExists}},
        {"length",    {1, 1, fnLength}},
        {"uppercase", {1, 1, fnUppercase}},
        {"lowercase", {1, 1, fnLowercase}},
        {"trim",      {1, 1, fnTrim}},
        {"substring", {2, 3, fnSubstring}},
        {"contains",  {2, 2, fnContains}},
        {"join",      {1, 2, fnJoin}},
        {"split",     {2, 2, fnSplit}},
        {"keys",      {1, 1, fnKeys}},
        {"append",    {2, 2, fnAppend}},
        {"round",     {1, 2, fnRound}},
        {"abs",       {1, 1, fnAbs}},
        {"now",       {0, 0, fnNow}},
    };
    return functions;
}

const FunctionSpec* findFunction(const std::string& name) {
    const auto& functions = builtinFunctions();
    auto it = functions.find(name);
    return it != functions.end() ? &it->second : nullptr;
}

} // namespace expr
} // namespace weft
