#include "expr/Expression.hpp"
#include "expr/Functions.hpp"
#include "core/Errors.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace weft {
namespace expr {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Raised inside the evaluator, rewrapped with expression and path at the top
struct EvalFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct EvalTimeout {};

bool isBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

/**
 * Collapse a result sequence: empty -> null, single -> the item
 */
json collapse(json sequence) {
    if (sequence.empty()) return nullptr;
    if (sequence.size() == 1) return std::move(sequence[0]);
    return sequence;
}

void appendFlattened(json& sequence, json value) {
    if (value.is_null()) return;
    if (value.is_array()) {
        for (auto& item : value) {
            sequence.push_back(std::move(item));
        }
    } else {
        sequence.push_back(std::move(value));
    }
}

/**
 * Counts eval() recursion; walks deeper than kMaxTreeHeight fail
 */
class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : m_depth(depth) {
        if (m_depth >= kMaxTreeHeight) {
            throw EvalFailure("Expression nested too deeply");
        }
        ++m_depth;
    }
    ~DepthGuard() { --m_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    size_t& m_depth;
};

class Evaluator {
public:
    Evaluator(const json& root, const Bindings& variables, SteadyClock::time_point deadline)
        : m_root(root), m_variables(variables), m_deadline(deadline) {}

    json eval(const AstNode& node, const json& current) {
        checkDeadline();
        DepthGuard guard(m_depth);

        switch (node.type) {
            case AstNode::Type::Literal:
                return node.value;
            case AstNode::Type::Field:
                return field(current, node.name);
            case AstNode::Type::Wildcard:
                return wildcard(current);
            case AstNode::Type::Context:
                return current;
            case AstNode::Type::Root:
                return m_root;
            case AstNode::Type::Variable: {
                auto it = m_variables.find(node.name);
                return it != m_variables.end() ? it->second : json(nullptr);
            }
            case AstNode::Type::Path:
                return path(*node.children[0], *node.children[1], current);
            case AstNode::Type::Predicate:
                return predicate(*node.children[0], *node.children[1], current);
            case AstNode::Type::Negate: {
                json operand = eval(*node.children[0], current);
                if (operand.is_null()) return nullptr;
                if (!operand.is_number()) {
                    throw EvalFailure("Cannot negate a value of type " + std::string(operand.type_name()));
                }
                return makeNumber(-operand.get<double>());
            }
            case AstNode::Type::Binary:
                return binary(node, current);
            case AstNode::Type::Condition:
                return isTruthy(eval(*node.children[0], current))
                    ? eval(*node.children[1], current)
                    : eval(*node.children[2], current);
            case AstNode::Type::ArrayCtor: {
                json out = json::array();
                for (const auto& child : node.children) {
                    out.push_back(eval(*child, current));
                }
                return out;
            }
            case AstNode::Type::ObjectCtor: {
                json out = json::object();
                for (size_t i = 0; i + 1 < node.children.size(); i += 2) {
                    json key = eval(*node.children[i], current);
                    if (!key.is_string()) {
                        throw EvalFailure("Object key must be a string");
                    }
                    out[key.get<std::string>()] = eval(*node.children[i + 1], current);
                }
                return out;
            }
            case AstNode::Type::Call:
                return call(node, current);
        }
        throw EvalFailure("Unsupported expression node");
    }

private:
    void checkDeadline() {
        if ((++m_steps & 0xF) == 0 && SteadyClock::now() >= m_deadline) {
            throw EvalTimeout{};
        }
    }

    json field(const json& current, const std::string& name) {
        if (current.is_object()) {
            auto it = current.find(name);
            return it != current.end() ? *it : json(nullptr);
        }
        if (current.is_array()) {
            json sequence = json::array();
            for (const auto& item : current) {
                checkDeadline();
                appendFlattened(sequence, field(item, name));
            }
            return collapse(std::move(sequence));
        }
        return nullptr;
    }

    json wildcard(const json& current) {
        json sequence = json::array();
        if (current.is_object()) {
            for (const auto& value : current) {
                appendFlattened(sequence, value);
            }
        } else if (current.is_array()) {
            for (const auto& item : current) {
                appendFlattened(sequence, item.is_object() ? wildcard(item) : item);
            }
        } else {
            return current;
        }
        return collapse(std::move(sequence));
    }

    json path(const AstNode& lhs, const AstNode& rhs, const json& current) {
        json base = eval(lhs, current);
        if (base.is_null()) return nullptr;
        if (!base.is_array()) {
            return eval(rhs, base);
        }
        json sequence = json::array();
        for (const auto& item : base) {
            appendFlattened(sequence, eval(rhs, item));
        }
        return collapse(std::move(sequence));
    }

    json predicate(const AstNode& lhs, const AstNode& filter, const json& current) {
        json base = eval(lhs, current);
        if (base.is_null()) return nullptr;
        if (!base.is_array()) {
            base = json::array({std::move(base)});
        }

        const auto count = static_cast<int64_t>(base.size());
        json sequence = json::array();
        for (int64_t i = 0; i < count; ++i) {
            json verdict = eval(filter, base[static_cast<size_t>(i)]);
            if (verdict.is_number()) {
                int64_t index = clampToRange(std::floor(verdict.get<double>()), -count - 1, count);
                if (index < 0) index += count;
                if (index == i) sequence.push_back(base[static_cast<size_t>(i)]);
            } else if (isTruthy(verdict)) {
                sequence.push_back(base[static_cast<size_t>(i)]);
            }
        }
        return collapse(std::move(sequence));
    }

    json binary(const AstNode& node, const json& current) {
        const std::string& op = node.name;

        if (op == "and") {
            return isTruthy(eval(*node.children[0], current)) &&
                   isTruthy(eval(*node.children[1], current));
        }
        if (op == "or") {
            return isTruthy(eval(*node.children[0], current)) ||
                   isTruthy(eval(*node.children[1], current));
        }

        json left = eval(*node.children[0], current);
        json right = eval(*node.children[1], current);

        if (op == "=") return left == right;
        if (op == "!=") return left != right;
        if (op == "<" || op == "<=" || op == ">" || op == ">=") {
            return compare(op, left, right);
        }
        if (op == "in") {
            if (right.is_array()) {
                for (const auto& item : right) {
                    if (item == left) return true;
                }
                return false;
            }
            return !right.is_null() && left == right;
        }
        if (op == "&") {
            return toDisplayString(left) + toDisplayString(right);
        }
        return arithmetic(op, left, right);
    }

    json compare(const std::string& op, const json& left, const json& right) {
        if (left.is_null() || right.is_null()) {
            return false;
        }
        int order = 0;
        if (left.is_number() && right.is_number()) {
            double l = left.get<double>();
            double r = right.get<double>();
            order = l < r ? -1 : (l > r ? 1 : 0);
        } else if (left.is_string() && right.is_string()) {
            int c = left.get_ref<const std::string&>().compare(right.get_ref<const std::string&>());
            order = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
            throw EvalFailure("Cannot compare " + std::string(left.type_name()) +
                              " with " + std::string(right.type_name()));
        }
        if (op == "<") return order < 0;
        if (op == "<=") return order <= 0;
        if (op == ">") return order > 0;
        return order >= 0;
    }

    json arithmetic(const std::string& op, const json& left, const json& right) {
        if (left.is_null() || right.is_null()) {
            return nullptr;
        }
        if (!left.is_number() || !right.is_number()) {
            const json& bad = left.is_number() ? right : left;
            throw EvalFailure("Operand of '" + op + "' is not a number (" +
                              std::string(bad.type_name()) + ")");
        }
        double l = left.get<double>();
        double r = right.get<double>();

        if (op == "+") return makeNumber(l + r);
        if (op == "-") return makeNumber(l - r);
        if (op == "*") return makeNumber(l * r);
        if (r == 0.0) {
            throw EvalFailure("Division by zero");
        }
        if (op == "/") return makeNumber(l / r);
        return makeNumber(std::fmod(l, r));
    }

    json call(const AstNode& node, const json& current) {
        const FunctionSpec* spec = findFunction(node.name);
        if (!spec) {
            throw EvalFailure("Unknown function: $" + node.name);
        }
        std::vector<json> args;
        args.reserve(node.children.size());
        for (const auto& child : node.children) {
            args.push_back(eval(*child, current));
        }
        try {
            return spec->impl(args);
        } catch (const EvalFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw EvalFailure(e.what());
        }
    }

    const json& m_root;
    const Bindings& m_variables;
    SteadyClock::time_point m_deadline;
    uint64_t m_steps = 0;
    size_t m_depth = 0;
};

} // anonymous namespace

// ============================================================================
// Expression
// ============================================================================

Expression::Expression(std::string source, std::string path, AstNodePtr root)
    : m_source(std::move(source))
    , m_path(std::move(path))
    , m_root(std::move(root))
{}

Expression Expression::compile(const std::string& expression, const std::string& path) {
    if (isBlank(expression)) {
        throw ExpressionSyntaxError(expression, path, "Expression cannot be empty");
    }
    try {
        Parser parser(expression);
        return Expression(expression, path, parser.parse());
    } catch (const std::runtime_error& e) {
        throw ExpressionSyntaxError(expression, path, e.what());
    } catch (const std::invalid_argument& e) {
        throw ExpressionSyntaxError(expression, path, e.what());
    } catch (const std::out_of_range&) {
        throw ExpressionSyntaxError(expression, path, "Number out of range");
    }
}

json Expression::evaluate(const json& context,
                          const Bindings& variables,
                          std::chrono::milliseconds timeout) const {
    auto deadline = SteadyClock::now() + timeout;
    try {
        Evaluator evaluator(context, variables, deadline);
        return evaluator.eval(*m_root, context);
    } catch (const EvalTimeout&) {
        throw ExpressionTimeoutError(m_source, m_path,
            "timed out after " + std::to_string(timeout.count()) + "ms");
    } catch (const EvalFailure& e) {
        throw ExpressionEvaluationError(m_source, m_path, e.what());
    } catch (const json::exception& e) {
        throw ExpressionEvaluationError(m_source, m_path, e.what());
    }
}

json evaluate(const std::string& expression,
              const json& context,
              std::chrono::milliseconds timeout,
              const std::string& path,
              const Bindings& variables) {
    return Expression::compile(expression, path).evaluate(context, variables, timeout);
}

void checkSyntax(const std::string& expression, const std::string& path) {
    Expression::compile(expression, path);
}

bool isTruthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case json::value_t::array:
        case json::value_t::object:
            return !value.empty();
        default:
            return false;
    }
}

std::string toDisplayString(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // namespace expr
} // namespace weft
