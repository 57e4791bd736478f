#pragma once

#include <stdexcept>
#include <string>

namespace weft {

/**
 * Base class for every recoverable error raised by the engine
 */
class WeftError : public std::runtime_error {
public:
    explicit WeftError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Invalid node metadata or request payload.
 * Carries the offending field name (empty when not field-specific).
 */
class ValidationError : public WeftError {
public:
    ValidationError(std::string field, const std::string& message)
        : WeftError(field.empty() ? message : field + ": " + message)
        , m_field(std::move(field))
        , m_message(message) {}

    const std::string& field() const { return m_field; }
    const std::string& message() const { return m_message; }

private:
    std::string m_field;
    std::string m_message;
};

/**
 * Expression failed to parse
 */
class ExpressionSyntaxError : public WeftError {
public:
    ExpressionSyntaxError(std::string expression, std::string path, const std::string& cause)
        : WeftError("Syntax error" + (path.empty() ? std::string() : " in " + path) +
                    ": " + cause + " (expression: " + expression + ")")
        , m_expression(std::move(expression))
        , m_path(std::move(path))
        , m_cause(cause) {}

    const std::string& expression() const { return m_expression; }
    const std::string& path() const { return m_path; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_expression;
    std::string m_path;
    std::string m_cause;
};

/**
 * Expression parsed but could not be evaluated against its context
 */
class ExpressionEvaluationError : public WeftError {
public:
    ExpressionEvaluationError(std::string expression, std::string path, const std::string& cause)
        : WeftError("Evaluation failed" + (path.empty() ? std::string() : " in " + path) +
                    ": " + cause + " (expression: " + expression + ")")
        , m_expression(std::move(expression))
        , m_path(std::move(path))
        , m_cause(cause) {}

    const std::string& expression() const { return m_expression; }
    const std::string& path() const { return m_path; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_expression;
    std::string m_path;
    std::string m_cause;
};

class ExpressionTimeoutError : public ExpressionEvaluationError {
public:
    using ExpressionEvaluationError::ExpressionEvaluationError;
};

/**
 * A node service failed while executing (backend error, bad input...)
 */
class NodeExecutionError : public WeftError {
public:
    using WeftError::WeftError;
};

/**
 * Engine misconfiguration: missing service, invalid server option...
 */
class ConfigurationError : public WeftError {
public:
    using WeftError::WeftError;
};

/**
 * Repository lookup miss
 */
class NotFoundError : public WeftError {
public:
    using WeftError::WeftError;
};

/**
 * Programming error: an operation was called on data that breaks its
 * precondition (e.g. planning a graph that does not validate)
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace weft
