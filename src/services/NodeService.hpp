#pragma once

#include "services/Backends.hpp"
#include "services/MetadataSchema.hpp"
#include "expr/Expression.hpp"
#include "workflow/Types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace weft {
namespace services {

using workflow::NodeKind;

/**
 * Output of a direct parent, as seen by the child being executed
 */
struct ParentOutput {
    int64_t nodeId = 0;
    size_t topoIndex = 0;
    json output;
};

/**
 * Everything a node receives when it runs
 */
struct NodeInput {
    int64_t nodeId = 0;
    json data = json::object();          // merged outputs of executed ancestors
    std::vector<ParentOutput> parents;   // direct parents, in edge order
    json structuredOutput = json::object();
};

/**
 * Run-wide values shared by every node execution
 */
struct ExecutionEnv {
    json base = json::object();
    std::chrono::milliseconds expressionTimeout = expr::kDefaultTimeout;
    const Backends* backends = nullptr;
    SubWorkflowRunner* subWorkflows = nullptr;
};

/**
 * What the executor does when a node fails
 */
enum class OnError {
    Fail,       // fail the run
    Skip,       // skip every node depending on the failed one
    Continue    // substitute {} and go on
};

/// Policy from metadata.on_error (default Fail)
OnError onErrorPolicy(const json& metadata);

std::string toString(OnError policy);

/**
 * Base class of the per-kind services
 *
 * A service validates the metadata of its kind, predicts the output shape
 * from the input shape (plan) and produces an output from actual data
 * (execute). Services are stateless and shared across runs.
 */
class NodeService {
public:
    NodeService(NodeKind kind, MetadataSchema schema);
    virtual ~NodeService() = default;

    NodeService(const NodeService&) = delete;
    NodeService& operator=(const NodeService&) = delete;

    NodeKind kind() const { return m_kind; }
    const MetadataSchema& schema() const { return m_schema; }

    /**
     * Check metadata against the schema and the kind-specific rules, and
     * structured_output against the shape rules. Throws ValidationError
     * (or ExpressionSyntaxError for malformed expressions).
     */
    void validate(const json& metadata, const json& structuredOutput) const;

    /**
     * Output shape when the node declares no structured output
     */
    virtual json plan(const json& metadata,
                      const json& inputShape,
                      const json& structuredOutput) const = 0;

    /**
     * Produce the node output. Throws NodeExecutionError or an expression
     * error on failure.
     */
    virtual json execute(const NodeInput& input,
                         const json& metadata,
                         const ExecutionEnv& env) const = 0;

protected:
    virtual void validateSpecific(const json& metadata) const { (void)metadata; }

    // === Helpers for subclasses ===

    /// {"base": env.base, "input": input.data}
    static json makeContext(const NodeInput& input, const ExecutionEnv& env);

    /// Evaluate metadata[field] against `context`
    static json evaluateField(const json& metadata, const std::string& field,
                              const json& context, const ExecutionEnv& env,
                              const expr::Bindings& variables = {});

    /// Render metadata[field] as a {{ }} template, logging unresolved placeholders
    static std::string renderField(const json& metadata, const std::string& field,
                                   const json& context, const ExecutionEnv& env);

    /// Context and variables for one element of an item list
    static json itemContext(const json& context, const json& item, size_t index);
    static expr::Bindings itemBindings(const json& item, size_t index);

    /// metadata[field] as string, or `fallback` when absent or null
    static std::string stringOr(const json& metadata, const std::string& field,
                                const std::string& fallback);

    /// metadata[field] as integer, or `fallback` when absent or null
    static int64_t intOr(const json& metadata, const std::string& field, int64_t fallback);

    /// metadata[field] as bool, or `fallback` when absent or null
    static bool boolOr(const json& metadata, const std::string& field, bool fallback);

private:
    NodeKind m_kind;
    MetadataSchema m_schema;
};

} // namespace services
} // namespace weft
