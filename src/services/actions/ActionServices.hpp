#pragma once

#include "services/NodeService.hpp"

namespace weft {
namespace services {

// Control and data-shaping nodes. None of them needs a backend except
// WorkflowCallService, which goes through ExecutionEnv::subWorkflows.

/**
 * filter: keep the items for which `where` is truthy
 */
class FilterService : public NodeService {
public:
    FilterService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * map: build a new object, one expression (or literal) per key
 */
class MapService : public NodeService {
public:
    MapService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * if_else: evaluate the predicate. The executor follows the edge whose
 * label matches `branch_taken`.
 */
class IfElseService : public NodeService {
public:
    IfElseService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * for_each: select the item array. The executor runs the loop body once
 * per item.
 */
class ForEachService : public NodeService {
public:
    ForEachService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;

    /// {"items": [...]}
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * merge: combine the outputs of the direct parents
 */
class MergeService : public NodeService {
public:
    MergeService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * split: group items by a key expression, or cut them into chunks
 */
class SplitService : public NodeService {
public:
    SplitService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;

protected:
    void validateSpecific(const json& metadata) const override;
};

/**
 * advanced: evaluate a free-form expression
 */
class AdvancedService : public NodeService {
public:
    AdvancedService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * return: produce the run result
 */
class ReturnService : public NodeService {
public:
    ReturnService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * workflow: run another workflow inline
 */
class WorkflowCallService : public NodeService {
public:
    WorkflowCallService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

} // namespace services
} // namespace weft
