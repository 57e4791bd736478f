#pragma once

#include "services/NodeService.hpp"

namespace weft {
namespace services {

/**
 * job: render the prompt and ask the model client for a completion.
 * With a declared structured output the completion is parsed as JSON.
 */
class JobService : public NodeService {
public:
    JobService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * embed: select texts from the input, embed them and upsert them into a
 * vector store
 */
class EmbedService : public NodeService {
public:
    EmbedService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

} // namespace services
} // namespace weft
