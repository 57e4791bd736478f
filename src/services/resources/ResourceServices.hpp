#pragma once

#include "services/NodeService.hpp"

namespace weft {
namespace services {

/**
 * guru: knowledge-base search with a rendered query
 */
class GuruService : public NodeService {
public:
    GuruService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * get_api: HTTP GET with headers and a query string built from expressions
 */
class GetApiService : public NodeService {
public:
    GetApiService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * post_api: HTTP POST with a body built from body_map
 */
class PostApiService : public NodeService {
public:
    PostApiService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/**
 * vector_query: similarity search in a vector store
 */
class VectorQueryService : public NodeService {
public:
    VectorQueryService();
    json plan(const json& metadata, const json& inputShape,
              const json& structuredOutput) const override;
    json execute(const NodeInput& input, const json& metadata,
                 const ExecutionEnv& env) const override;
};

/// Percent-encode a string for use in a query string or form body
std::string urlEncode(const std::string& text);

} // namespace services
} // namespace weft
