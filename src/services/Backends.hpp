#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weft {
namespace services {

using json = nlohmann::json;

// =============================================================================
// Leaf backends
//
// Node services never talk to the network themselves; they go through these
// interfaces, injected at startup (or replaced by fakes in tests).
// =============================================================================

struct ModelRequest {
    std::string model;
    std::string prompt;
    std::string system;
    std::optional<double> temperature;
    std::optional<int64_t> maxTokens;
    std::vector<std::string> stop;
    bool jsonOutput = false;
    json outputSchema = json::object();
};

/**
 * Text completion (LLM) backend
 */
class ModelClient {
public:
    virtual ~ModelClient() = default;

    /// Returns the completion text. Throws on transport or provider failure.
    virtual std::string complete(const ModelRequest& request) = 0;

    /// Embed texts, one vector per input
    virtual std::vector<std::vector<double>> embed(const std::string& model,
                                                   const std::vector<std::string>& texts) = 0;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;
    std::string body;
    std::string contentType;
    std::string authPreset;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

struct VectorRecord {
    std::string id;
    std::string text;
    std::vector<double> embedding;
    json metadata = json::object();
};

/**
 * Vector store: upsert embedded records, query by text
 */
class VectorStore {
public:
    virtual ~VectorStore() = default;

    /// Returns the number of records written
    virtual size_t upsert(const std::string& storeId,
                          const std::string& ns,
                          const std::vector<VectorRecord>& records) = 0;

    /// Returns an array of {"id", "score", "payload"}
    virtual json query(const std::string& storeId,
                       const std::string& ns,
                       const std::string& text,
                       int64_t topK,
                       const json& filters) = 0;
};

/**
 * Knowledge-base search
 */
class GuruClient {
public:
    virtual ~GuruClient() = default;

    /// Returns an array of result objects
    virtual json search(const std::string& space,
                        const std::string& query,
                        int64_t topK,
                        const json& filters) = 0;
};

/**
 * Runs another workflow inline and returns its result
 */
class SubWorkflowRunner {
public:
    virtual ~SubWorkflowRunner() = default;
    virtual json runWorkflow(int64_t workflowId, const json& input, bool propagateIdentity) = 0;
};

/**
 * Set of backends handed to node services. Any member may be null; a
 * service whose backend is missing fails at execute time.
 */
struct Backends {
    std::shared_ptr<ModelClient> model;
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<VectorStore> vectors;
    std::shared_ptr<GuruClient> guru;
};

} // namespace services
} // namespace weft
