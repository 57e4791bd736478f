#pragma once

#include "core/Logger.hpp"
#include "runs/RunExecutor.hpp"
#include "runs/RunRegistry.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace weft {
namespace server {

/**
 * Server settings, layered: defaults, then a key=value file, then flags
 *
 * File format: one `key = value` per line, `#` starts a comment line.
 * Keys: address, port, db_path, log_level, log_file, run_ttl_seconds,
 * eviction_interval_seconds, event_channel_capacity, expression_timeout_ms,
 * heartbeat_seconds, http_threads, worker_threads, max_subworkflow_depth.
 *
 * Usage:
 *   auto config = ServerConfig::fromArgs({"--config", "@weft.conf", "--port", "9000"});
 *   if (config.helpRequested) { std::cout << ServerConfig::usage("weft_server"); }
 */
struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    std::string dbPath = "weft.db";
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::chrono::seconds runTtl{900};
    std::chrono::seconds evictionInterval{60};
    size_t eventChannelCapacity = 1024;
    std::chrono::milliseconds expressionTimeout{100};
    std::chrono::seconds heartbeat{15};
    size_t httpThreads = 4;
    size_t workerThreads = 2;
    size_t maxSubWorkflowDepth = 4;
    bool helpRequested = false;

    /**
     * Apply one setting by its file key. Throws ConfigurationError on an
     * unknown key or an invalid value.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * Apply every setting of a key=value file ("@path" accepted)
     */
    void loadFile(const std::string& path);

    /**
     * Defaults, then the --config file if any, then the other flags
     */
    static ServerConfig fromArgs(const std::vector<std::string>& args);

    static std::string usage(const std::string& program);

    runs::RunRegistryOptions registryOptions() const;
    runs::RunExecutorOptions executorOptions() const;
};

} // namespace server
} // namespace weft
