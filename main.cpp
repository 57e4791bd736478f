#include "server/BeastHttpClient.hpp"
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/ServerConfig.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "runs/RunExecutor.hpp"
#include "runs/RunRegistry.hpp"
#include "services/ServiceRegistry.hpp"
#include "storage/SqliteWorkflowRepository.hpp"
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

using namespace weft;
using namespace weft::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    try {
        ServerConfig config = ServerConfig::fromArgs(std::vector<std::string>(argv + 1, argv + argc));
        if (config.helpRequested) {
            std::cout << ServerConfig::usage(argv[0]);
            return 0;
        }

        // Configure Logger
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }

        std::cout << "=== weft ===" << std::endl;
        std::cout << std::endl;

        const auto& serviceRegistry = services::ServiceRegistry::instance();
        LOG_INFO("Registered " + std::to_string(serviceRegistry.describe().size()) + " node types");

        auto repository = std::make_shared<storage::SqliteWorkflowRepository>(config.dbPath);

        auto& runRegistry = runs::RunRegistry::instance();
        runRegistry.configure(config.registryOptions());
        runRegistry.start(config.evictionInterval);

        services::Backends backends;
        backends.http = std::make_shared<BeastHttpClient>();

        runs::RunExecutor executor(runRegistry, serviceRegistry, backends, config.executorOptions());
        executor.setWorkflowSource(repository);

        RequestHandler handler(repository, serviceRegistry, runRegistry, executor);

        net::io_context ioc{static_cast<int>(config.httpThreads)};

        HttpServer server(ioc, config.address, config.port,
                          SessionContext{handler, runRegistry, config.heartbeat});
        server.run();

        shutdown_handler = [&]() {
            LOG_INFO("Shutting down...");
            server.stop();
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /api/health                   - Health check" << std::endl;
        std::cout << "  GET  /api/node-types               - Node types and their metadata" << std::endl;
        std::cout << "  GET  /api/workflows                - List workflows" << std::endl;
        std::cout << "  POST /api/workflows                - Create a workflow" << std::endl;
        std::cout << "  GET  /api/workflows/:id            - Workflow with nodes and edges" << std::endl;
        std::cout << "  POST /api/workflows/:id/validate   - Validate the DAG" << std::endl;
        std::cout << "  POST /api/workflows/:id/plan       - Plan node shapes" << std::endl;
        std::cout << "  GET  /api/workflows/:id/available  - Available data per node" << std::endl;
        std::cout << "  POST /api/workflows/:id/run        - Start a run" << std::endl;
        std::cout << "  GET  /api/runs/:id                 - Run state" << std::endl;
        std::cout << "  GET  /api/runs/:id/events          - Run events (SSE)" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        // SSE streams block their thread, so the loop runs on several
        std::vector<std::thread> threads;
        for (size_t i = 1; i < config.httpThreads; ++i) {
            threads.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
        for (auto& t : threads) {
            t.join();
        }

        executor.shutdown();
        runRegistry.stop();

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Run with --help for usage." << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
