#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "server/ServerConfig.hpp"
#include "core/Errors.hpp"
#include <filesystem>
#include <fstream>

using namespace weft;
using namespace weft::server;
using Catch::Matchers::ContainsSubstring;

namespace {

/**
 * Settings file removed on destruction
 */
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content)
        : m_path((std::filesystem::temp_directory_path() /
                  ("weft_config_" + std::to_string(reinterpret_cast<uintptr_t>(this)) + ".conf")).string())
    {
        std::ofstream out(m_path);
        out << content;
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // anonymous namespace

TEST_CASE("Default settings", "[ServerConfig]") {
    ServerConfig config;

    REQUIRE(config.address == "0.0.0.0");
    REQUIRE(config.port == 8080);
    REQUIRE(config.dbPath == "weft.db");
    REQUIRE(config.logLevel == LogLevel::INFO);
    REQUIRE(config.runTtl == std::chrono::seconds(900));
    REQUIRE(config.eventChannelCapacity == 1024);
    REQUIRE_FALSE(config.helpRequested);
}

TEST_CASE("Settings are parsed and range checked", "[ServerConfig]") {
    ServerConfig config;

    config.set("port", "9000");
    config.set("log_level", "warning");
    config.set("run_ttl_seconds", "30");
    config.set("max_subworkflow_depth", "0");
    REQUIRE(config.port == 9000);
    REQUIRE(config.logLevel == LogLevel::WARN);
    REQUIRE(config.runTtl == std::chrono::seconds(30));
    REQUIRE(config.maxSubWorkflowDepth == 0);

    REQUIRE_THROWS_WITH(config.set("port", "0"),
                        "Invalid value for port: 0 (expected 1..65535)");
    REQUIRE_THROWS_WITH(config.set("port", "-1"),
                        "Invalid value for port: '-1' (expected a non-negative integer)");
    REQUIRE_THROWS_WITH(config.set("log_level", "loud"), ContainsSubstring("log_level"));
    REQUIRE_THROWS_WITH(config.set("address", ""),
                        "Invalid value for address: must not be empty");
    REQUIRE_THROWS_WITH(config.set("colour", "blue"), "Unknown configuration key: colour");

    // Failed sets leave the value alone
    REQUIRE(config.port == 9000);
}

TEST_CASE("Settings files", "[ServerConfig]") {
    TempConfigFile file("# weft settings\n"
                        "port = 7000\n"
                        "\n"
                        "db_path=/var/lib/weft/weft.db\n"
                        "heartbeat_seconds = 5\n");

    ServerConfig config;
    config.loadFile("@" + file.path());

    REQUIRE(config.port == 7000);
    REQUIRE(config.dbPath == "/var/lib/weft/weft.db");
    REQUIRE(config.heartbeat == std::chrono::seconds(5));

    REQUIRE_THROWS_AS(config.loadFile("/nonexistent/weft.conf"), ConfigurationError);

    TempConfigFile broken("port 7000\n");
    REQUIRE_THROWS_WITH(config.loadFile(broken.path()), broken.path() + ":1: expected key=value");
}

TEST_CASE("Flags override the settings file", "[ServerConfig]") {
    TempConfigFile file("port = 7000\nhttp_threads = 8\n");

    auto config = ServerConfig::fromArgs({"-p", "9100", "--config", file.path(), "-l", "debug"});

    REQUIRE(config.port == 9100);
    REQUIRE(config.httpThreads == 8);
    REQUIRE(config.logLevel == LogLevel::DEBUG);

    auto runs = config.registryOptions();
    REQUIRE(runs.ttl == config.runTtl);
    REQUIRE(runs.channelCapacity == config.eventChannelCapacity);
    REQUIRE(config.executorOptions().workerThreads == config.workerThreads);
}

TEST_CASE("Bad command lines", "[ServerConfig]") {
    REQUIRE(ServerConfig::fromArgs({"--help"}).helpRequested);
    REQUIRE_THROWS_WITH(ServerConfig::fromArgs({"--verbose"}), "Unknown option: --verbose");
    REQUIRE_THROWS_WITH(ServerConfig::fromArgs({"--port"}), "Missing value for --port");
    REQUIRE_THROWS_WITH(ServerConfig::fromArgs({"--config"}), "Missing value for --config");
    REQUIRE_THROWS_AS(ServerConfig::fromArgs({"--run-ttl", "0"}), ConfigurationError);

    REQUIRE_THAT(ServerConfig::usage("weft_server"), ContainsSubstring("Usage: weft_server"));
}
