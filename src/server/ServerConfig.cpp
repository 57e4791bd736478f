#include "server/ServerConfig.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <map>
#include <sstream>

namespace weft {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

uint64_t parseUnsigned(const std::string& key, const std::string& value, uint64_t min, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError("Invalid value for " + key + ": '" + value +
                                 "' (expected a non-negative integer)");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Invalid value for " + key + ": '" + value + "' (out of range)");
    }
    if (parsed < min || parsed > max) {
        throw ConfigurationError("Invalid value for " + key + ": " + value + " (expected " +
                                 std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return parsed;
}

// Command-line flag -> file key
const std::map<std::string, std::string>& flagKeys() {
    static const std::map<std::string, std::string> keys = {
        {"--port", "port"},
        {"-p", "port"},
        {"--address", "address"},
        {"-a", "address"},
        {"--db", "db_path"},
        {"--log-level", "log_level"},
        {"-l", "log_level"},
        {"--log-file", "log_file"},
        {"--run-ttl", "run_ttl_seconds"},
        {"--eviction-interval", "eviction_interval_seconds"},
        {"--threads", "http_threads"},
    };
    return keys;
}

constexpr uint64_t kMaxSeconds = 7 * 24 * 3600;

} // anonymous namespace

void ServerConfig::set(const std::string& key, const std::string& value) {
    if (key == "address") {
        if (value.empty()) {
            throw ConfigurationError("Invalid value for address: must not be empty");
        }
        address = value;
    } else if (key == "port") {
        port = static_cast<unsigned short>(parseUnsigned(key, value, 1, 65535));
    } else if (key == "db_path") {
        if (value.empty()) {
            throw ConfigurationError("Invalid value for db_path: must not be empty");
        }
        dbPath = value;
    } else if (key == "log_level") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            throw ConfigurationError("Invalid value for log_level: '" + value +
                                     "' (expected debug, info, warn or error)");
        }
        logLevel = *level;
    } else if (key == "log_file") {
        logFile = value;
    } else if (key == "run_ttl_seconds") {
        runTtl = std::chrono::seconds(parseUnsigned(key, value, 1, kMaxSeconds));
    } else if (key == "eviction_interval_seconds") {
        evictionInterval = std::chrono::seconds(parseUnsigned(key, value, 1, kMaxSeconds));
    } else if (key == "event_channel_capacity") {
        eventChannelCapacity = parseUnsigned(key, value, 1, 1 << 20);
    } else if (key == "expression_timeout_ms") {
        expressionTimeout = std::chrono::milliseconds(parseUnsigned(key, value, 1, 60000));
    } else if (key == "heartbeat_seconds") {
        heartbeat = std::chrono::seconds(parseUnsigned(key, value, 1, 3600));
    } else if (key == "http_threads") {
        httpThreads = parseUnsigned(key, value, 1, 256);
    } else if (key == "worker_threads") {
        workerThreads = parseUnsigned(key, value, 1, 256);
    } else if (key == "max_subworkflow_depth") {
        maxSubWorkflowDepth = parseUnsigned(key, value, 0, 64);
    } else {
        throw ConfigurationError("Unknown configuration key: " + key);
    }
}

void ServerConfig::loadFile(const std::string& path) {
    std::string filePath = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + filePath);
    }

    std::string line;
    size_t lineNo = 0;
    size_t applied = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(filePath + ":" + std::to_string(lineNo) +
                                     ": expected key=value");
        }
        set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        ++applied;
    }
    LOG_DEBUG("Loaded " + std::to_string(applied) + " settings from " + filePath);
}

ServerConfig ServerConfig::fromArgs(const std::vector<std::string>& args) {
    ServerConfig config;

    // The file goes first so that flags override it
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                throw ConfigurationError("Missing value for --config");
            }
            config.loadFile(args[++i]);
        } else if (!arg.empty() && arg[0] == '@') {
            config.loadFile(arg);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.helpRequested = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (!arg.empty() && arg[0] == '@') {
            continue;
        }

        auto it = flagKeys().find(arg);
        if (it == flagKeys().end()) {
            throw ConfigurationError("Unknown option: " + arg);
        }
        if (i + 1 >= args.size()) {
            throw ConfigurationError("Missing value for " + arg);
        }
        config.set(it->second, args[++i]);
    }
    return config;
}

std::string ServerConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --config FILE, @FILE      Settings file (key=value lines)\n"
        << "  -p, --port PORT           Port to listen on (default: 8080)\n"
        << "  -a, --address ADDR        Address to bind to (default: 0.0.0.0)\n"
        << "  --db PATH                 Workflow SQLite database (default: weft.db)\n"
        << "  -l, --log-level LVL       Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH           Also write logs to PATH\n"
        << "  --run-ttl SECONDS         Lifetime of run records (default: 900)\n"
        << "  --eviction-interval SECS  Run eviction period (default: 60)\n"
        << "  --threads N               HTTP threads (default: 4)\n"
        << "  -h, --help                Show this help\n";
    return oss.str();
}

runs::RunRegistryOptions ServerConfig::registryOptions() const {
    runs::RunRegistryOptions options;
    options.ttl = runTtl;
    options.channelCapacity = eventChannelCapacity;
    return options;
}

runs::RunExecutorOptions ServerConfig::executorOptions() const {
    runs::RunExecutorOptions options;
    options.expressionTimeout = expressionTimeout;
    options.maxSubWorkflowDepth = maxSubWorkflowDepth;
    options.workerThreads = workerThreads;
    return options;
}

} // namespace server
} // namespace weft
