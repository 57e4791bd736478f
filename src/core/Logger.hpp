#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <optional>
#include <unordered_map>

namespace weft {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Process-wide logger (singleton)
 *
 * Lines look like: [2024-05-01 10:00:00.123] [INFO ] message
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /**
     * HTTP traffic with request id correlation: logRequest returns the id
     * that logResponse reports along with the elapsed time
     */
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void logResponse(uint64_t requestId, int statusCode, const std::string& body, size_t bodySize = 0);

    // Helpers
    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string formatSize(size_t bytes);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();
    std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;

    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) weft::Logger::instance().debug(msg)
#define LOG_INFO(msg) weft::Logger::instance().info(msg)
#define LOG_WARN(msg) weft::Logger::instance().warn(msg)
#define LOG_ERROR(msg) weft::Logger::instance().error(msg)

} // namespace weft
