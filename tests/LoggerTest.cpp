#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/Logger.hpp"
#include <sstream>

using namespace weft;
using Catch::Matchers::ContainsSubstring;

namespace {

/**
 * Redirects the logger into a buffer for the scope of a test
 */
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level) : m_previous(Logger::instance().level()) {
        Logger::instance().setOutputStream(&m_buffer);
        Logger::instance().setLevel(level);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(m_previous);
    }

    std::string text() const { return m_buffer.str(); }

private:
    std::ostringstream m_buffer;
    LogLevel m_previous;
};

} // anonymous namespace

TEST_CASE("Messages below the level are dropped", "[Logger]") {
    CapturedLog log(LogLevel::WARN);

    LOG_INFO("run started");
    LOG_WARN("run dropped 3 events");

    REQUIRE_THAT(log.text(), !ContainsSubstring("run started"));
    REQUIRE_THAT(log.text(), ContainsSubstring("[WARN ] run dropped 3 events"));
}

TEST_CASE("Requests and responses share an id", "[Logger]") {
    CapturedLog log(LogLevel::INFO);

    uint64_t id = Logger::instance().logRequest("GET", "/api/health");
    Logger::instance().logResponse(id, 200, "{}", 2048);

    std::string tag = "[REQ-" + std::to_string(id) + "]";
    REQUIRE_THAT(log.text(), ContainsSubstring(tag + " GET /api/health"));
    REQUIRE_THAT(log.text(), ContainsSubstring(tag + " RESPONSE 200 | Size: 2.0 KB"));
}

TEST_CASE("Level names and sizes", "[Logger]") {
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE_FALSE(Logger::parseLevel("verbose").has_value());

    REQUIRE(Logger::formatSize(512) == "512 B");
    REQUIRE(Logger::formatSize(3 * 1024 * 1024) == "3.00 MB");
}
