#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "core/Logger.hpp"
#include "core/TimeUtil.hpp"
#include "runs/RunStream.hpp"

namespace weft {
namespace server {

namespace {

void setCorsHeaders(http::response<http::string_body>& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

http::response<http::string_body> makeJsonResponse(
    http::status status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "weft/1.0");
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    setCorsHeaders(res);
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body(), res.body().size());

    return res;
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, SessionContext context)
    : m_stream(std::move(socket))
    , m_context(context)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(10 * 1024 * 1024); // 10 MB
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    auto response = handleRequest(m_parser->release());

    // In SSE mode the stream already answered and closed the connection
    if (!m_sseMode) {
        sendResponse(std::move(response));
    }
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());

    uint64_t requestId = logger.logRequest(method, target, req.body());

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "weft/1.0");
        setCorsHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 200, "", 0);
        return res;
    }

    // GET /api/runs/:id/events
    if (auto runId = RequestHandler::eventsTarget(method, target)) {
        if (m_context.runs.exists(*runId)) {
            handleSseRunStream(*runId);
            logger.logResponse(requestId, 200, "", 0);
            return http::response<http::string_body>{};
        }
        return makeJsonResponse(
            http::status::not_found,
            json{{"status", "error"}, {"message", "Run not found: " + *runId}},
            req.version(),
            req.keep_alive(),
            requestId);
    }

    auto [code, body] = m_context.handler.route(method, target, req.body());
    return makeJsonResponse(
        static_cast<http::status>(code),
        body,
        req.version(),
        req.keep_alive(),
        requestId);
}

// =============================================================================
// SSE Streaming of Run Events
// =============================================================================

void HttpSession::handleSseRunStream(const std::string& runId) {
    m_sseMode = true;

    // Disable timeout for streaming
    m_stream.expires_never();

    std::string headers =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        "Access-Control-Allow-Headers: Content-Type\r\n"
        "\r\n";

    beast::error_code ec;
    net::write(m_stream.socket(), net::buffer(headers), ec);
    if (ec) {
        LOG_ERROR("SSE header write error: " + ec.message());
        m_sseMode = false;
        return;
    }

    class SessionSink : public runs::RunStreamSink {
    public:
        explicit SessionSink(HttpSession& session) : m_session(session) {}

        bool onEvent(const runs::RunEvent& event) override {
            return m_session.sendSseEvent("log", event.toJson().dump());
        }

        bool onHeartbeat() override {
            json beat = {{"ts", formatIsoTimestamp(Clock::now())}};
            return m_session.sendSseEvent("heartbeat", beat.dump());
        }

        void onDone(const runs::RunSnapshot& snapshot) override {
            json done = {
                {"run_id", snapshot.runId},
                {"status", runs::toString(snapshot.status)},
                {"finished_at", snapshot.finishedAt ? json(formatIsoTimestamp(*snapshot.finishedAt))
                                                    : json(nullptr)}
            };
            m_session.sendSseEvent("done", done.dump());
        }

        void onError(const std::string& message) override {
            m_session.sendSseEvent("error", json{{"message", message}}.dump());
        }

    private:
        HttpSession& m_session;
    };

    SessionSink sink(*this);
    auto outcome = runs::streamRun(m_context.runs, runId, sink, m_context.heartbeat);
    if (outcome == runs::StreamOutcome::Stopped) {
        LOG_DEBUG("SSE client left the stream of run " + runId);
    }

    closeSseConnection();
}

bool HttpSession::sendSseEvent(const std::string& eventType, const std::string& data) {
    if (!m_sseMode) return false;

    std::string sseMessage = "event: " + eventType + "\ndata: " + data + "\n\n";

    beast::error_code ec;
    net::write(m_stream.socket(), net::buffer(sseMessage), ec);
    if (ec) {
        LOG_WARN("SSE event write error: " + ec.message());
        return false;
    }
    return true;
}

void HttpSession::closeSseConnection() {
    doClose();
}

} // namespace server
} // namespace weft
