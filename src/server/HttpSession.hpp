#pragma once

#include "server/HttpServer.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <string>

namespace weft {
namespace server {

/**
 * HTTP session - handles one client connection
 *
 * JSON requests go through RequestHandler::route(). GET
 * /api/runs/:id/events switches the connection to a server-sent event
 * stream that ends (and closes) once the run is done.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, SessionContext context);

    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);

    // SSE streaming of run events
    void handleSseRunStream(const std::string& runId);
    bool sendSseEvent(const std::string& eventType, const std::string& data);
    void closeSseConnection();

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    SessionContext m_context;
    bool m_sseMode = false;  // True when handling SSE stream
};

} // namespace server
} // namespace weft
