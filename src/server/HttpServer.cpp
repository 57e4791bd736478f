#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

namespace weft {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       SessionContext context)
    : m_ioc(ioc)
    , m_acceptor(net::make_strand(ioc))
    , m_context(context)
    , m_running(false)
{
    beast::error_code ec;

    auto ip = net::ip::make_address(address, ec);
    if (ec) {
        throw ConfigurationError("Invalid address " + address + ": " + ec.message());
    }
    auto endpoint = tcp::endpoint(ip, port);

    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw WeftError("Failed to open acceptor: " + ec.message());
    }

    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw WeftError("Failed to set reuse_address: " + ec.message());
    }

    m_acceptor.bind(endpoint, ec);
    if (ec) {
        throw WeftError("Failed to bind: " + ec.message());
    }

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw WeftError("Failed to listen: " + ec.message());
    }

    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(this->port()));
}

unsigned short HttpServer::port() const {
    return m_acceptor.local_endpoint().port();
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;
    beast::error_code ec;
    m_acceptor.close(ec);
    if (ec) {
        LOG_WARN("Failed to close acceptor: " + ec.message());
    }
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), m_context)->run();
            } else if (m_running) {
                LOG_WARN("Accept error: " + ec.message());
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace weft
