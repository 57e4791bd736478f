#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace weft {
namespace runs { class RunRegistry; }

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * What every session needs besides its socket
 */
struct SessionContext {
    RequestHandler& handler;
    runs::RunRegistry& runs;
    std::chrono::milliseconds heartbeat;
};

/**
 * HTTP server based on Boost.Beast
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               SessionContext context);

    void run();
    void stop();

    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    SessionContext m_context;
    bool m_running;
};

} // namespace server
} // namespace weft
