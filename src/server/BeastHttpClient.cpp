#include "server/BeastHttpClient.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "services/resources/ResourceServices.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace weft {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

ParsedUrl parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw ValidationError("url", "missing scheme: " + url);
    }

    ParsedUrl parsed;
    parsed.scheme = url.substr(0, schemeEnd);
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw ValidationError("url", "unsupported scheme: " + parsed.scheme);
    }

    std::string rest = url.substr(schemeEnd + 3);
    auto pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);
    parsed.target = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
    if (parsed.target[0] == '?') {
        parsed.target = "/" + parsed.target;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }
    if (parsed.host.empty()) {
        throw ValidationError("url", "missing host: " + url);
    }
    if (parsed.port.empty() || parsed.port.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("url", "invalid port: " + url);
    }
    return parsed;
}

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds timeout)
    : m_timeout(timeout) {}

void BeastHttpClient::setAuthPreset(const std::string& name,
                                    std::map<std::string, std::string> headers) {
    m_authPresets[name] = std::move(headers);
}

services::HttpResponse BeastHttpClient::send(const services::HttpRequest& request) {
    ParsedUrl url = parseUrl(request.url);
    if (url.scheme == "https") {
        throw NodeExecutionError("https is not supported by this client: " + request.url);
    }

    std::string target = url.target;
    if (!request.query.empty()) {
        std::string query;
        for (const auto& [key, value] : request.query) {
            if (!query.empty()) query += "&";
            query += services::urlEncode(key) + "=" + services::urlEncode(value);
        }
        target += (target.find('?') == std::string::npos ? "?" : "&") + query;
    }

    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw NodeExecutionError("Unknown HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, "weft/1.0");
    if (!request.authPreset.empty()) {
        auto preset = m_authPresets.find(request.authPreset);
        if (preset == m_authPresets.end()) {
            throw NodeExecutionError("Unknown auth preset: " + request.authPreset);
        }
        for (const auto& [name, value] : preset->second) {
            req.set(name, value);
        }
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty() || verb == http::verb::post || verb == http::verb::put) {
        if (!request.contentType.empty()) {
            req.set(http::field::content_type, request.contentType);
        }
        req.body() = request.body;
    }
    req.prepare_payload();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw NodeExecutionError("Cannot resolve " + url.host + ": " + ec.message());
    }

    stream.expires_after(m_timeout);
    stream.connect(endpoints, ec);
    if (ec) {
        throw NodeExecutionError("Cannot connect to " + url.host + ":" + url.port + ": " + ec.message());
    }

    http::write(stream, req, ec);
    if (ec) {
        throw NodeExecutionError("HTTP write failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        throw NodeExecutionError("HTTP read failed: " + ec.message());
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    LOG_DEBUG(request.method + " " + request.url + " -> " + std::to_string(res.result_int()));
    return services::HttpResponse{static_cast<int>(res.result_int()), res.body()};
}

} // namespace server
} // namespace weft
