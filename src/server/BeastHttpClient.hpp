#pragma once

#include "services/Backends.hpp"
#include <chrono>
#include <map>
#include <string>

namespace weft {
namespace server {

/**
 * Parts of an absolute http(s) URL
 */
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // path and query, at least "/"
};

/// Split an absolute URL. Throws ValidationError("url", ...) when malformed.
ParsedUrl parseUrl(const std::string& url);

/**
 * Synchronous HttpClient over Boost.Beast, one connection per request
 *
 * Plain http only: https URLs fail with NodeExecutionError. auth_preset
 * names map to extra headers configured with setAuthPreset().
 */
class BeastHttpClient : public services::HttpClient {
public:
    explicit BeastHttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30));

    void setAuthPreset(const std::string& name, std::map<std::string, std::string> headers);

    services::HttpResponse send(const services::HttpRequest& request) override;

private:
    std::chrono::milliseconds m_timeout;
    std::map<std::string, std::map<std::string, std::string>> m_authPresets;
};

} // namespace server
} // namespace weft
