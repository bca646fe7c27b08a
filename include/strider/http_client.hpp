#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace Strider {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout };

enum class HTTPCode { Ok = 200, NetworkError = 0, NotFound = 404 };

}  // namespace Http
}  // namespace Network
}  // namespace Strider

namespace Strider {

struct Request {
    std::string url;
    int         timeout_seconds  = 10;
    std::string user_agent;
    bool        follow_redirects = true;
};

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;
};

namespace Network {
namespace Http {

// Transport used by the crawl workers. One instance per worker; never shared
// between concurrent fetches.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual boost::asio::awaitable<Response> get(const Request& request) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Strider
