#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include "strider/http_client.hpp"

namespace Strider {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    explicit BeastClient(boost::asio::io_context& ioc);
    ~BeastClient() override = default;

    boost::asio::awaitable<Response> get(const Request& request) override;

private:
    using Clock = std::chrono::steady_clock;

    struct Target {
        std::string host;
        std::string port;
        std::string path;
        std::string host_header;
        bool        is_ssl = false;
    };

    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    static bool parse_target(const std::string& url, Target& target);

    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
    resolve(const Target& target, Clock::time_point deadline);

    boost::asio::awaitable<Response> perform_http_request(const Target&      target,
                                                          const Request&     request,
                                                          Clock::time_point  deadline,
                                                          std::string&       location);
    boost::asio::awaitable<Response> perform_https_request(const Target&     target,
                                                           const Request&    request,
                                                           Clock::time_point deadline,
                                                           std::string&      location);
};

}  // namespace Http
}  // namespace Network
}  // namespace Strider
