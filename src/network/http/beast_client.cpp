#include "beast_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Strider {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

template <class Body>
void fill_response(Response& response, std::string& location, http::response<Body>& res) {
    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = true;
    response.error_type  = ErrorType::None;
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc             = res.find(http::field::location);
    if (loc != res.end())
        location = std::string(loc->value());
}

Response error_response(const std::string& url, const std::string& error, ErrorType type) {
    Response response;
    response.effective_url = url;
    response.status_code   = static_cast<long>(HTTPCode::NetworkError);
    response.error         = error;
    response.success       = false;
    response.error_type    = type;
    return response;
}

}  // namespace

BeastClient::BeastClient(net::io_context& /*ioc*/) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

bool BeastClient::parse_target(const std::string& url, Target& target) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https"))
        return false;

    target.is_ssl = (parsed.scheme == "https");
    target.host   = parsed.host;
    if (target.host.size() > 2 && target.host.front() == '[' && target.host.back() == ']')
        target.host = target.host.substr(1, target.host.size() - 2);
    target.port        = parsed.port.empty() ? (target.is_ssl ? "443" : "80") : parsed.port;
    target.host_header = parsed.port.empty() ? parsed.host : parsed.host + ":" + parsed.port;
    target.path        = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target.path += "?" + parsed.query;
    return true;
}

net::awaitable<Response> BeastClient::get(const Request& request) {
    const auto deadline = Clock::now() + std::chrono::seconds(request.timeout_seconds);
    std::string url      = request.url;

    for (int hop = 0;; ++hop) {
        Target target;
        if (!parse_target(url, target))
            co_return error_response(url, "Invalid URL", ErrorType::Network);

        Response    response;
        std::string location;
        try {
            if (target.is_ssl)
                response = co_await perform_https_request(target, request, deadline, location);
            else
                response = co_await perform_http_request(target, request, deadline, location);
        } catch (const boost::system::system_error& e) {
            if (e.code() == beast::error::timeout)
                co_return error_response(url, "Timed out", ErrorType::Timeout);
            co_return error_response(url, e.code().message(), ErrorType::Network);
        } catch (const std::exception& e) {
            co_return error_response(url, e.what(), ErrorType::Network);
        }

        response.effective_url = url;

        if (!request.follow_redirects || !is_redirect(response.status_code) || location.empty())
            co_return response;

        if (hop >= Core::Constants::MAX_REDIRECTS)
            co_return error_response(url, "Too many redirects", ErrorType::Network);

        std::string next = Utils::Url::resolve(url, location);
        if (next.empty())
            co_return response;
        Core::Logger::debug("Redirect " + url + " -> " + next);
        url = next;
    }
}

// Name resolution runs outside the stream, so the stream deadline does not cover it.
net::awaitable<tcp::resolver::results_type> BeastClient::resolve(const Target&     target,
                                                                 Clock::time_point deadline) {
    if (Clock::now() >= deadline)
        throw boost::system::system_error(beast::error::timeout);

    auto executor = co_await net::this_coro::executor;
    auto resolver = std::make_shared<tcp::resolver>(executor);
    auto expired  = std::make_shared<std::atomic<bool>>(false);

    net::steady_timer timer(executor, deadline);
    timer.async_wait([resolver, expired](const boost::system::error_code& ec) {
        if (ec)
            return;
        expired->store(true);
        resolver->cancel();
    });

    boost::system::error_code ec;
    auto                      results = co_await resolver->async_resolve(
        target.host, target.port, net::redirect_error(net::use_awaitable, ec));
    timer.cancel();

    if (expired->load())
        throw boost::system::system_error(beast::error::timeout);
    if (ec)
        throw boost::system::system_error(ec);
    co_return results;
}

net::awaitable<Response> BeastClient::perform_http_request(const Target&     target,
                                                           const Request&    request,
                                                           Clock::time_point deadline,
                                                           std::string&      location) {
    Response response;

    auto results = co_await resolve(target, deadline);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, net::use_awaitable);

    http::request<http::string_body> req{http::verb::get, target.path, 11};
    req.set(http::field::host, target.host_header);
    req.set(http::field::user_agent,
            request.user_agent.empty() ? Core::Constants::USER_AGENT : request.user_agent);
    req.set(http::field::accept, "*/*");

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);
    fill_response(response, location, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Target&     target,
                                                            const Request&    request,
                                                            Clock::time_point deadline,
                                                            std::string&      location) {
    Response response;

    auto results = co_await resolve(target, deadline);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_at(deadline);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    http::request<http::string_body> req{http::verb::get, target.path, 11};
    req.set(http::field::host, target.host_header);
    req.set(http::field::user_agent,
            request.user_agent.empty() ? Core::Constants::USER_AGENT : request.user_agent);
    req.set(http::field::accept, "*/*");

    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(ssl_stream, b, res, net::use_awaitable);
    fill_response(response, location, res);

    // Servers routinely drop the connection without close_notify.
    beast::error_code ec;
    beast::get_lowest_layer(ssl_stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Strider
