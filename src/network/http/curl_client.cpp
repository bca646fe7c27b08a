#include "curl_client.hpp"
#include <string_view>
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Strider {
namespace Network {
namespace Http {

namespace net = boost::asio;

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string header(buffer, size * nitems);
    if (!Utils::Text::starts_with(Utils::Text::to_lower(header), std::string(CONTENT_TYPE_HEADER)))
        return size * nitems;

    // Redirect hops each send their own content-type; the last one wins.
    *ctx->content_type = Utils::Text::trim(header.substr(CONTENT_TYPE_HEADER.size()));
    return size * nitems;
}

CurlClient::CurlClient(net::any_io_executor blocking_executor)
    : executor_(std::move(blocking_executor)), curl_(curl_easy_init()) {}

void CurlClient::setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(Core::Constants::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(req.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl,
                     CURLOPT_USERAGENT,
                     req.user_agent.empty() ? Core::Constants::USER_AGENT : req.user_agent.c_str());
}

Response CurlClient::perform(const Request& request) {
    Response response;
    response.effective_url = request.url;

    if (!curl_) {
        response.error      = "Failed to initialize CURL handle";
        response.error_type = ErrorType::Network;
        return response;
    }

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type};

    setup_curl_options(curl_.get(), request, ctx);
    CURLcode res = curl_easy_perform(curl_.get());

    long response_code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* effective_url = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url)
        response.effective_url = effective_url;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.status_code  = response_code;
    response.content_type = std::move(content_type);
    response.body         = std::move(body);
    response.success      = true;
    response.error_type   = ErrorType::None;
    return response;
}

net::awaitable<Response> CurlClient::get(const Request& request) {
    co_return co_await net::co_spawn(
        executor_,
        [this, request]() -> net::awaitable<Response> { co_return perform(request); },
        net::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Strider
