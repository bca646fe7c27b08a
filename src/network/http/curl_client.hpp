#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <curl/curl.h>
#include <memory>
#include <string>
#include "strider/http_client.hpp"

namespace Strider {
namespace Network {
namespace Http {

// libcurl easy-handle client. curl_easy_perform blocks, so each fetch runs on
// `blocking_executor` and the calling coroutine awaits its completion.
// curl_global_init must have been called before the first instance is created.
class CurlClient : public HttpClient {
public:
    explicit CurlClient(boost::asio::any_io_executor blocking_executor);
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    boost::asio::awaitable<Response> get(const Request& request) override;

    Response perform(const Request& request);

private:
    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    boost::asio::any_io_executor       executor_;
    std::unique_ptr<CURL, CurlDeleter> curl_;

    void setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Strider
