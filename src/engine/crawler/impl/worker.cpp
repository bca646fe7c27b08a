#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/link_extractor.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Strider {
namespace Engine {

using namespace Strider::Utils::Text;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;

bool is_html(const std::string& content_type) {
    return content_type.empty() || icontains(content_type, "html");
}
}  // namespace

bool Crawler::should_stop_worker() {
    return done_ || coordinator_->cancelled() || coordinator_->drained();
}

boost::asio::awaitable<void> Crawler::worker_loop() {
    try {
        auto                      client = create_client();
        boost::asio::steady_timer timer(ioc_);

        while (!done_) {
            auto entry = coordinator_->next();

            if (!entry) {
                if (should_stop_worker()) {
                    if (!done_)
                        trigger_done();
                    break;
                }
                timer.expires_after(std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));
                boost::system::error_code ec;
                co_await                  timer.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            FetchResult result = co_await fetch_page(*client, *entry);
            coordinator_->submit(*entry, result);
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }

    if (--live_workers_ == 0 && !done_) {
        Logger::error("All workers stopped with work outstanding. Aborting crawl.");
        coordinator_->abort();
        trigger_done();
    }
}

boost::asio::awaitable<FetchResult> Crawler::fetch_page(HttpClient&          client,
                                                        const FrontierEntry& entry) {
    FetchResult result;
    Response    res;

    for (int attempt = 0; attempt <= max_retries_; ++attempt) {
        Request request;
        request.url              = entry.url;
        request.timeout_seconds  = timeout_seconds_;
        request.user_agent       = next_user_agent();
        request.follow_redirects = follow_redirects_;

        std::string log_msg =
            "Fetching: " + entry.url + " (Depth " + std::to_string(entry.depth) + ")";
        if (attempt > 0)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        Logger::info(log_msg);

        auto start = std::chrono::steady_clock::now();
        try {
            res = co_await client.get(request);
        } catch (const std::exception& e) {
            res            = Response{};
            res.error      = e.what();
            res.error_type = ErrorType::Network;
        }
        result.elapsed_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - start)
                                .count();

        if (res.success || attempt == max_retries_ || coordinator_->cancelled())
            break;

        boost::asio::steady_timer timer(ioc_);
        timer.expires_after(get_backoff_time(attempt + 1));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }

    if (!res.success) {
        result.outcome = res.error_type == ErrorType::Timeout ? FetchOutcome::Timeout
                                                              : FetchOutcome::TransportError;
        result.error   = res.error_type == ErrorType::Timeout && res.error.empty() ? "timeout"
                                                                                    : res.error;
        Logger::error("Failed: " + entry.url + " (" + result.error + ")");
        co_return result;
    }

    result.outcome = FetchOutcome::Success;
    result.status  = res.status_code;

    if (res.status_code < 200 || res.status_code >= 300) {
        Logger::warn("HTTP " + std::to_string(res.status_code) + ": " + entry.url);
        co_return result;
    }

    Logger::success("Fetched: " + entry.url + " (" + std::to_string(res.status_code) + ", "
                    + std::to_string(static_cast<long>(result.elapsed_ms)) + " ms)");
    process_body(entry, res, result);
    co_return result;
}

void Crawler::process_body(const FrontierEntry& entry, const Response& res, FetchResult& result) {
    if (!keyword_.empty() && icontains(res.body, keyword_)) {
        result.keyword_hit = true;
        Logger::success("Keyword '" + keyword_ + "' found: " + entry.url);
    }

    if (save_pages_)
        save_page(entry.url, res.body);

    if (!search_links_ || entry.depth >= max_depth_ || !is_html(res.content_type))
        return;

    std::string base_url = !res.effective_url.empty() ? res.effective_url : entry.url;
    for (const auto& link : LinkExtractor::extract(res.body)) {
        std::string absolute_link = Utils::Url::resolve(base_url, link);
        if (absolute_link.empty())
            continue;
        result.links.push_back(std::move(absolute_link));
    }
    Logger::debug("Links on " + entry.url + ": " + std::to_string(result.links.size()));
}

}  // namespace Engine
}  // namespace Strider
