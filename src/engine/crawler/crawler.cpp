#include "crawler.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../network/http/curl_client.hpp"

namespace Strider {
namespace Engine {

Crawler::Crawler(const CrawlerConfig& config, ClientFactory client_factory)
    : seeds_(config.seeds),
      max_depth_(config.max_depth),
      percentage_(config.percentage),
      sample_seed_(config.sample_seed),
      exfiltrate_(config.exfiltrate),
      num_threads_(config.threads),
      num_connections_(config.connections),
      num_worker_threads_(config.worker_threads),
      timeout_seconds_(config.timeout_seconds),
      follow_redirects_(config.follow_redirects),
      search_links_(config.search_links),
      user_agents_(config.user_agents),
      backend_(config.backend),
      max_retries_(config.max_retries),
      output_dir_(config.output_dir),
      report_path_(config.report_path),
      resume_(config.resume),
      checkpoint_interval_(config.checkpoint_interval),
      keyword_(config.keyword),
      save_pages_(config.save_pages),
      client_factory_(std::move(client_factory)),
      worker_pool_(static_cast<size_t>(std::max(1, config.worker_threads))),
      fingerprint_(Fingerprint::make(config.seeds, config.max_depth, config.percentage)) {
    if (user_agents_.empty())
        user_agents_.push_back(Constants::USER_AGENT);
}

std::unique_ptr<HttpClient> Crawler::create_client() {
    if (client_factory_)
        return client_factory_(ioc_);
    if (backend_ == "curl")
        return std::make_unique<CurlClient>(blocking_pool_->get_executor());
    return std::make_unique<BeastClient>(ioc_);
}

const std::string& Crawler::next_user_agent() {
    return user_agents_[user_agent_counter_++ % user_agents_.size()];
}

}  // namespace Engine
}  // namespace Strider
