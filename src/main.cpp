#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include "strider/errors.hpp"
#include "core/config/config.hpp"
#include "core/config/seeds.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"

namespace {

constexpr int EXIT_CONFIG      = 2;
constexpr int EXIT_SNAPSHOT    = 3;
constexpr int EXIT_INTERRUPTED = 130;

Strider::Engine::CrawlerConfig to_crawler_config(const Strider::Core::Config& config,
                                                 std::vector<std::string>     seeds) {
    Strider::Engine::CrawlerConfig crawler_config;
    crawler_config.seeds               = std::move(seeds);
    crawler_config.max_depth           = config.depth;
    crawler_config.percentage          = config.percentage;
    crawler_config.sample_seed         = config.sample_seed;
    crawler_config.exfiltrate          = config.exfiltrate;
    crawler_config.threads             = config.threads;
    crawler_config.connections         = config.connections;
    crawler_config.worker_threads      = config.worker_threads;
    crawler_config.timeout_seconds     = config.timeout;
    crawler_config.follow_redirects    = config.follow_redirects;
    crawler_config.search_links        = config.search_links;
    crawler_config.user_agents         = config.effective_user_agents();
    crawler_config.backend             = config.backend;
    crawler_config.max_retries         = config.max_retries;
    crawler_config.output_dir          = config.output_dir;
    crawler_config.report_path         = config.report_path();
    crawler_config.resume              = config.resume;
    crawler_config.checkpoint_interval = config.checkpoint_interval;
    crawler_config.keyword             = config.keyword;
    crawler_config.save_pages          = config.save_pages;
    return crawler_config;
}

void print_summary(const Strider::Engine::CrawlSummary& summary) {
    using Strider::Core::Logger;
    Logger::info(std::string("State: ") + Strider::Engine::to_string(summary.state));
    Logger::info("Pages fetched: " + std::to_string(summary.pages_fetched)
                 + ", visited: " + std::to_string(summary.visited)
                 + ", failures: " + std::to_string(summary.failures)
                 + ", pending: " + std::to_string(summary.frontier_remaining + summary.in_flight));
    if (summary.longest_path > 0 || !summary.longest_chain.empty()) {
        Logger::info("Longest path: " + std::to_string(summary.longest_path) + " hops");
        for (const auto& key : summary.longest_chain)
            Logger::info("  " + key);
    }
}

int run_crawler(const Strider::Core::Config& config) {
    std::vector<std::string> seeds = Strider::Core::SeedLoader::load(config);

    std::filesystem::create_directories(config.output_dir);
    auto log_path = std::filesystem::path(config.output_dir) / Strider::Core::Constants::LOG_FILE;
    if (!Strider::Core::Logger::set_file(log_path.string()))
        Strider::Core::Logger::warn("Cannot open log file " + log_path.string());

    bool use_curl = config.backend == "curl";
    if (use_curl)
        curl_global_init(CURL_GLOBAL_ALL);

    Strider::Engine::CrawlSummary summary;
    {
        Strider::Engine::Crawler crawler(to_crawler_config(config, std::move(seeds)));
        summary = crawler.run();
        for (const auto& failure : crawler.coordinator()->failures())
            Strider::Core::Logger::warn("Failed: " + failure.url + " (" + failure.reason + ")");
    }

    if (use_curl)
        curl_global_cleanup();

    print_summary(summary);
    switch (summary.state) {
        case Strider::Engine::CrawlState::Completed: return 0;
        case Strider::Engine::CrawlState::Paused: return EXIT_INTERRUPTED;
        default: return 1;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Strider::Core::Config::parse(argc, argv);
        if (config.show_help)
            return 0;

        Strider::Core::Logger::set_level(Strider::Core::Logger::parse_level(config.log_level));
        return run_crawler(config);
    } catch (const Strider::ConfigError& e) {
        Strider::Core::Logger::error(e.what());
        return EXIT_CONFIG;
    } catch (const Strider::IncompatibleSnapshot& e) {
        Strider::Core::Logger::error(e.what());
        return EXIT_SNAPSHOT;
    } catch (const std::exception& e) {
        Strider::Core::Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
