#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include "strider/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../../src/storage/snapshot_store.hpp"

using namespace Strider::Engine;
using namespace Strider::Core;
using Strider::Request;
using Strider::Response;
namespace fs = std::filesystem;

namespace {

struct FakePage {
    long        status = 200;
    std::string body;
    std::string content_type = "text/html; charset=utf-8";
};

// Serves canned pages and records what was requested.
class FakeSite {
public:
    explicit FakeSite(std::map<std::string, FakePage> pages) : pages_(std::move(pages)) {
    }

    Response serve(const Request& request) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.push_back(request.url);
        }
        if (on_fetch)
            on_fetch(request.url);

        Response res;
        auto     it = pages_.find(request.url);
        if (it == pages_.end()) {
            res.error      = "Connection refused";
            res.error_type = ErrorType::Network;
            return res;
        }
        res.success       = true;
        res.effective_url = request.url;
        res.status_code   = it->second.status;
        res.content_type  = it->second.content_type;
        res.body          = it->second.body;
        return res;
    }

    std::vector<std::string> requested() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

    std::function<void(const std::string&)> on_fetch;

private:
    std::map<std::string, FakePage> pages_;
    std::vector<std::string>        requested_;
    std::mutex                      mutex_;
};

class FakeClient : public HttpClient {
public:
    explicit FakeClient(FakeSite& site) : site_(site) {
    }

    boost::asio::awaitable<Response> get(const Request& request) override {
        co_return site_.serve(request);
    }

private:
    FakeSite& site_;
};

ClientFactory fake_factory(FakeSite& site) {
    return [&site](boost::asio::io_context&) { return std::make_unique<FakeClient>(site); };
}

std::map<std::string, FakePage> cyclic_site() {
    return {
        {"http://a.test/", {200, "<a href=\"/b\">b</a><a href=\"c\">c</a>"}},
        {"http://a.test/b", {200, "<a href=\"/\">home</a> <a href=\"/c\">c</a>"}},
        {"http://a.test/c", {200, "<p>Secret plans</p><a href=\"/b\">b</a>"}},
    };
}

std::vector<std::string> visited_keys(const Coordinator& coordinator) {
    std::vector<std::string> keys;
    for (const auto& record : coordinator.visited())
        keys.push_back(record.key);
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace

class CrawlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LOG_NONE);
        fs::remove_all(out_);
        fs::create_directories(out_);
    }

    void TearDown() override {
        fs::remove_all(out_);
        Logger::set_level(LOG_ALL);
    }

    CrawlerConfig get_default_config() {
        CrawlerConfig cfg;
        cfg.seeds               = {"http://a.test/"};
        cfg.max_depth           = 2;
        cfg.threads             = 1;
        cfg.connections         = 2;
        cfg.output_dir          = out_;
        cfg.report_path         = out_ + "/report.yaml";
        cfg.checkpoint_interval = 0;
        cfg.sample_seed         = 1;
        return cfg;
    }

    std::string out_ = "test_crawler_out";
};

TEST_F(CrawlerTest, ConfigMapping) {
    auto cfg        = get_default_config();
    cfg.max_depth   = 5;
    cfg.connections = 7;
    cfg.user_agents.clear();
    Crawler crawler(cfg);

    EXPECT_EQ(crawler.max_depth_, 5);
    EXPECT_EQ(crawler.num_connections_, 7);
    ASSERT_EQ(crawler.user_agents_.size(), 1u);
    EXPECT_EQ(crawler.user_agents_[0], Constants::USER_AGENT);
    EXPECT_EQ(crawler.fingerprint_.max_depth, 5);
}

TEST_F(CrawlerTest, RoundRobinUserAgents) {
    auto cfg        = get_default_config();
    cfg.user_agents = {"a", "b", "c"};
    Crawler crawler(cfg);

    EXPECT_EQ(crawler.next_user_agent(), "a");
    EXPECT_EQ(crawler.next_user_agent(), "b");
    EXPECT_EQ(crawler.next_user_agent(), "c");
    EXPECT_EQ(crawler.next_user_agent(), "a");
}

TEST_F(CrawlerTest, CrawlsCyclicSiteToCompletion) {
    FakeSite site(cyclic_site());
    Crawler  crawler(get_default_config(), fake_factory(site));

    auto summary = crawler.run();

    EXPECT_EQ(summary.state, CrawlState::Completed);
    EXPECT_EQ(summary.visited, 3u);
    EXPECT_EQ(summary.pages_fetched, 3u);
    EXPECT_EQ(visited_keys(*crawler.coordinator()),
              (std::vector<std::string>{"http://a.test/", "http://a.test/b", "http://a.test/c"}));
    EXPECT_EQ(site.requested().size(), 3u);

    EXPECT_FALSE(fs::exists(out_ + "/crawl.snapshot"));
    ASSERT_TRUE(fs::exists(out_ + "/report.yaml"));
    YAML::Node report = YAML::LoadFile(out_ + "/report.yaml");
    EXPECT_EQ(report["summary"]["state"].as<std::string>(), "completed");
    EXPECT_EQ(report["visited"].size(), 3u);
}

TEST_F(CrawlerTest, DepthZeroFetchesOnlySeeds) {
    FakeSite site(cyclic_site());
    auto     cfg = get_default_config();
    cfg.max_depth = 0;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.state, CrawlState::Completed);
    EXPECT_EQ(site.requested(), (std::vector<std::string>{"http://a.test/"}));
}

TEST_F(CrawlerTest, FailuresAreRecorded) {
    FakeSite site({
        {"http://a.test/", {200, "<a href=\"/missing\">x</a><a href=\"http://down.test/\">y</a>"}},
        {"http://a.test/missing", {404, "not found"}},
    });
    auto cfg      = get_default_config();
    cfg.max_depth = 1;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.state, CrawlState::Completed);
    EXPECT_EQ(summary.failures, 2u);

    auto failures = crawler.coordinator()->failures();
    std::map<std::string, std::string> reasons;
    for (const auto& failure : failures)
        reasons[failure.url] = failure.reason;
    EXPECT_EQ(reasons["http://a.test/missing"], "HTTP 404");
    EXPECT_EQ(reasons["http://down.test/"], "Connection refused");
}

TEST_F(CrawlerTest, NonHtmlBodiesNotParsed) {
    FakeSite site({
        {"http://a.test/", {200, "<a href=\"/b\">b</a>", "application/json"}},
    });
    Crawler crawler(get_default_config(), fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.visited, 1u);
}

TEST_F(CrawlerTest, SearchLinksDisabled) {
    FakeSite site(cyclic_site());
    auto     cfg     = get_default_config();
    cfg.search_links = false;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.visited, 1u);
}

TEST_F(CrawlerTest, KeywordAndSavedPages) {
    FakeSite site(cyclic_site());
    auto     cfg   = get_default_config();
    cfg.keyword    = "secret";
    cfg.save_pages = true;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.keyword_hits, 1u);
    EXPECT_TRUE(fs::exists(out_ + "/pages/a.test_.html"));
    EXPECT_TRUE(fs::exists(out_ + "/pages/a.test_c.html"));

    YAML::Node report = YAML::LoadFile(out_ + "/report.yaml");
    ASSERT_EQ(report["keyword"]["matches"].size(), 1u);
    EXPECT_EQ(report["keyword"]["matches"][0].as<std::string>(), "http://a.test/c");
}

TEST_F(CrawlerTest, ExfiltrationReportsLongestChain) {
    FakeSite site({
        {"http://a.test/", {200, "<a href=\"/1\">1</a>"}},
        {"http://a.test/1", {200, "<a href=\"/2\">2</a>"}},
        {"http://a.test/2", {200, "<a href=\"/3\">3</a>"}},
        {"http://a.test/3", {200, "end"}},
    });
    auto cfg       = get_default_config();
    cfg.max_depth  = 3;
    cfg.exfiltrate = true;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.longest_path, 3);
    ASSERT_EQ(summary.longest_chain.size(), 4u);
    EXPECT_EQ(summary.longest_chain.back(), "http://a.test/3");
}

TEST_F(CrawlerTest, PauseThenResume) {
    FakeSite first_site(cyclic_site());
    auto     cfg    = get_default_config();
    cfg.connections = 1;

    {
        Crawler crawler(cfg, fake_factory(first_site));
        first_site.on_fetch = [&crawler](const std::string& url) {
            if (url == "http://a.test/b")
                crawler.stop();
        };

        auto summary = crawler.run();
        EXPECT_EQ(summary.state, CrawlState::Paused);
        EXPECT_TRUE(fs::exists(out_ + "/crawl.snapshot"));
    }

    FakeSite second_site(cyclic_site());
    cfg.resume = true;
    Crawler resumed(cfg, fake_factory(second_site));

    auto summary = resumed.run();
    EXPECT_EQ(summary.state, CrawlState::Completed);
    EXPECT_EQ(summary.pages_fetched, 3u);
    EXPECT_EQ(visited_keys(*resumed.coordinator()),
              (std::vector<std::string>{"http://a.test/", "http://a.test/b", "http://a.test/c"}));

    auto requested = second_site.requested();
    std::sort(requested.begin(), requested.end());
    EXPECT_EQ(requested, (std::vector<std::string>{"http://a.test/b", "http://a.test/c"}));
    EXPECT_FALSE(fs::exists(out_ + "/crawl.snapshot"));
}

TEST_F(CrawlerTest, PeriodicCheckpointWrittenMidCrawl) {
    FakeSite site(cyclic_site());
    auto     cfg            = get_default_config();
    cfg.threads             = 2;
    cfg.checkpoint_interval = 1;

    auto storage = std::make_shared<Strider::Storage::DiskStorage>(out_);
    Strider::Storage::SnapshotStore store(storage);
    const auto fingerprint = Fingerprint::make(cfg.seeds, cfg.max_depth, cfg.percentage);

    std::optional<Snapshot> mid_crawl;
    site.on_fetch = [&](const std::string& url) {
        if (url != "http://a.test/c")
            return;
        auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(4);
        while (!store.exists() && std::chrono::steady_clock::now() < give_up)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (store.exists())
            mid_crawl = store.load_if_resuming(fingerprint);
    };

    Crawler crawler(cfg, fake_factory(site));
    auto    summary = crawler.run();
    EXPECT_EQ(summary.state, CrawlState::Completed);

    ASSERT_TRUE(mid_crawl.has_value());
    EXPECT_FALSE(mid_crawl->visited.empty());
    EXPECT_FALSE(mid_crawl->pages.empty());
    EXPECT_EQ(mid_crawl->fingerprint.max_depth, 2);
    EXPECT_FALSE(fs::exists(out_ + "/crawl.snapshot"));
}

TEST_F(CrawlerTest, ResumeWithDifferentDepthRejected) {
    auto storage = std::make_shared<Strider::Storage::DiskStorage>(out_);
    Strider::Storage::SnapshotStore store(storage);
    Snapshot                        snapshot;
    snapshot.fingerprint = Fingerprint::make({"http://a.test/"}, 2, 100.0);
    store.checkpoint(snapshot);

    FakeSite site(cyclic_site());
    auto     cfg  = get_default_config();
    cfg.max_depth = 3;
    cfg.resume    = true;
    Crawler crawler(cfg, fake_factory(site));

    EXPECT_THROW(crawler.run(), Strider::IncompatibleSnapshot);
    EXPECT_TRUE(site.requested().empty());
    EXPECT_TRUE(fs::exists(out_ + "/crawl.snapshot"));
}

TEST_F(CrawlerTest, ResumeWithoutSnapshotStartsFresh) {
    FakeSite site(cyclic_site());
    auto     cfg = get_default_config();
    cfg.resume   = true;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.state, CrawlState::Completed);
    EXPECT_EQ(summary.visited, 3u);
}

TEST_F(CrawlerTest, RetriesFailedFetch) {
    FakeSite site(cyclic_site());
    auto     cfg    = get_default_config();
    cfg.seeds       = {"http://down.test/"};
    cfg.max_retries = 1;
    Crawler crawler(cfg, fake_factory(site));

    auto summary = crawler.run();
    EXPECT_EQ(summary.failures, 1u);
    EXPECT_EQ(site.requested().size(), 2u);
}
