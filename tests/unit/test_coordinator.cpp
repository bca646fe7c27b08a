#include <algorithm>
#include <map>
#include <gtest/gtest.h>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/coordinator/coordinator.hpp"

using namespace Strider::Engine;

namespace {

using SiteMap = std::map<std::string, std::vector<std::string>>;

FetchResult ok(std::vector<std::string> links) {
    FetchResult result;
    result.outcome = FetchOutcome::Success;
    result.status  = 200;
    result.links   = std::move(links);
    return result;
}

// Drives the coordinator the way a single worker would until nothing is left.
void crawl(Coordinator& coordinator, const SiteMap& site) {
    while (auto entry = coordinator.next()) {
        auto it = site.find(entry->url);
        coordinator.submit(*entry, ok(it == site.end() ? std::vector<std::string>{} : it->second));
    }
}

std::vector<std::string> keys(const std::vector<VisitedRecord>& records) {
    std::vector<std::string> out;
    for (const auto& record : records)
        out.push_back(record.key);
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Strider::Core::Logger::set_level(Strider::Core::LOG_NONE);
    }
    void TearDown() override {
        Strider::Core::Logger::set_level(Strider::Core::LOG_ALL);
    }

    CoordinatorOptions options(int depth, double percentage = 100.0, bool exfiltrate = false) {
        CoordinatorOptions opts;
        opts.max_depth   = depth;
        opts.percentage  = percentage;
        opts.sample_seed = 7;
        opts.exfiltrate  = exfiltrate;
        return opts;
    }
};

TEST_F(CoordinatorTest, CyclicSiteVisitsEachPageOnce) {
    SiteMap site = {
        {"http://a.test/", {"http://a.test/b", "http://a.test/c"}},
        {"http://a.test/b", {"http://a.test/", "http://a.test/c"}},
        {"http://a.test/c", {"http://a.test/b"}},
    };

    Coordinator coordinator(options(2));
    EXPECT_EQ(coordinator.seed({"http://a.test"}), 1u);
    EXPECT_EQ(coordinator.state(), CrawlState::Running);

    crawl(coordinator, site);

    EXPECT_EQ(keys(coordinator.visited()),
              (std::vector<std::string>{"http://a.test/", "http://a.test/b", "http://a.test/c"}));
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
    EXPECT_EQ(coordinator.pages().size(), 3u);
    EXPECT_TRUE(coordinator.drained());

    auto summary = coordinator.summary();
    EXPECT_EQ(summary.visited, 3u);
    EXPECT_EQ(summary.pages_fetched, 3u);
    EXPECT_EQ(summary.failures, 0u);
    EXPECT_EQ(summary.frontier_remaining, 0u);
}

TEST_F(CoordinatorTest, DuplicateSeedsClaimedOnce) {
    Coordinator coordinator(options(1));
    EXPECT_EQ(coordinator.seed({"http://a.test", "HTTP://A.TEST:80/", "http://a.test/#top"}), 1u);
    EXPECT_EQ(coordinator.summary().frontier_remaining, 1u);
}

TEST_F(CoordinatorTest, InvalidSeedSkipped) {
    Coordinator coordinator(options(1));
    EXPECT_EQ(coordinator.seed({"ftp://a.test/", "http://b.test/"}), 1u);
    EXPECT_EQ(coordinator.summary().invalid_links, 1u);
    EXPECT_TRUE(coordinator.is_visited("http://b.test/"));
}

TEST_F(CoordinatorTest, NoValidSeedsCompletesImmediately) {
    Coordinator coordinator(options(1));
    EXPECT_EQ(coordinator.seed({"not a url"}), 0u);
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
    EXPECT_TRUE(coordinator.drained());
}

TEST_F(CoordinatorTest, DepthZeroFetchesSeedsOnly) {
    Coordinator coordinator(options(0));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator, {{"http://a.test/", {"http://a.test/b"}}});

    EXPECT_EQ(coordinator.visited().size(), 1u);
    EXPECT_FALSE(coordinator.is_visited("http://a.test/b"));
    EXPECT_EQ(coordinator.pages()[0].links_found, 1u);
    EXPECT_EQ(coordinator.pages()[0].links_admitted, 0u);
}

TEST_F(CoordinatorTest, LinksBeyondMaxDepthNotClaimed) {
    SiteMap site = {
        {"http://a.test/", {"http://a.test/1"}},
        {"http://a.test/1", {"http://a.test/2"}},
        {"http://a.test/2", {"http://a.test/3"}},
    };
    Coordinator coordinator(options(2));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator, site);

    EXPECT_TRUE(coordinator.is_visited("http://a.test/2"));
    EXPECT_FALSE(coordinator.is_visited("http://a.test/3"));
    for (const auto& record : coordinator.visited())
        EXPECT_LE(record.depth, 2);
}

TEST_F(CoordinatorTest, ZeroPercentAdmitsNothing) {
    Coordinator coordinator(options(3, 0.0));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator, {{"http://a.test/", {"http://a.test/b", "http://a.test/c"}}});

    EXPECT_EQ(coordinator.visited().size(), 1u);
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
}

TEST_F(CoordinatorTest, HalfPercentSamplesFloor) {
    Coordinator coordinator(options(1, 50.0));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator,
          {{"http://a.test/",
            {"http://a.test/1", "http://a.test/2", "http://a.test/3", "http://a.test/4",
             "http://a.test/5"}}});

    EXPECT_EQ(coordinator.visited().size(), 3u);
}

TEST_F(CoordinatorTest, DrainingWhileFetchesOutstanding) {
    Coordinator coordinator(options(1));
    coordinator.seed({"http://a.test/"});

    auto entry = coordinator.next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(coordinator.state(), CrawlState::Draining);
    EXPECT_FALSE(coordinator.drained());
    EXPECT_FALSE(coordinator.next().has_value());

    coordinator.submit(*entry, ok({}));
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
}

TEST_F(CoordinatorTest, NonSuccessStatusRecordedAsFailure) {
    Coordinator coordinator(options(2));
    coordinator.seed({"http://a.test/"});

    auto entry = coordinator.next();
    ASSERT_TRUE(entry.has_value());
    FetchResult result = ok({"http://a.test/b"});
    result.status      = 404;
    coordinator.submit(*entry, result);

    auto failures = coordinator.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].url, "http://a.test/");
    EXPECT_EQ(failures[0].reason, "HTTP 404");
    EXPECT_FALSE(coordinator.is_visited("http://a.test/b"));
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
}

TEST_F(CoordinatorTest, TimeoutAndTransportErrorsRecorded) {
    Coordinator coordinator(options(1));
    coordinator.seed({"http://a.test/", "http://b.test/"});

    auto first = coordinator.next();
    auto second = coordinator.next();
    ASSERT_TRUE(first && second);

    FetchResult timeout;
    timeout.outcome = FetchOutcome::Timeout;
    coordinator.submit(*first, timeout);

    FetchResult refused;
    refused.outcome = FetchOutcome::TransportError;
    refused.error   = "Connection refused";
    coordinator.submit(*second, refused);

    auto failures = coordinator.failures();
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].reason, "timeout");
    EXPECT_EQ(failures[1].reason, "Connection refused");
    EXPECT_EQ(coordinator.summary().failures, 2u);
    EXPECT_EQ(coordinator.state(), CrawlState::Completed);
}

TEST_F(CoordinatorTest, InvalidLinksCountedAndSkipped) {
    Coordinator coordinator(options(1));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator, {{"http://a.test/", {"ftp://a.test/file", "http://a.test/ok"}}});

    EXPECT_EQ(coordinator.summary().invalid_links, 1u);
    EXPECT_TRUE(coordinator.is_visited("http://a.test/ok"));
}

TEST_F(CoordinatorTest, CancelKeepsInFlightForSnapshot) {
    Coordinator coordinator(options(2));
    coordinator.seed({"http://a.test/"});
    auto root = coordinator.next();
    coordinator.submit(*root, ok({"http://a.test/b", "http://a.test/c"}));

    auto b = coordinator.next();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->url, "http://a.test/b");

    coordinator.cancel();
    EXPECT_EQ(coordinator.state(), CrawlState::Paused);
    EXPECT_TRUE(coordinator.cancelled());
    EXPECT_FALSE(coordinator.next().has_value());

    coordinator.submit(*b, ok({"http://a.test/d"}));
    EXPECT_FALSE(coordinator.is_visited("http://a.test/d"));
    EXPECT_EQ(coordinator.in_flight(), 1u);

    auto snapshot = coordinator.snapshot(Fingerprint::make({"http://a.test/"}, 2, 100.0));
    ASSERT_EQ(snapshot.frontier.size(), 2u);
    EXPECT_EQ(snapshot.frontier[0].url, "http://a.test/b");
    EXPECT_EQ(snapshot.frontier[1].url, "http://a.test/c");
    EXPECT_EQ(snapshot.visited.size(), 3u);
}

TEST_F(CoordinatorTest, ResumeContinuesFromSnapshot) {
    Snapshot snapshot;
    {
        Coordinator first(options(2));
        first.seed({"http://a.test/"});
        auto root = first.next();
        first.submit(*root, ok({"http://a.test/b", "http://a.test/c"}));
        first.next();
        first.cancel();
        snapshot = first.snapshot(Fingerprint::make({"http://a.test/"}, 2, 100.0));
    }

    ASSERT_EQ(snapshot.pages.size(), 1u);
    EXPECT_EQ(snapshot.pages[0].url, "http://a.test/");

    Coordinator resumed(options(2), snapshot);
    resumed.seed({"http://a.test/"});
    EXPECT_EQ(resumed.summary().frontier_remaining, 2u);
    EXPECT_EQ(resumed.summary().pages_fetched, 1u);

    std::vector<std::string> fetched;
    while (auto entry = resumed.next()) {
        fetched.push_back(entry->url);
        resumed.submit(*entry, ok({"http://a.test/", "http://a.test/d"}));
    }

    EXPECT_EQ(fetched,
              (std::vector<std::string>{"http://a.test/b", "http://a.test/c", "http://a.test/d"}));
    EXPECT_EQ(resumed.visited().size(), 4u);
    EXPECT_EQ(resumed.summary().pages_fetched, 4u);
    EXPECT_EQ(resumed.state(), CrawlState::Completed);
}

TEST_F(CoordinatorTest, ExfiltrationTracksLongestChain) {
    SiteMap site = {
        {"http://s.test/", {"http://s.test/l1", "http://s.test/x"}},
        {"http://s.test/l1", {"http://s.test/l2"}},
        {"http://s.test/l2", {"http://s.test/l3"}},
    };
    Coordinator coordinator(options(3, 100.0, true));
    coordinator.seed({"http://s.test/"});
    crawl(coordinator, site);

    auto summary = coordinator.summary();
    EXPECT_EQ(summary.longest_path, 3);
    EXPECT_EQ(summary.longest_chain,
              (std::vector<std::string>{
                  "http://s.test/", "http://s.test/l1", "http://s.test/l2", "http://s.test/l3"}));
}

TEST_F(CoordinatorTest, PathsNotTrackedWithoutExfiltration) {
    Coordinator coordinator(options(2));
    coordinator.seed({"http://a.test/"});
    crawl(coordinator, {{"http://a.test/", {"http://a.test/b"}}});

    auto summary = coordinator.summary();
    EXPECT_EQ(summary.longest_path, 0);
    EXPECT_TRUE(summary.longest_chain.empty());
    EXPECT_TRUE(coordinator.snapshot(Fingerprint{}).paths.empty());
}

TEST_F(CoordinatorTest, AbortStopsHandingOutWork) {
    Coordinator coordinator(options(1));
    coordinator.seed({"http://a.test/", "http://b.test/"});
    coordinator.abort();

    EXPECT_EQ(coordinator.state(), CrawlState::Aborted);
    EXPECT_FALSE(coordinator.next().has_value());
}

TEST_F(CoordinatorTest, KeywordHitsCounted) {
    Coordinator coordinator(options(0));
    coordinator.seed({"http://a.test/", "http://b.test/"});

    auto first = coordinator.next();
    FetchResult hit = ok({});
    hit.keyword_hit = true;
    coordinator.submit(*first, hit);
    auto second = coordinator.next();
    coordinator.submit(*second, ok({}));

    EXPECT_EQ(coordinator.summary().keyword_hits, 1u);
}
